#include "commands.hpp"

#include <chrono>
#include <exception>
#include <utility>

#include "internal/bench/aggregate_proof.hpp"
#include "internal/bench/hash_constraints.hpp"
#include "internal/bench/merkle_proofs.hpp"
#include "internal/bench/report.hpp"
#include "internal/bench/window_post.hpp"
#include "internal/bench/winning_post.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/prodbench/prodbench.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace sealbench::cli {

namespace {

using observability::BoolField;
using observability::DurationField;
using observability::StringField;

CommandResult RunCommand(const CommandLine&                               line,
                         const sealbench::runtime::config::RuntimeConfig& config,
                         const std::shared_ptr<engine::ProofEngine>&      engine,
                         const util::CancellationToken*                   cancel,
                         std::istream&                                    input) {
  switch (line.command) {
    case Command::kWindowPost: {
      bench::WindowPostOptions options;
      options.context        = MakeContext(line, config);
      options.cache_path     = line.cache;
      options.cache_root     = CacheRoot(config);
      options.preserve_cache = line.preserve_cache;
      options.flags          = line.flags;
      options.test_resume    = line.test_resume;
      return {bench::ToJson(bench::WindowPostRunner(engine, cancel).Run(options)), true};
    }

    case Command::kWinningPost: {
      bench::WinningPostRunner runner(engine, cancel);
      return {bench::ToJson(runner.RunFresh(MakeContext(line, config), CacheRoot(config))), true};
    }

    case Command::kHashConstraints:
      return {bench::ToJson(bench::HashConstraintsRunner(engine).Run()), true};

    case Command::kMerkleProofs: {
      bench::MerkleBenchOptions options;
      options.data_size = line.size;
      options.proofs    = line.proofs;
      options.validate  = line.validate;
      return {bench::ToJson(bench::MerkleProofRunner(engine).Run(options)), true};
    }

    case Command::kAggregateProof: {
      bench::AggregateOptions options;
      options.num_proofs = line.num_agg;
      if (options.num_proofs == 0) {
        // Rejected before the sector size is even looked at.
        throw util::EmptyAggregateBatch("aggregate-proof needs at least one proof (--num_agg 0)");
      }
      options.context    = MakeContext(line, config);
      options.cache_root = CacheRoot(config);
      return {bench::ToJson(bench::AggregateProofRunner(engine, cancel).Run(options)), true};
    }

    case Command::kProdbench: {
      auto inputs = prodbench::ReadInputs(line.prodbench_config, input);
      auto job    = prodbench::BuildJob(inputs, line.stage_flags, config.engine().parameters());

      prodbench::ProdbenchOrchestrator orchestrator(engine, CacheRoot(config), cancel);
      auto                             outputs = orchestrator.Run(job);
      return {bench::ToJson(outputs), prodbench::Succeeded(outputs)};
    }

    case Command::kHelp:
      break;
  }
  throw util::InvalidArgument("no benchmark subcommand selected");
}

} // namespace

std::filesystem::path CacheRoot(const sealbench::runtime::config::RuntimeConfig& config) {
  if (!config.cache().root_path().empty()) {
    return config.cache().root_path();
  }
  return std::filesystem::temp_directory_path();
}

model::SealContext MakeContext(const CommandLine& line, const sealbench::runtime::config::RuntimeConfig& config) {
  auto ctx       = model::SealContext::Make(line.size, line.api_version);
  ctx.parameters = ctx.parameters.WithOverrides(config.engine().parameters());
  return ctx;
}

CommandResult Dispatch(const CommandLine&                               line,
                       const sealbench::runtime::config::RuntimeConfig& config,
                       std::shared_ptr<engine::ProofEngine>             engine,
                       const util::CancellationToken*                   cancel,
                       std::istream&                                    input) {
  if (!engine) {
    throw util::InvalidArgument("no proof engine configured");
  }

  const auto name = CommandName(line.command);

  observability::SpanScope span("sealbench.command");
  span.SetAttribute("command", name);
  span.SetAttribute("engine", engine->Name());

  auto&           metrics = observability::Metrics::Instance();
  util::Stopwatch watch;
  try {
    auto result  = RunCommand(line, config, engine, cancel, input);
    auto elapsed = watch.Elapsed();

    metrics.RecordBenchmarkRun(name, result.success);
    metrics.ObserveBenchmarkDurationMs(name, std::chrono::duration<double, std::milli>(elapsed.wall).count());
    SEALBENCH_LOG_INFO("benchmark finished",
                       {StringField("command", name), BoolField("success", result.success), DurationField("wall", elapsed.wall.count())});
    return result;
  } catch (const std::exception& e) {
    span.RecordException(e.what());
    metrics.RecordBenchmarkRun(name, false);
    throw;
  }
}

} // namespace sealbench::cli
