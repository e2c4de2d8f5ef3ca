#include "aggregate_proof.hpp"

#include <utility>
#include <vector>

#include "internal/bench/report.hpp"
#include "internal/bench/runner_support.hpp"
#include "internal/cache/cache_directory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/pipeline/phase_pipeline.hpp"

namespace sealbench::bench {

using observability::DurationField;
using observability::IntField;

AggregateProofRunner::AggregateProofRunner(std::shared_ptr<engine::ProofEngine> engine, const util::CancellationToken* cancel)
    : engine_(std::move(engine)), cancel_(cancel) {
}

sealbench::v1::AggregateProofReport AggregateProofRunner::Run(const AggregateOptions& options) {
  if (options.num_proofs == 0) {
    throw util::EmptyAggregateBatch("--num_agg must be at least 1");
  }

  observability::SpanScope span("sealbench.aggregate_proof");
  const auto&              ctx = options.context;

  sealbench::v1::AggregateProofReport report;
  *report.mutable_metadata() = BuildMetadata(*engine_);
  report.set_sector_size_bytes(ctx.sector_size);
  report.set_api_version(ctx.api_version.ToString());
  report.set_num_proofs(options.num_proofs);

  auto cache = cache::CacheDirectory::Acquire({}, ctx, options.cache_root, false);

  pipeline::PhasePipeline pipeline(engine_, cancel_);
  auto                    sealed_run = pipeline.Run(ctx, *cache, {}, model::Phase::kPrecommitPhase2);
  pipeline::ThrowIfFailed(sealed_run);

  const std::vector<engine::PostSector> sectors = {{ctx.sector_id, cache->Read(model::ArtifactName(model::Phase::kPrecommitPhase2))}};

  std::vector<engine::Artifact> proofs;
  proofs.reserve(options.num_proofs);
  util::Measurement generate_total;
  for (uint64_t i = 0; i < options.num_proofs; ++i) {
    const auto randomness = Randomness("aggregate", i);
    auto generated = TimedEngineCall("generate-window-post", [&] { return engine_->GeneratePost(ctx, engine::PostKind::kWindow, randomness, sectors); });
    generate_total += generated.second;
    proofs.push_back(std::move(generated.first));
  }
  *report.mutable_generate_proofs() = ToProto(generate_total);

  auto aggregated = TimedEngineCall("aggregate-proofs", [&] { return engine_->AggregateProofs(ctx, proofs); });
  if (!aggregated.first) {
    throw util::ProofEngineFailure("aggregate-proofs returned no proof");
  }
  *report.mutable_aggregate() = ToProto(aggregated.second);
  report.set_aggregate_proof_bytes(static_cast<uint64_t>(aggregated.first->size()));

  auto verified = TimedEngineCall("verify-aggregate", [&] { return engine_->VerifyAggregate(ctx, options.num_proofs, aggregated.first); });
  RequireValid(verified.first, "aggregate proof");
  *report.mutable_verify_aggregate() = ToProto(verified.second);

  SEALBENCH_LOG_INFO("aggregate proof complete",
                     {IntField("num_proofs", static_cast<std::int64_t>(options.num_proofs)),
                      DurationField("aggregate", aggregated.second.wall.count()),
                      IntField("aggregate_bytes", static_cast<std::int64_t>(report.aggregate_proof_bytes()))});
  return report;
}

} // namespace sealbench::bench
