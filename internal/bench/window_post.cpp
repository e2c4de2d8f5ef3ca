#include "window_post.hpp"

#include <utility>

#include "internal/bench/report.hpp"
#include "internal/bench/runner_support.hpp"
#include "internal/cache/cache_directory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/pipeline/phase_pipeline.hpp"
#include "internal/pipeline/resume_controller.hpp"

namespace sealbench::bench {

using observability::DurationField;
using observability::StringField;

namespace {

void LogCompletedPhases(const pipeline::PipelineResult& result) {
  for (const auto& phase : result.phases) {
    SEALBENCH_LOG_WARN("completed before failure",
                       {StringField("phase", model::PhaseName(phase.phase)),
                        DurationField("wall", phase.elapsed.wall.count()),
                        DurationField("cpu", phase.elapsed.cpu.count())});
  }
}

} // namespace

WindowPostRunner::WindowPostRunner(std::shared_ptr<engine::ProofEngine> engine, const util::CancellationToken* cancel)
    : engine_(std::move(engine)), cancel_(cancel) {
}

sealbench::v1::WindowPostReport WindowPostRunner::Run(const WindowPostOptions& options) {
  observability::SpanScope span("sealbench.window_post");
  const auto&              ctx = options.context;

  sealbench::v1::WindowPostReport report;
  *report.mutable_metadata() = BuildMetadata(*engine_);
  report.set_sector_size_bytes(ctx.sector_size);
  report.set_api_version(ctx.api_version.ToString());

  std::unique_ptr<cache::CacheDirectory> cache;
  pipeline::PipelineResult               result;

  if (options.test_resume) {
    if (options.flags.Any()) {
      throw util::InvalidArgument("--test-resume derives skip flags itself and cannot be combined with --skip-* flags");
    }
    pipeline::ResumeOptions resume_options;
    resume_options.preserve_cache = options.preserve_cache;
    resume_options.cache_root     = options.cache_root;

    pipeline::ResumeController controller(engine_, cancel_);
    pipeline::ResumeOutcome    outcome;
    try {
      outcome = controller.Run(ctx, options.cache_path, resume_options);
    } catch (const pipeline::PipelineError& e) {
      LogCompletedPhases(e.partial());
      throw;
    }
    // The baseline did the staging; the resumed run finds it in the cache.
    result           = std::move(outcome.resumed);
    result.add_piece = outcome.baseline.add_piece;
    cache            = std::move(outcome.cache);
    report.set_resume_tested(true);
  } else {
    cache = cache::CacheDirectory::Acquire(options.cache_path, ctx, options.cache_root, options.preserve_cache);

    pipeline::PhasePipeline pipeline(engine_, cancel_);
    result = pipeline.Run(ctx, *cache, options.flags);
    if (!result.status) {
      LogCompletedPhases(result);
      pipeline::ThrowIfFailed(result);
    }
  }

  if (result.add_piece) {
    *report.mutable_add_piece() = ToProto(*result.add_piece);
  }
  for (const auto& phase : result.phases) {
    *report.add_phases() = ToProto(phase);
  }
  report.set_cache_path(cache->Path().string());
  report.set_cache_preserved(options.preserve_cache);

  auto sealed     = cache->Read(model::ArtifactName(model::Phase::kPrecommitPhase2));
  auto seal_proof = cache->Read(model::ArtifactName(model::Phase::kCommitPhase2));

  auto [seal_valid, verify_seal] = TimedEngineCall("verify-seal", [&] { return engine_->VerifySeal(ctx, sealed, seal_proof); });
  RequireValid(seal_valid, "seal proof");
  *report.mutable_verify_seal() = ToProto(verify_seal);

  const auto                            randomness = Randomness("window-post", ctx.sector_id);
  const std::vector<engine::PostSector> sectors    = {{ctx.sector_id, sealed}};

  auto generated =
      TimedEngineCall("generate-window-post", [&] { return engine_->GeneratePost(ctx, engine::PostKind::kWindow, randomness, sectors); });
  const auto& proof    = generated.first;
  const auto& generate = generated.second;
  *report.mutable_generate_window_post() = ToProto(generate);

  auto [post_valid, verify] =
      TimedEngineCall("verify-window-post", [&] { return engine_->VerifyPost(ctx, engine::PostKind::kWindow, randomness, sectors, proof); });
  RequireValid(post_valid, "window post proof");
  *report.mutable_verify_window_post() = ToProto(verify);

  SEALBENCH_LOG_INFO("window post complete",
                     {DurationField("generate", generate.wall.count()), DurationField("verify", verify.wall.count()),
                      StringField("cache", cache->Path().string())});
  return report;
}

} // namespace sealbench::bench
