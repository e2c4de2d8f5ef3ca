#include "resume_controller.hpp"

#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

namespace sealbench::pipeline {

namespace {

// Copy of the baseline result kept beside the resumed one for comparison.
constexpr std::string_view kBaselineArtifact = "commit-phase2.baseline";

} // namespace

ResumeController::ResumeController(std::shared_ptr<engine::ProofEngine> engine, const util::CancellationToken* cancel)
    : engine_(std::move(engine)), cancel_(cancel) {
}

model::PhaseFlags ResumeController::FlagsFromCache(const cache::CacheDirectory& cache) {
  model::PhaseFlags flags;
  for (auto phase : model::kPhases) {
    flags.SetSkip(phase, cache.HasArtifact(model::ArtifactName(phase)));
  }
  return flags;
}

ResumeOutcome ResumeController::Run(const model::SealContext& ctx, const std::filesystem::path& cache_path, const ResumeOptions& options) {
  observability::SpanScope span("sealbench.resume_test");
  PhasePipeline            pipeline(engine_, cancel_);
  ResumeOutcome            outcome;
  const auto               final_name = model::ArtifactName(model::Phase::kCommitPhase2);

  // ------------------------------------------------------------
  // Baseline
  // ------------------------------------------------------------
  auto cache = cache::CacheDirectory::Acquire(cache_path, ctx, options.cache_root, options.preserve_cache);
  const auto path = cache->Path();

  outcome.baseline = pipeline.Run(ctx, *cache, {});
  ThrowIfFailed(outcome.baseline);
  const auto baseline = cache->Commit(kBaselineArtifact, cache->Read(final_name));

  // ------------------------------------------------------------
  // Interruption
  // ------------------------------------------------------------
  for (auto phase : model::kPhases) {
    if (phase > options.interrupt_after) {
      cache->Discard(model::ArtifactName(phase));
    }
  }
  cache->Release(true);
  cache.reset();

  SEALBENCH_LOG_INFO("simulated interruption",
                     {observability::StringField("after_phase", model::PhaseName(options.interrupt_after)),
                      observability::StringField("cache", path.string())});

  // ------------------------------------------------------------
  // Resume
  // ------------------------------------------------------------
  cache                 = cache::CacheDirectory::Acquire(path, ctx, options.cache_root, options.preserve_cache);
  outcome.resumed_flags = FlagsFromCache(*cache);
  outcome.resumed       = pipeline.Run(ctx, *cache, outcome.resumed_flags);
  ThrowIfFailed(outcome.resumed);

  const auto resumed = cache->Describe(final_name);
  if (resumed.digest != baseline.digest) {
    cache->Release(true);
    span.RecordException("resume mismatch");
    throw util::ResumeMismatch("resumed run produced a different " + std::string(final_name) + " artifact (baseline " + baseline.digest +
                                   ", resumed " + resumed.digest + ")",
                               baseline.path.string() + " sha256=" + baseline.digest,
                               resumed.path.string() + " sha256=" + resumed.digest);
  }

  cache->Discard(kBaselineArtifact);
  SEALBENCH_LOG_INFO("resume verified", {observability::StringField("digest", resumed.digest)});

  outcome.final_digest = resumed.digest;
  outcome.cache        = std::move(cache);
  return outcome;
}

} // namespace sealbench::pipeline
