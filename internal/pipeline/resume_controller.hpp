#pragma once

#include <filesystem>
#include <memory>
#include <string>

#include "internal/cache/cache_directory.hpp"
#include "internal/pipeline/phase_pipeline.hpp"

namespace sealbench::pipeline {

struct ResumeOptions {
  // Artifacts of every phase after this one are discarded before resuming.
  model::Phase          interrupt_after = model::Phase::kPrecommitPhase2;
  bool                  preserve_cache  = false;
  std::filesystem::path cache_root;
};

struct ResumeOutcome {
  PipelineResult    baseline;
  PipelineResult    resumed;
  model::PhaseFlags resumed_flags;
  std::string       final_digest;

  // Cache of the resumed run; releasing it honors ResumeOptions::preserve_cache.
  std::unique_ptr<cache::CacheDirectory> cache;
};

/*
  Checks that an interrupted and resumed pipeline yields the same final
  artifact as an uninterrupted one.

    1. baseline run over a preserved cache
    2. discard artifacts after the interruption point, release, drop state
    3. re-acquire the same directory, skip every phase with an artifact
    4. compare SHA-256 of both commit-phase2 artifacts

  A mismatch throws ResumeMismatch and leaves the directory on disk.
*/
class ResumeController {
 public:
  explicit ResumeController(std::shared_ptr<engine::ProofEngine> engine, const util::CancellationToken* cancel = nullptr);

  ResumeOutcome Run(const model::SealContext& ctx, const std::filesystem::path& cache_path, const ResumeOptions& options);

  static model::PhaseFlags FlagsFromCache(const cache::CacheDirectory& cache);

 private:
  std::shared_ptr<engine::ProofEngine> engine_;
  const util::CancellationToken*       cancel_;
};

} // namespace sealbench::pipeline
