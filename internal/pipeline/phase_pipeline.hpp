#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/cache/cache_directory.hpp"
#include "internal/engine/proof_engine.hpp"
#include "internal/model/phase.hpp"
#include "internal/model/sector.hpp"
#include "internal/util/cancellation.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/result.hpp"
#include "internal/util/time.hpp"

namespace sealbench::pipeline {

/*
  Outcome of one pipeline run. phases holds every phase that completed (or
  was satisfied from the cache) in execution order, also when status is a
  failure.
*/
struct PipelineResult {
  std::optional<util::Measurement> add_piece;
  std::vector<model::PhaseResult>  phases;
  util::Result                     status;
};

class PipelineError : public util::BenchError {
 public:
  PipelineError(util::ErrorKind kind, const std::string& msg, PipelineResult partial)
      : util::BenchError(kind, msg), partial_(std::move(partial)) {
  }

  const PipelineResult& partial() const noexcept {
    return partial_;
  }

 private:
  PipelineResult partial_;
};

// Throws PipelineError carrying the completed phases when status failed.
void ThrowIfFailed(const PipelineResult& result);

/*
  Runs the four sealing phases in order over one cache directory.

    precommit-1(staged) → precommit-2(staged, pc1) → commit-1(pc2) → commit-2(c1)

  Every output is committed to the cache before the next phase starts, so a
  later run can skip any prefix of the pipeline. Cancellation is checked
  between phases only.
*/
class PhasePipeline {
 public:
  explicit PhasePipeline(std::shared_ptr<engine::ProofEngine> engine, const util::CancellationToken* cancel = nullptr);

  PipelineResult Run(const model::SealContext& ctx,
                     cache::CacheDirectory&    cache,
                     const model::PhaseFlags&  flags,
                     model::Phase              last = model::Phase::kCommitPhase2);

  /*
    Staged sector from the cache, or produced by AddPiece and committed.
    timing is set only when AddPiece ran.
  */
  engine::Artifact StageSector(const model::SealContext& ctx, cache::CacheDirectory& cache, std::optional<util::Measurement>* timing = nullptr);

 private:
  engine::Artifact Invoke(model::Phase phase, const model::SealContext& ctx, const std::vector<engine::Artifact>& inputs);

  std::shared_ptr<engine::ProofEngine> engine_;
  const util::CancellationToken*       cancel_;
};

} // namespace sealbench::pipeline
