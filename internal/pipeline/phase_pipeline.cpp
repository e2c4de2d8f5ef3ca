#include "phase_pipeline.hpp"

#include <array>
#include <chrono>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

namespace sealbench::pipeline {

namespace {

using observability::BoolField;
using observability::DurationField;
using observability::IntField;
using observability::StringField;

std::size_t Index(model::Phase phase) {
  return static_cast<std::size_t>(phase);
}

double Millis(std::chrono::nanoseconds value) {
  return std::chrono::duration<double, std::milli>(value).count();
}

void LogPhase(const model::SealContext& ctx, const model::PhaseResult& result) {
  SEALBENCH_LOG_INFO("phase complete",
                     {StringField("phase", model::PhaseName(result.phase)),
                      IntField("sector_id", static_cast<std::int64_t>(ctx.sector_id)),
                      BoolField("skipped", result.skipped),
                      DurationField("wall", result.elapsed.wall.count()),
                      DurationField("cpu", result.elapsed.cpu.count()),
                      IntField("artifact_bytes", static_cast<std::int64_t>(result.artifact.size_bytes))});
}

} // namespace

void ThrowIfFailed(const PipelineResult& result) {
  if (!result.status) {
    throw PipelineError(result.status.code, result.status.message, result);
  }
}

PhasePipeline::PhasePipeline(std::shared_ptr<engine::ProofEngine> engine, const util::CancellationToken* cancel)
    : engine_(std::move(engine)), cancel_(cancel) {
  if (!engine_) {
    throw util::InvalidArgument("phase pipeline requires a proof engine");
  }
}

engine::Artifact PhasePipeline::StageSector(const model::SealContext& ctx, cache::CacheDirectory& cache, std::optional<util::Measurement>* timing) {
  if (cache.HasArtifact(model::kStagedSectorArtifact)) {
    return cache.Read(model::kStagedSectorArtifact);
  }

  observability::SpanScope span("sealbench.add_piece");
  util::Stopwatch          watch;
  engine::Artifact         staged;
  try {
    staged = engine_->AddPiece(ctx);
  } catch (const std::exception& e) {
    span.RecordException(e.what());
    throw util::ProofEngineFailure("add-piece failed: " + std::string(e.what()));
  }
  const auto elapsed = watch.Elapsed();

  cache.Commit(model::kStagedSectorArtifact, staged);
  if (timing != nullptr) {
    *timing = elapsed;
  }

  SEALBENCH_LOG_INFO("add-piece complete",
                     {IntField("sector_id", static_cast<std::int64_t>(ctx.sector_id)),
                      DurationField("wall", elapsed.wall.count()),
                      DurationField("cpu", elapsed.cpu.count())});
  return staged;
}

engine::Artifact PhasePipeline::Invoke(model::Phase phase, const model::SealContext& ctx, const std::vector<engine::Artifact>& inputs) {
  try {
    switch (phase) {
      case model::Phase::kPrecommitPhase1:
        return engine_->PrecommitPhase1(ctx, inputs.at(0));
      case model::Phase::kPrecommitPhase2:
        return engine_->PrecommitPhase2(ctx, inputs.at(0), inputs.at(1));
      case model::Phase::kCommitPhase1:
        return engine_->CommitPhase1(ctx, inputs.at(0));
      case model::Phase::kCommitPhase2:
        return engine_->CommitPhase2(ctx, inputs.at(0));
    }
  } catch (const std::exception& e) {
    throw util::ProofEngineFailure(std::string(model::PhaseName(phase)) + " failed: " + e.what());
  }
  throw util::InvalidArgument("unknown phase");
}

PipelineResult PhasePipeline::Run(const model::SealContext& ctx, cache::CacheDirectory& cache, const model::PhaseFlags& flags, model::Phase last) {
  PipelineResult                  result;
  std::array<engine::Artifact, 4> outputs;
  engine::Artifact                staged;

  auto load_staged = [&]() {
    if (!staged) {
      staged = StageSector(ctx, cache, &result.add_piece);
    }
    return staged;
  };

  // This run's output first, then whatever an earlier run left in the cache.
  auto load_output = [&](model::Phase producer, model::Phase consumer) {
    if (outputs[Index(producer)]) {
      return outputs[Index(producer)];
    }
    if (!cache.HasArtifact(model::ArtifactName(producer))) {
      throw util::MissingPrerequisite(std::string(model::PhaseName(consumer)) + " needs the " + std::string(model::ArtifactName(producer)) +
                                      " artifact, which is not in cache " + cache.Path().string());
    }
    return cache.Read(model::ArtifactName(producer));
  };

  for (auto phase : model::kPhases) {
    if (phase > last) {
      break;
    }

    const auto name = model::PhaseName(phase);
    if (cancel_ != nullptr && cancel_->IsCancelled()) {
      result.status = util::Result::Err(util::ErrorKind::kCancelled, "cancelled before " + std::string(name));
      SEALBENCH_LOG_WARN("pipeline cancelled", {StringField("next_phase", name)});
      break;
    }

    observability::SpanScope span("sealbench.phase");
    span.SetAttribute("phase", name);
    span.SetAttribute("sector_id", static_cast<std::int64_t>(ctx.sector_id));

    try {
      model::PhaseResult phase_result;
      phase_result.phase = phase;

      if (flags.Skips(phase)) {
        if (!cache.HasArtifact(model::ArtifactName(phase))) {
          throw util::MissingPrerequisite("cannot skip " + std::string(name) + ": its artifact is not in cache " + cache.Path().string());
        }
        phase_result.skipped  = true;
        phase_result.artifact = cache.Describe(model::ArtifactName(phase));
        span.AddEvent("skipped");
      } else {
        std::vector<engine::Artifact> inputs;
        switch (phase) {
          case model::Phase::kPrecommitPhase1:
            inputs.push_back(load_staged());
            break;
          case model::Phase::kPrecommitPhase2:
            inputs.push_back(load_staged());
            inputs.push_back(load_output(model::Phase::kPrecommitPhase1, phase));
            break;
          case model::Phase::kCommitPhase1:
            inputs.push_back(load_output(model::Phase::kPrecommitPhase2, phase));
            break;
          case model::Phase::kCommitPhase2:
            inputs.push_back(load_output(model::Phase::kCommitPhase1, phase));
            break;
        }

        util::Stopwatch watch;
        auto            output = Invoke(phase, ctx, inputs);
        phase_result.elapsed   = watch.Elapsed();
        phase_result.artifact  = cache.Commit(model::ArtifactName(phase), output);
        outputs[Index(phase)]  = std::move(output);

        observability::Metrics::Instance().ObservePhaseDurationMs(name, Millis(phase_result.elapsed.wall));
      }

      LogPhase(ctx, phase_result);
      result.phases.push_back(std::move(phase_result));
    } catch (const std::exception& e) {
      span.RecordException(e.what());
      result.status = util::Result::Err(util::KindOf(e), e.what());
      SEALBENCH_LOG_ERROR("phase failed",
                          {StringField("phase", name),
                           StringField("kind", util::ErrorKindName(util::KindOf(e))),
                           StringField("error", e.what()),
                           IntField("completed_phases", static_cast<std::int64_t>(result.phases.size()))});
      break;
    }
  }

  return result;
}

} // namespace sealbench::pipeline
