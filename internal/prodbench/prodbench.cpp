#include "prodbench.hpp"

#include <algorithm>
#include <atomic>
#include <exception>
#include <fstream>
#include <iterator>
#include <optional>
#include <sstream>
#include <string>
#include <system_error>
#include <thread>
#include <utility>
#include <vector>

#include "internal/bench/report.hpp"
#include "internal/bench/runner_support.hpp"
#include "internal/cache/cache_directory.hpp"
#include "internal/model/api_version.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/pipeline/phase_pipeline.hpp"
#include "internal/util/byte_size.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace sealbench::prodbench {

using observability::DurationField;
using observability::IntField;
using observability::StringField;

namespace {

using CacheList = std::vector<std::unique_ptr<cache::CacheDirectory>>;

std::string_view StageName(sealbench::v1::Stage stage) {
  switch (stage) {
    case sealbench::v1::STAGE_ADD_PIECE:
      return "add_piece";
    case sealbench::v1::STAGE_REPLICATE:
      return "replicate";
    case sealbench::v1::STAGE_SEAL_PROOF:
      return "seal_proof";
    case sealbench::v1::STAGE_POST_PROOF:
      return "post_proof";
    default:
      return "unknown";
  }
}

void AddStep(sealbench::v1::StageRecord* record, const std::string& name, const util::Measurement& time) {
  auto* step = record->add_steps();
  step->set_name(name);
  *step->mutable_time() = bench::ToProto(time);
}

void AddPhases(sealbench::v1::StageRecord* record, const pipeline::PipelineResult& result, uint32_t sector_index) {
  for (const auto& phase : result.phases) {
    *record->add_phases() = bench::ToProto(phase, sector_index);
  }
}

/*
  Runs body as one stage record. The record is appended either way; returns
  false when the stage failed and the job must stop.
*/
template <typename Fn>
bool RunStage(sealbench::v1::ProdbenchOutputs* outputs, sealbench::v1::Stage stage, Fn&& body) {
  observability::SpanScope span("sealbench.prodbench.stage");
  span.SetAttribute("stage", StageName(stage));

  auto* record = outputs->add_stages();
  record->set_stage(stage);

  util::Stopwatch watch;
  try {
    body(record);
    record->set_status(sealbench::v1::STAGE_STATUS_OK);
  } catch (const std::exception& e) {
    span.RecordException(e.what());
    record->set_status(sealbench::v1::STAGE_STATUS_FAILED);
    record->set_error_kind(std::string(util::ErrorKindName(util::KindOf(e))));
    record->set_error_message(e.what());
  }
  const auto elapsed     = watch.Elapsed();
  *record->mutable_time() = bench::ToProto(elapsed);

  const bool ok = record->status() == sealbench::v1::STAGE_STATUS_OK;
  if (ok) {
    SEALBENCH_LOG_INFO("stage complete", {StringField("stage", StageName(stage)), DurationField("wall", elapsed.wall.count())});
  } else {
    SEALBENCH_LOG_ERROR("stage failed",
                        {StringField("stage", StageName(stage)), StringField("kind", record->error_kind()),
                         StringField("error", record->error_message())});
  }
  return ok;
}

model::SealContext SectorContext(const ProdbenchJob& job, uint64_t index) {
  auto ctx      = job.context;
  ctx.sector_id = index;
  return ctx;
}

} // namespace

std::string_view StageSelectionName(StageSelection selection) {
  switch (selection) {
    case StageSelection::kAll:
      return "all";
    case StageSelection::kSealOnly:
      return "seal-only";
    case StageSelection::kPostOnly:
      return "post-only";
    case StageSelection::kReplicateOnly:
      return "replicate-only";
    case StageSelection::kAddPieceOnly:
      return "add-piece-only";
  }
  return "unknown";
}

// ------------------------------------------------------------
// Input document
// ------------------------------------------------------------

sealbench::v1::ProdbenchInputs ParseInputs(std::string_view json) {
  sealbench::v1::ProdbenchInputs inputs;
  bench::ParseJson(json, &inputs);
  return inputs;
}

sealbench::v1::ProdbenchInputs ReadInputs(const std::filesystem::path& path, std::istream& input) {
  std::string json;
  if (path.empty()) {
    json.assign(std::istreambuf_iterator<char>(input), std::istreambuf_iterator<char>());
    if (input.bad()) {
      throw util::MalformedInputDocument("failed to read prodbench inputs from standard input");
    }
  } else {
    std::ifstream file(path);
    if (!file) {
      throw util::MalformedInputDocument("cannot open prodbench inputs " + path.string());
    }
    std::ostringstream contents;
    contents << file.rdbuf();
    json = contents.str();
  }
  return ParseInputs(json);
}

StageSelection SelectStages(const sealbench::v1::ProdbenchInputs& inputs, const StageFlags& flags) {
  const bool skip_seal      = inputs.skip_seal_proof() || flags.skip_seal_proof;
  const bool skip_post      = inputs.skip_post_proof() || flags.skip_post_proof;
  const bool only_replicate = inputs.only_replicate() || flags.only_replicate;
  const bool only_add_piece = inputs.only_add_piece() || flags.only_add_piece;

  if (only_replicate && only_add_piece) {
    throw util::MalformedInputDocument("only_replicate and only_add_piece are mutually exclusive");
  }
  if (only_add_piece) {
    return StageSelection::kAddPieceOnly;
  }
  if (only_replicate || (skip_seal && skip_post)) {
    return StageSelection::kReplicateOnly;
  }
  if (skip_seal) {
    return StageSelection::kPostOnly;
  }
  if (skip_post) {
    return StageSelection::kSealOnly;
  }
  return StageSelection::kAll;
}

ProdbenchJob BuildJob(const sealbench::v1::ProdbenchInputs&                    inputs,
                      const StageFlags&                                         flags,
                      const sealbench::runtime::config::ProofParameterOverrides& runtime_overrides) {
  ProdbenchJob job;
  job.selection = SelectStages(inputs, flags);

  job.effective = inputs;
  job.effective.set_skip_seal_proof(inputs.skip_seal_proof() || flags.skip_seal_proof);
  job.effective.set_skip_post_proof(inputs.skip_post_proof() || flags.skip_post_proof);
  job.effective.set_only_replicate(inputs.only_replicate() || flags.only_replicate);
  job.effective.set_only_add_piece(inputs.only_add_piece() || flags.only_add_piece);
  if (job.effective.api_version().empty()) {
    job.effective.set_api_version(std::string(model::kDefaultApiVersion));
  }
  if (job.effective.num_sectors() == 0) {
    job.effective.set_num_sectors(1);
  }
  job.num_sectors = job.effective.num_sectors();
  if (job.num_sectors > kMaxSectors) {
    throw util::MalformedInputDocument("num_sectors " + std::to_string(job.num_sectors) + " exceeds the limit of " + std::to_string(kMaxSectors));
  }

  if (inputs.sector_size().empty()) {
    throw util::MalformedInputDocument("sector_size is required");
  }

  // Value errors are document errors here: nothing has run yet.
  try {
    const auto sector_size  = util::ParseByteSize(inputs.sector_size());
    const auto api_version  = model::ApiVersion::Parse(job.effective.api_version());
    job.context             = model::SealContext::Make(sector_size, api_version);
  } catch (const util::BenchError& e) {
    throw util::MalformedInputDocument(std::string("invalid prodbench inputs: ") + e.what());
  }

  sealbench::runtime::config::ProofParameterOverrides document_overrides;
  document_overrides.set_stacked_layers(inputs.stacked_layers());
  document_overrides.set_porep_challenges(inputs.porep_challenges());
  document_overrides.set_porep_partitions(inputs.porep_partitions());
  document_overrides.set_post_challenges(inputs.post_challenges());
  document_overrides.set_post_challenged_nodes(inputs.post_challenged_nodes());
  job.context.parameters = job.context.parameters.WithOverrides(runtime_overrides).WithOverrides(document_overrides);

  return job;
}

bool Succeeded(const sealbench::v1::ProdbenchOutputs& outputs) {
  for (const auto& stage : outputs.stages()) {
    if (stage.status() != sealbench::v1::STAGE_STATUS_OK) {
      return false;
    }
  }
  return true;
}

// ------------------------------------------------------------
// Orchestration
// ------------------------------------------------------------

ProdbenchOrchestrator::ProdbenchOrchestrator(std::shared_ptr<engine::ProofEngine> engine,
                                             std::filesystem::path                cache_root,
                                             const util::CancellationToken*       cancel)
    : engine_(std::move(engine)), cache_root_(std::move(cache_root)), cancel_(cancel) {
}

sealbench::v1::ProdbenchOutputs ProdbenchOrchestrator::Run(const ProdbenchJob& job) {
  observability::SpanScope span("sealbench.prodbench");
  span.SetAttribute("selection", StageSelectionName(job.selection));

  sealbench::v1::ProdbenchOutputs outputs;
  *outputs.mutable_metadata() = bench::BuildMetadata(*engine_);
  *outputs.mutable_inputs()   = job.effective;

  SEALBENCH_LOG_INFO("prodbench started",
                     {StringField("selection", StageSelectionName(job.selection)),
                      IntField("num_sectors", static_cast<std::int64_t>(job.num_sectors)),
                      IntField("sector_size", static_cast<std::int64_t>(job.context.sector_size))});

  const auto& ctx = job.context;
  CacheList   caches;
  for (uint64_t i = 0; i < job.num_sectors; ++i) {
    caches.push_back(cache::CacheDirectory::Acquire({}, ctx, cache_root_, false));
  }

  pipeline::PhasePipeline pipeline(engine_, cancel_);

  // ------------------------------------------------------------
  // add_piece
  // ------------------------------------------------------------
  if (job.selection != StageSelection::kReplicateOnly) {
    const bool ok = RunStage(&outputs, sealbench::v1::STAGE_ADD_PIECE, [&](sealbench::v1::StageRecord* record) {
      for (uint64_t i = 0; i < job.num_sectors; ++i) {
        if (cancel_ != nullptr && cancel_->IsCancelled()) {
          throw util::Cancelled("cancelled during add_piece");
        }
        std::optional<util::Measurement> timing;
        pipeline.StageSector(SectorContext(job, i), *caches[i], &timing);
        AddStep(record, "sector-" + std::to_string(i), timing.value_or(util::Measurement{}));
      }
    });
    if (!ok || job.selection == StageSelection::kAddPieceOnly) {
      return outputs;
    }
  }

  // ------------------------------------------------------------
  // replicate: a bounded worker pool, one cache per sector
  // ------------------------------------------------------------
  const bool replicated = RunStage(&outputs, sealbench::v1::STAGE_REPLICATE, [&](sealbench::v1::StageRecord* record) {
    std::vector<pipeline::PipelineResult> results(job.num_sectors);
    std::vector<std::exception_ptr>       errors(job.num_sectors);
    std::atomic<uint64_t>                 next{0};

    // Workers claim sectors until none are left, so any number of them
    // (including just this thread) replicates every sector.
    auto replicate = [&] {
      for (uint64_t i = next++; i < job.num_sectors; i = next++) {
        try {
          pipeline::PhasePipeline worker(engine_, cancel_);
          results[i] = worker.Run(SectorContext(job, i), *caches[i], {}, model::Phase::kPrecommitPhase2);
        } catch (...) {
          errors[i] = std::current_exception();
        }
      }
    };

    const uint64_t hardware     = std::max(1U, std::thread::hardware_concurrency());
    const uint64_t worker_count = std::min(job.num_sectors, hardware);

    std::vector<std::thread> workers;
    workers.reserve(worker_count);
    for (uint64_t w = 0; w < worker_count; ++w) {
      try {
        workers.emplace_back(replicate);
      } catch (const std::system_error& e) {
        SEALBENCH_LOG_WARN("replication worker not started",
                           {IntField("started", static_cast<std::int64_t>(workers.size())), StringField("error", e.what())});
        break;
      }
    }
    if (workers.empty()) {
      replicate();
    }
    for (auto& worker : workers) {
      worker.join();
    }

    for (uint64_t i = 0; i < job.num_sectors; ++i) {
      AddPhases(record, results[i], static_cast<uint32_t>(i));
    }
    for (uint64_t i = 0; i < job.num_sectors; ++i) {
      if (errors[i]) {
        std::rethrow_exception(errors[i]);
      }
      pipeline::ThrowIfFailed(results[i]);
    }
  });
  if (!replicated || job.selection == StageSelection::kReplicateOnly) {
    return outputs;
  }

  // ------------------------------------------------------------
  // seal_proof: commit phases over the replicated artifacts
  // ------------------------------------------------------------
  if (job.selection == StageSelection::kAll || job.selection == StageSelection::kSealOnly) {
    const bool ok = RunStage(&outputs, sealbench::v1::STAGE_SEAL_PROOF, [&](sealbench::v1::StageRecord* record) {
      model::PhaseFlags flags;
      flags.skip_precommit_phase1 = true;
      flags.skip_precommit_phase2 = true;

      for (uint64_t i = 0; i < job.num_sectors; ++i) {
        const auto sector_ctx = SectorContext(job, i);
        auto       result     = pipeline.Run(sector_ctx, *caches[i], flags);
        AddPhases(record, result, static_cast<uint32_t>(i));
        pipeline::ThrowIfFailed(result);

        auto sealed   = caches[i]->Read(model::ArtifactName(model::Phase::kPrecommitPhase2));
        auto proof    = caches[i]->Read(model::ArtifactName(model::Phase::kCommitPhase2));
        auto verified = bench::TimedEngineCall("verify-seal", [&] { return engine_->VerifySeal(sector_ctx, sealed, proof); });
        bench::RequireValid(verified.first, "seal proof of sector " + std::to_string(i));
        AddStep(record, "verify-seal-" + std::to_string(i), verified.second);
      }
    });
    if (!ok) {
      return outputs;
    }
  }

  // ------------------------------------------------------------
  // post_proof: one window PoSt over every sector
  // ------------------------------------------------------------
  if (job.selection == StageSelection::kAll || job.selection == StageSelection::kPostOnly) {
    RunStage(&outputs, sealbench::v1::STAGE_POST_PROOF, [&](sealbench::v1::StageRecord* record) {
      std::vector<engine::PostSector> sectors;
      for (uint64_t i = 0; i < job.num_sectors; ++i) {
        sectors.push_back({i, caches[i]->Read(model::ArtifactName(model::Phase::kPrecommitPhase2))});
      }
      const auto randomness = bench::Randomness("prodbench-post", job.num_sectors);

      auto generated = bench::TimedEngineCall("generate-window-post",
                                              [&] { return engine_->GeneratePost(ctx, engine::PostKind::kWindow, randomness, sectors); });
      AddStep(record, "generate-window-post", generated.second);

      auto verified = bench::TimedEngineCall(
          "verify-window-post", [&] { return engine_->VerifyPost(ctx, engine::PostKind::kWindow, randomness, sectors, generated.first); });
      bench::RequireValid(verified.first, "window post proof");
      AddStep(record, "verify-window-post", verified.second);
    });
  }

  return outputs;
}

} // namespace sealbench::prodbench
