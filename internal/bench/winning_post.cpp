#include "winning_post.hpp"

#include <utility>

#include "internal/bench/report.hpp"
#include "internal/bench/runner_support.hpp"
#include "internal/cache/cache_directory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/pipeline/phase_pipeline.hpp"

namespace sealbench::bench {

using observability::DurationField;
using observability::IntField;

WinningPostRunner::WinningPostRunner(std::shared_ptr<engine::ProofEngine> engine, const util::CancellationToken* cancel)
    : engine_(std::move(engine)), cancel_(cancel) {
}

sealbench::v1::WinningPostReport WinningPostRunner::Run(const model::SealContext& ctx, const std::vector<engine::PostSector>& eligible) {
  observability::SpanScope span("sealbench.winning_post");

  sealbench::v1::WinningPostReport report;
  *report.mutable_metadata() = BuildMetadata(*engine_);
  report.set_sector_size_bytes(ctx.sector_size);
  report.set_api_version(ctx.api_version.ToString());

  if (eligible.empty()) {
    throw util::InvalidArgument("winning post needs at least one sealed sector");
  }

  const auto randomness = Randomness("winning-post", ctx.sector_id);

  auto challenged = TimedEngineCall("winning-post-sector-challenge",
                                    [&] { return engine_->WinningPostSectorChallenge(ctx, randomness, eligible.size()); });
  *report.mutable_sector_challenge() = ToProto(challenged.second);

  std::vector<engine::PostSector> sectors;
  for (auto index : challenged.first) {
    if (index >= eligible.size()) {
      throw util::ProofEngineFailure("sector challenge picked index " + std::to_string(index) + " of " + std::to_string(eligible.size()));
    }
    sectors.push_back(eligible[index]);
  }

  auto generated = TimedEngineCall("generate-winning-post",
                                   [&] { return engine_->GeneratePost(ctx, engine::PostKind::kWinning, randomness, sectors); });
  *report.mutable_generate_winning_post() = ToProto(generated.second);

  auto verified = TimedEngineCall(
      "verify-winning-post", [&] { return engine_->VerifyPost(ctx, engine::PostKind::kWinning, randomness, sectors, generated.first); });
  RequireValid(verified.first, "winning post proof");
  *report.mutable_verify_winning_post() = ToProto(verified.second);

  SEALBENCH_LOG_INFO("winning post complete",
                     {IntField("challenged_sectors", static_cast<std::int64_t>(sectors.size())),
                      DurationField("generate", generated.second.wall.count()),
                      DurationField("verify", verified.second.wall.count())});
  return report;
}

sealbench::v1::WinningPostReport WinningPostRunner::RunFresh(const model::SealContext& ctx, const std::filesystem::path& cache_root) {
  auto cache = cache::CacheDirectory::Acquire({}, ctx, cache_root, false);

  pipeline::PhasePipeline pipeline(engine_, cancel_);
  auto                    result = pipeline.Run(ctx, *cache, {}, model::Phase::kPrecommitPhase2);
  pipeline::ThrowIfFailed(result);

  util::Measurement replicate = result.add_piece.value_or(util::Measurement{});
  for (const auto& phase : result.phases) {
    replicate += phase.elapsed;
  }

  auto sealed = cache->Read(model::ArtifactName(model::Phase::kPrecommitPhase2));
  auto report = Run(ctx, {{ctx.sector_id, sealed}});
  *report.mutable_replicate() = ToProto(replicate);
  return report;
}

} // namespace sealbench::bench
