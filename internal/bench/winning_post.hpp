#pragma once

#include <filesystem>
#include <memory>
#include <vector>

#include "internal/engine/proof_engine.hpp"
#include "internal/model/sector.hpp"
#include "internal/util/cancellation.hpp"
#include "sealbench/v1.hpp"

namespace sealbench::bench {

class WinningPostRunner {
 public:
  explicit WinningPostRunner(std::shared_ptr<engine::ProofEngine> engine, const util::CancellationToken* cancel = nullptr);

  /*
    Challenge selection, proof generation and verification over already
    sealed sectors, each timed on its own.
  */
  sealbench::v1::WinningPostReport Run(const model::SealContext& ctx, const std::vector<engine::PostSector>& eligible);

  /*
    Replicates a fresh sector in a throwaway cache under cache_root and runs
    the benchmark over it. Replication time is reported separately.
  */
  sealbench::v1::WinningPostReport RunFresh(const model::SealContext& ctx, const std::filesystem::path& cache_root);

 private:
  std::shared_ptr<engine::ProofEngine> engine_;
  const util::CancellationToken*       cancel_;
};

} // namespace sealbench::bench
