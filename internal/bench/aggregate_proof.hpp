#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>

#include "internal/engine/proof_engine.hpp"
#include "internal/model/sector.hpp"
#include "internal/util/cancellation.hpp"
#include "sealbench/v1.hpp"

namespace sealbench::bench {

struct AggregateOptions {
  model::SealContext    context;
  uint64_t              num_proofs = 128;
  std::filesystem::path cache_root;
};

/*
  Generates num_proofs window PoSt proofs over one sealed sector, then times
  a single aggregation of the batch. Proof generation and aggregate
  verification are timed separately.
*/
class AggregateProofRunner {
 public:
  explicit AggregateProofRunner(std::shared_ptr<engine::ProofEngine> engine, const util::CancellationToken* cancel = nullptr);

  sealbench::v1::AggregateProofReport Run(const AggregateOptions& options);

 private:
  std::shared_ptr<engine::ProofEngine> engine_;
  const util::CancellationToken*       cancel_;
};

} // namespace sealbench::bench
