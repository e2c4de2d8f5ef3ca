#pragma once

#include <cstdint>
#include <memory>

#include "internal/engine/proof_engine.hpp"
#include "sealbench/v1.hpp"

namespace sealbench::bench {

struct MerkleBenchOptions {
  uint64_t data_size = 0;
  uint64_t proofs    = 1024;
  bool     validate  = true;
};

// Odd, so i -> i * stride is a bijection modulo any power of two.
inline constexpr uint64_t kMerkleIndexStride = 0x9E3779B97F4A7C15ULL;
inline constexpr uint64_t kMerkleDataSeed    = 0x5EA1BE7C;

// Leaf opened by the i-th of proof_count proofs.
inline uint64_t MerkleLeafIndex(uint64_t i, uint64_t proof_count, uint64_t leaves) {
  return (i * kMerkleIndexStride + proof_count) % leaves;
}

/*
  Builds one tree over pseudo-random data and times N opening proofs, and
  optionally their verification. The first proof that fails to verify
  aborts with ProofValidationFailed carrying its index.
*/
class MerkleProofRunner {
 public:
  explicit MerkleProofRunner(std::shared_ptr<engine::ProofEngine> engine);

  sealbench::v1::MerkleProofReport Run(const MerkleBenchOptions& options);

 private:
  std::shared_ptr<engine::ProofEngine> engine_;
};

} // namespace sealbench::bench
