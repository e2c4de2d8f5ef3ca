#pragma once

#include <cstdint>
#include <memory>

#include "internal/engine/proof_engine.hpp"
#include "sealbench/v1.hpp"

namespace sealbench::bench {

struct HashBenchOptions {
  uint64_t iterations  = 1000;
  // One 2-to-1 tree compression.
  uint64_t input_bytes = 64;
};

/*
  For every hasher the engine offers: its circuit constraint count, when
  the engine has a circuit for it, and the native cost of hashing.
*/
class HashConstraintsRunner {
 public:
  explicit HashConstraintsRunner(std::shared_ptr<engine::ProofEngine> engine);

  sealbench::v1::HashConstraintsReport Run(const HashBenchOptions& options = {});

 private:
  std::shared_ptr<engine::ProofEngine> engine_;
};

} // namespace sealbench::bench
