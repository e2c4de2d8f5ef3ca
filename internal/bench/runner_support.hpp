#pragma once

#include <cstdint>
#include <exception>
#include <string>
#include <string_view>
#include <utility>

#include "internal/engine/proof_engine.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace sealbench::bench {

/*
  Times one engine call. Anything the engine throws becomes
  ProofEngineFailure naming the step.
*/
template <typename Fn>
auto TimedEngineCall(std::string_view step, Fn&& fn) {
  try {
    return util::Measure(std::forward<Fn>(fn));
  } catch (const std::exception& e) {
    throw util::ProofEngineFailure(std::string(step) + " failed: " + e.what());
  }
}

// A verifier that ran and said no.
inline void RequireValid(bool valid, std::string_view what) {
  if (!valid) {
    throw util::ProofValidationFailed(std::string(what) + " did not verify");
  }
}

// Deterministic 32-byte challenge randomness for a benchmark step.
engine::Artifact Randomness(std::string_view domain, uint64_t nonce);

} // namespace sealbench::bench
