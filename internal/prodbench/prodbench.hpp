#pragma once

#include <cstdint>
#include <filesystem>
#include <istream>
#include <memory>
#include <string_view>

#include "config/config.pb.h"
#include "internal/engine/proof_engine.hpp"
#include "internal/model/sector.hpp"
#include "internal/util/cancellation.hpp"
#include "sealbench/v1.hpp"

namespace sealbench::prodbench {

// Upper bound on num_sectors; each sector holds its own cache directory.
inline constexpr uint64_t kMaxSectors = 256;

enum class StageSelection {
  kAll,
  kSealOnly,      // skip_post_proof
  kPostOnly,      // skip_seal_proof
  kReplicateOnly, // only_replicate, or both skips
  kAddPieceOnly,  // only_add_piece
};

std::string_view StageSelectionName(StageSelection selection);

// Stage switches given on the command line; OR-ed with the document's.
struct StageFlags {
  bool skip_seal_proof = false;
  bool skip_post_proof = false;
  bool only_replicate  = false;
  bool only_add_piece  = false;
};

/*
  Validated job derived from ProdbenchInputs. Building one is the only
  place input errors surface, so no stage starts on a bad document.
*/
struct ProdbenchJob {
  model::SealContext              context;
  uint64_t                        num_sectors = 1;
  StageSelection                  selection   = StageSelection::kAll;
  sealbench::v1::ProdbenchInputs effective;
};

// Strict JSON parse. Throws MalformedInputDocument.
sealbench::v1::ProdbenchInputs ParseInputs(std::string_view json);

// From path, or from input when path is empty. Throws MalformedInputDocument.
sealbench::v1::ProdbenchInputs ReadInputs(const std::filesystem::path& path, std::istream& input);

StageSelection SelectStages(const sealbench::v1::ProdbenchInputs& inputs, const StageFlags& flags);

/*
  Proof parameters: sector-size defaults, then runtime config overrides,
  then the document's overrides.
*/
ProdbenchJob BuildJob(const sealbench::v1::ProdbenchInputs&                   inputs,
                      const StageFlags&                                        flags,
                      const sealbench::runtime::config::ProofParameterOverrides& runtime_overrides = {});

bool Succeeded(const sealbench::v1::ProdbenchOutputs& outputs);

/*
  Runs the selected stages over num_sectors sectors, one private cache
  directory each:

    add_piece → replicate (sectors in parallel) → seal_proof → post_proof

  A failing stage is recorded as FAILED and ends the job; the outputs
  document is returned either way.
*/
class ProdbenchOrchestrator {
 public:
  ProdbenchOrchestrator(std::shared_ptr<engine::ProofEngine> engine, std::filesystem::path cache_root, const util::CancellationToken* cancel = nullptr);

  sealbench::v1::ProdbenchOutputs Run(const ProdbenchJob& job);

 private:
  std::shared_ptr<engine::ProofEngine> engine_;
  std::filesystem::path                cache_root_;
  const util::CancellationToken*       cancel_;
};

} // namespace sealbench::prodbench
