#pragma once

#include <array>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

#include "internal/util/time.hpp"

namespace sealbench::model {

enum class Phase : std::uint8_t {
  kPrecommitPhase1 = 0,
  kPrecommitPhase2 = 1,
  kCommitPhase1    = 2,
  kCommitPhase2    = 3,
};

inline constexpr std::array<Phase, 4> kPhases = {Phase::kPrecommitPhase1, Phase::kPrecommitPhase2, Phase::kCommitPhase1, Phase::kCommitPhase2};

// Unsealed sector data produced by add-piece, input of precommit phase 1.
inline constexpr std::string_view kStagedSectorArtifact = "staged-sector";

std::string_view PhaseName(Phase phase);

// Cache artifact holding the output of phase.
std::string_view ArtifactName(Phase phase);

/*
  Independent skip switches for the four sealing phases. A skipped phase is
  satisfied from the artifact already in the cache.
*/
struct PhaseFlags {
  bool skip_precommit_phase1 = false;
  bool skip_precommit_phase2 = false;
  bool skip_commit_phase1    = false;
  bool skip_commit_phase2    = false;

  bool Skips(Phase phase) const;
  void SetSkip(Phase phase, bool skip);
  bool Any() const;
};

/*
  Reference to a committed cache artifact. digest is the hex SHA-256 of the
  file contents and is what resume validation compares.
*/
struct ArtifactRef {
  std::string           name;
  std::filesystem::path path;
  uint64_t              size_bytes = 0;
  std::string           digest;
};

struct PhaseResult {
  Phase             phase = Phase::kPrecommitPhase1;
  bool              skipped = false;
  util::Measurement elapsed;
  ArtifactRef       artifact;
};

} // namespace sealbench::model
