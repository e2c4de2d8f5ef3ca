#include "phase.hpp"

namespace sealbench::model {

std::string_view PhaseName(Phase phase) {
  switch (phase) {
    case Phase::kPrecommitPhase1:
      return "precommit-phase1";
    case Phase::kPrecommitPhase2:
      return "precommit-phase2";
    case Phase::kCommitPhase1:
      return "commit-phase1";
    case Phase::kCommitPhase2:
      return "commit-phase2";
  }
  return "unknown";
}

std::string_view ArtifactName(Phase phase) {
  // Artifacts are named after the phase that produced them.
  return PhaseName(phase);
}

bool PhaseFlags::Skips(Phase phase) const {
  switch (phase) {
    case Phase::kPrecommitPhase1:
      return skip_precommit_phase1;
    case Phase::kPrecommitPhase2:
      return skip_precommit_phase2;
    case Phase::kCommitPhase1:
      return skip_commit_phase1;
    case Phase::kCommitPhase2:
      return skip_commit_phase2;
  }
  return false;
}

void PhaseFlags::SetSkip(Phase phase, bool skip) {
  switch (phase) {
    case Phase::kPrecommitPhase1:
      skip_precommit_phase1 = skip;
      break;
    case Phase::kPrecommitPhase2:
      skip_precommit_phase2 = skip;
      break;
    case Phase::kCommitPhase1:
      skip_commit_phase1 = skip;
      break;
    case Phase::kCommitPhase2:
      skip_commit_phase2 = skip;
      break;
  }
}

bool PhaseFlags::Any() const {
  return skip_precommit_phase1 || skip_precommit_phase2 || skip_commit_phase1 || skip_commit_phase2;
}

} // namespace sealbench::model
