#pragma once

#include <atomic>
#include <filesystem>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "internal/engine/proof_engine.hpp"
#include "internal/model/phase.hpp"
#include "internal/util/arrow_utils.hpp"
#include "internal/util/uuid.hpp"

namespace sealbench::testing {

/*
  Scratch directory under the system temp directory, removed on scope exit.
*/
class TempDir {
 public:
  explicit TempDir(const std::string& test_name) {
    path_ = std::filesystem::temp_directory_path() / "sealbench_tests" / (test_name + "-" + util::ToString(util::GenerateUUID()));
    std::filesystem::create_directories(path_);
  }

  ~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }

  TempDir(const TempDir&)            = delete;
  TempDir& operator=(const TempDir&) = delete;

  const std::filesystem::path& path() const {
    return path_;
  }

  std::filesystem::path operator/(const std::string& child) const {
    return path_ / child;
  }

 private:
  std::filesystem::path path_;
};

inline std::string Text(const engine::Artifact& artifact) {
  return std::string(util::View(*artifact));
}

/*
  Deterministic in-memory engine. Each output is a tag followed by its
  inputs, so equal inputs always give equal outputs and tests can read what
  a phase consumed. Failure and verifier outcomes are switchable.
*/
class FakeProofEngine : public engine::ProofEngine {
 public:
  std::optional<model::Phase> fail_phase;
  bool                        fail_add_piece   = false;
  bool                        fail_generate    = false;
  bool                        seal_valid       = true;
  bool                        post_valid       = true;
  bool                        merkle_valid     = true;
  bool                        aggregate_valid  = true;

  std::atomic<int> add_piece_calls{0};
  std::atomic<int> phase_calls[4] = {0, 0, 0, 0};
  std::atomic<int> generate_calls{0};
  std::atomic<int> aggregate_calls{0};

  std::string Name() const override {
    return "fake";
  }

  engine::Artifact AddPiece(const model::SealContext& ctx) override {
    ++add_piece_calls;
    if (fail_add_piece) {
      throw std::runtime_error("add piece exploded");
    }
    return util::MakeBuffer("staged[" + std::to_string(ctx.sector_id) + "," + std::to_string(ctx.sector_size) + "]");
  }

  engine::Artifact PrecommitPhase1(const model::SealContext&, const engine::Artifact& staged) override {
    Enter(model::Phase::kPrecommitPhase1);
    return util::MakeBuffer("pc1(" + Text(staged) + ")");
  }

  engine::Artifact PrecommitPhase2(const model::SealContext&, const engine::Artifact& staged, const engine::Artifact& phase1) override {
    Enter(model::Phase::kPrecommitPhase2);
    return util::MakeBuffer("pc2(" + Text(staged) + "," + Text(phase1) + ")");
  }

  engine::Artifact CommitPhase1(const model::SealContext&, const engine::Artifact& phase2) override {
    Enter(model::Phase::kCommitPhase1);
    return util::MakeBuffer("c1(" + Text(phase2) + ")");
  }

  engine::Artifact CommitPhase2(const model::SealContext&, const engine::Artifact& commit1) override {
    Enter(model::Phase::kCommitPhase2);
    return util::MakeBuffer("c2(" + Text(commit1) + ")");
  }

  bool VerifySeal(const model::SealContext&, const engine::Artifact&, const engine::Artifact&) override {
    return seal_valid;
  }

  std::vector<uint64_t> WinningPostSectorChallenge(const model::SealContext&, const engine::Artifact&, uint64_t sector_count) override {
    std::vector<uint64_t> picked;
    if (sector_count > 0) {
      picked.push_back(0);
    }
    return picked;
  }

  engine::Artifact GeneratePost(const model::SealContext&, engine::PostKind kind, const engine::Artifact& randomness, const std::vector<engine::PostSector>& sectors) override {
    ++generate_calls;
    if (fail_generate) {
      throw std::runtime_error("post generation exploded");
    }
    return util::MakeBuffer(std::string(engine::PostKindName(kind)) + ":" + std::to_string(sectors.size()) + ":" + std::to_string(randomness->size()));
  }

  bool VerifyPost(const model::SealContext&, engine::PostKind, const engine::Artifact&, const std::vector<engine::PostSector>&, const engine::Artifact&) override {
    return post_valid;
  }

  class FakeTree : public engine::CommittedTree {
   public:
    explicit FakeTree(uint64_t leaves) : leaves_(leaves) {
    }

    engine::Artifact Root() const override {
      return util::MakeBuffer("root");
    }

    uint64_t LeafCount() const override {
      return leaves_;
    }

   private:
    uint64_t leaves_;
  };

  std::unique_ptr<engine::CommittedTree> BuildMerkleTree(const engine::Artifact& data) override {
    return std::make_unique<FakeTree>(static_cast<uint64_t>(data->size()) / 32);
  }

  engine::MerkleProof GenerateMerkleProof(const engine::CommittedTree&, uint64_t leaf_index) override {
    return {leaf_index, util::MakeBuffer("proof:" + std::to_string(leaf_index))};
  }

  bool VerifyMerkleProof(const engine::Artifact&, const engine::MerkleProof&) override {
    return merkle_valid;
  }

  engine::Artifact AggregateProofs(const model::SealContext&, const std::vector<engine::Artifact>& proofs) override {
    ++aggregate_calls;
    return util::MakeBuffer("aggregate:" + std::to_string(proofs.size()));
  }

  bool VerifyAggregate(const model::SealContext&, uint64_t, const engine::Artifact&) override {
    return aggregate_valid;
  }

  std::vector<std::string> Hashers() const override {
    return {"fake-hash"};
  }

  engine::Artifact Hash(std::string_view, const engine::Artifact& data) override {
    return util::MakeBuffer("h(" + Text(data) + ")");
  }

  std::optional<uint64_t> CircuitConstraints(std::string_view) const override {
    return 42;
  }

  int PhaseCalls(model::Phase phase) const {
    return phase_calls[static_cast<std::size_t>(phase)].load();
  }

 private:
  void Enter(model::Phase phase) {
    ++phase_calls[static_cast<std::size_t>(phase)];
    if (fail_phase && *fail_phase == phase) {
      throw std::runtime_error(std::string(model::PhaseName(phase)) + " exploded");
    }
  }
};

} // namespace sealbench::testing
