#pragma once

#include "internal/engine/proof_engine.hpp"

namespace sealbench::engine {

/*
  Deterministic digest-based engine.

  Mirrors the shape of a stacked-DRG sealing pipeline with SHA-256 Merkle
  trees: layered labels, a replica committed by comm_r = H(comm_c || root_r),
  inclusion proofs for challenges. Same inputs always give byte-identical
  artifacts, which is what resume and skip tests rely on. It carries no
  soundness guarantee and is meant for small sector sizes.

  Stateless; safe to share between threads.
*/
class ReferenceEngine final : public ProofEngine {
 public:
  static constexpr const char* kName = "reference";

  std::string Name() const override {
    return kName;
  }

  Artifact AddPiece(const model::SealContext& ctx) override;
  Artifact PrecommitPhase1(const model::SealContext& ctx, const Artifact& staged) override;
  Artifact PrecommitPhase2(const model::SealContext& ctx, const Artifact& staged, const Artifact& phase1) override;
  Artifact CommitPhase1(const model::SealContext& ctx, const Artifact& phase2) override;
  Artifact CommitPhase2(const model::SealContext& ctx, const Artifact& commit1) override;
  bool     VerifySeal(const model::SealContext& ctx, const Artifact& phase2, const Artifact& seal_proof) override;

  std::vector<uint64_t> WinningPostSectorChallenge(const model::SealContext& ctx, const Artifact& randomness, uint64_t sector_count) override;
  Artifact GeneratePost(const model::SealContext& ctx, PostKind kind, const Artifact& randomness, const std::vector<PostSector>& sectors) override;
  bool     VerifyPost(const model::SealContext&      ctx,
                      PostKind                       kind,
                      const Artifact&                randomness,
                      const std::vector<PostSector>& sectors,
                      const Artifact&                proof) override;

  std::unique_ptr<CommittedTree> BuildMerkleTree(const Artifact& data) override;
  MerkleProof                    GenerateMerkleProof(const CommittedTree& tree, uint64_t leaf_index) override;
  bool                           VerifyMerkleProof(const Artifact& root, const MerkleProof& proof) override;

  Artifact AggregateProofs(const model::SealContext& ctx, const std::vector<Artifact>& proofs) override;
  bool     VerifyAggregate(const model::SealContext& ctx, uint64_t proof_count, const Artifact& aggregate) override;

  std::vector<std::string> Hashers() const override;
  Artifact                 Hash(std::string_view hasher, const Artifact& data) override;
  std::optional<uint64_t>  CircuitConstraints(std::string_view hasher) const override;
};

} // namespace sealbench::engine
