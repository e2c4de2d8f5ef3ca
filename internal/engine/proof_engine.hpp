#pragma once

#include <arrow/buffer.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/model/sector.hpp"

namespace sealbench::engine {

// Opaque phase output or proof bytes.
using Artifact = std::shared_ptr<arrow::Buffer>;

enum class PostKind {
  kWinning,
  kWindow,
};

std::string_view PostKindName(PostKind kind);

// A sealed sector as PoSt sees it: its id and the precommit-2 output.
struct PostSector {
  uint64_t sector_id = 0;
  Artifact sealed;
};

struct MerkleProof {
  uint64_t leaf_index = 0;
  Artifact bytes;
};

/*
  Tree built once by BuildMerkleTree and opened many times.
*/
class CommittedTree {
 public:
  virtual ~CommittedTree() = default;

  virtual Artifact Root() const      = 0;
  virtual uint64_t LeafCount() const = 0;
};

/*
  Proving backend capability set.

  Failures are thrown (any exception type). A verifier that runs to
  completion reports the outcome as its return value; false is never an
  exception.

  Implementations must be safe to call from several threads at once as long
  as the calls touch different sectors.
*/
class ProofEngine {
 public:
  virtual ~ProofEngine() = default;

  virtual std::string Name() const = 0;

  // ------------------------------------------------------------
  // Sealing
  // ------------------------------------------------------------

  virtual Artifact AddPiece(const model::SealContext& ctx) = 0;

  virtual Artifact PrecommitPhase1(const model::SealContext& ctx, const Artifact& staged) = 0;

  virtual Artifact PrecommitPhase2(const model::SealContext& ctx, const Artifact& staged, const Artifact& phase1) = 0;

  virtual Artifact CommitPhase1(const model::SealContext& ctx, const Artifact& phase2) = 0;

  virtual Artifact CommitPhase2(const model::SealContext& ctx, const Artifact& commit1) = 0;

  virtual bool VerifySeal(const model::SealContext& ctx, const Artifact& phase2, const Artifact& seal_proof) = 0;

  // ------------------------------------------------------------
  // Proof of spacetime
  // ------------------------------------------------------------

  // Indices into the eligible sector list, count of them.
  virtual std::vector<uint64_t> WinningPostSectorChallenge(const model::SealContext& ctx, const Artifact& randomness, uint64_t sector_count) = 0;

  virtual Artifact GeneratePost(const model::SealContext& ctx, PostKind kind, const Artifact& randomness, const std::vector<PostSector>& sectors) = 0;

  virtual bool VerifyPost(const model::SealContext&      ctx,
                          PostKind                       kind,
                          const Artifact&                randomness,
                          const std::vector<PostSector>& sectors,
                          const Artifact&                proof) = 0;

  // ------------------------------------------------------------
  // Merkle openings
  // ------------------------------------------------------------

  virtual std::unique_ptr<CommittedTree> BuildMerkleTree(const Artifact& data) = 0;

  virtual MerkleProof GenerateMerkleProof(const CommittedTree& tree, uint64_t leaf_index) = 0;

  virtual bool VerifyMerkleProof(const Artifact& root, const MerkleProof& proof) = 0;

  // ------------------------------------------------------------
  // Aggregation
  // ------------------------------------------------------------

  virtual Artifact AggregateProofs(const model::SealContext& ctx, const std::vector<Artifact>& proofs) = 0;

  virtual bool VerifyAggregate(const model::SealContext& ctx, uint64_t proof_count, const Artifact& aggregate) = 0;

  // ------------------------------------------------------------
  // Hashers
  // ------------------------------------------------------------

  virtual std::vector<std::string> Hashers() const = 0;

  virtual Artifact Hash(std::string_view hasher, const Artifact& data) = 0;

  // nullopt when the engine has no circuit for the hasher.
  virtual std::optional<uint64_t> CircuitConstraints(std::string_view hasher) const = 0;
};

} // namespace sealbench::engine
