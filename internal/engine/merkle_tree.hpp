#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "internal/util/digest.hpp"

namespace sealbench::engine {

/*
  Binary SHA-256 Merkle tree over 32-byte nodes.

  Leaves are the raw data nodes; an inner node is SHA-256(left || right).
  The leaf count must be a power of two.

  Proof layout: [leaf (32)] [sibling at height 0] ... [sibling at height h-1]
*/
class MerkleTree {
 public:
  static constexpr std::size_t kNodeBytes = 32;

  // size must be a power-of-two multiple of kNodeBytes, at least two nodes.
  static MerkleTree Build(const uint8_t* data, std::size_t size);

  static bool IsValidDataSize(std::size_t size);

  const util::Digest32& Root() const {
    return levels_.back().front();
  }

  uint64_t LeafCount() const {
    return levels_.front().size();
  }

  std::size_t Height() const {
    return levels_.size() - 1;
  }

  std::string Prove(uint64_t leaf_index) const;

  static std::size_t ProofSize(std::size_t height) {
    return kNodeBytes * (height + 1);
  }

  // Also rejects proofs whose length does not fit leaf_index.
  static bool Verify(const util::Digest32& root, uint64_t leaf_index, std::string_view proof);

  static util::Digest32 HashPair(const util::Digest32& left, const util::Digest32& right);

 private:
  explicit MerkleTree(std::vector<std::vector<util::Digest32>> levels) : levels_(std::move(levels)) {
  }

  std::vector<std::vector<util::Digest32>> levels_;
};

} // namespace sealbench::engine
