#include "merkle_tree.hpp"

#include <cstring>
#include <stdexcept>

namespace sealbench::engine {

bool MerkleTree::IsValidDataSize(std::size_t size) {
  if (size < 2 * kNodeBytes || size % kNodeBytes != 0) {
    return false;
  }
  const std::size_t leaves = size / kNodeBytes;
  return (leaves & (leaves - 1)) == 0;
}

util::Digest32 MerkleTree::HashPair(const util::Digest32& left, const util::Digest32& right) {
  uint8_t joined[2 * kNodeBytes];
  std::memcpy(joined, left.data(), kNodeBytes);
  std::memcpy(joined + kNodeBytes, right.data(), kNodeBytes);
  return util::Sha256(joined, sizeof(joined));
}

MerkleTree MerkleTree::Build(const uint8_t* data, std::size_t size) {
  if (!IsValidDataSize(size)) {
    throw std::invalid_argument("merkle tree data must be a power-of-two number of 32-byte nodes, got " + std::to_string(size) + " bytes");
  }

  std::vector<std::vector<util::Digest32>> levels;
  levels.emplace_back(size / kNodeBytes);
  for (std::size_t i = 0; i < levels[0].size(); ++i) {
    std::memcpy(levels[0][i].data(), data + i * kNodeBytes, kNodeBytes);
  }

  while (levels.back().size() > 1) {
    const auto&                 below = levels.back();
    std::vector<util::Digest32> above(below.size() / 2);
    for (std::size_t i = 0; i < above.size(); ++i) {
      above[i] = HashPair(below[2 * i], below[2 * i + 1]);
    }
    levels.push_back(std::move(above));
  }

  return MerkleTree(std::move(levels));
}

std::string MerkleTree::Prove(uint64_t leaf_index) const {
  if (leaf_index >= LeafCount()) {
    throw std::out_of_range("leaf index " + std::to_string(leaf_index) + " outside tree of " + std::to_string(LeafCount()) + " leaves");
  }

  std::string proof;
  proof.reserve(ProofSize(Height()));
  proof.append(reinterpret_cast<const char*>(levels_[0][leaf_index].data()), kNodeBytes);

  uint64_t index = leaf_index;
  for (std::size_t level = 0; level < Height(); ++level) {
    const auto& sibling = levels_[level][index ^ 1];
    proof.append(reinterpret_cast<const char*>(sibling.data()), kNodeBytes);
    index >>= 1;
  }
  return proof;
}

bool MerkleTree::Verify(const util::Digest32& root, uint64_t leaf_index, std::string_view proof) {
  if (proof.size() < 2 * kNodeBytes || proof.size() % kNodeBytes != 0) {
    return false;
  }
  const std::size_t height = proof.size() / kNodeBytes - 1;
  if (height < 64 && (leaf_index >> height) != 0) {
    return false;
  }

  util::Digest32 node;
  std::memcpy(node.data(), proof.data(), kNodeBytes);

  uint64_t index = leaf_index;
  for (std::size_t level = 0; level < height; ++level) {
    util::Digest32 sibling;
    std::memcpy(sibling.data(), proof.data() + (level + 1) * kNodeBytes, kNodeBytes);
    node = (index & 1) ? HashPair(sibling, node) : HashPair(node, sibling);
    index >>= 1;
  }
  return node == root;
}

} // namespace sealbench::engine
