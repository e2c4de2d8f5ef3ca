#include "internal/engine/merkle_tree.hpp"

#include <algorithm>
#include <cassert>
#include <cstdint>
#include <iostream>
#include <string>

namespace {

using sealbench::engine::MerkleTree;

std::string Data(std::size_t nodes) {
  std::string data(nodes * MerkleTree::kNodeBytes, '\0');
  for (std::size_t i = 0; i < data.size(); ++i) {
    data[i] = static_cast<char>((i * 31 + 7) & 0xFF);
  }
  return data;
}

MerkleTree Build(const std::string& data) {
  return MerkleTree::Build(reinterpret_cast<const uint8_t*>(data.data()), data.size());
}

void TestValidSizes() {
  assert(!MerkleTree::IsValidDataSize(0));
  assert(!MerkleTree::IsValidDataSize(32));
  assert(MerkleTree::IsValidDataSize(64));
  assert(!MerkleTree::IsValidDataSize(96));
  assert(MerkleTree::IsValidDataSize(2048));
  assert(!MerkleTree::IsValidDataSize(2047));
}

void TestTwoLeafRoot() {
  auto data = Data(2);
  auto tree = Build(data);
  assert(tree.LeafCount() == 2);
  assert(tree.Height() == 1);

  sealbench::util::Digest32 left;
  sealbench::util::Digest32 right;
  std::copy(data.begin(), data.begin() + 32, left.begin());
  std::copy(data.begin() + 32, data.end(), right.begin());
  assert(tree.Root() == MerkleTree::HashPair(left, right));
}

void TestEveryLeafProves() {
  auto data = Data(64);
  auto tree = Build(data);
  assert(tree.Height() == 6);

  for (uint64_t i = 0; i < tree.LeafCount(); ++i) {
    auto proof = tree.Prove(i);
    assert(proof.size() == MerkleTree::ProofSize(tree.Height()));
    assert(MerkleTree::Verify(tree.Root(), i, proof));
  }
}

void TestTamperedProofsFail() {
  auto tree  = Build(Data(16));
  auto proof = tree.Prove(5);

  assert(!MerkleTree::Verify(tree.Root(), 6, proof));
  assert(!MerkleTree::Verify(tree.Root(), 5, proof.substr(0, proof.size() - 1)));

  auto flipped = proof;
  flipped[40] = static_cast<char>(flipped[40] ^ 0x01);
  assert(!MerkleTree::Verify(tree.Root(), 5, flipped));

  auto other_root = Build(Data(32)).Root();
  assert(!MerkleTree::Verify(other_root, 5, proof));
}

void TestSameDataSameRoot() {
  assert(Build(Data(8)).Root() == Build(Data(8)).Root());
}

} // namespace

int main() {
  TestValidSizes();
  TestTwoLeafRoot();
  TestEveryLeafProves();
  TestTamperedProofsFail();
  TestSameDataSameRoot();

  std::cout << "sealbench_unit_merkle_tree: pass\n";
  return 0;
}
