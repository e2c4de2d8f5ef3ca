#include "reference_engine.hpp"

#include <algorithm>
#include <cstring>
#include <stdexcept>
#include <string>
#include <utility>

#include "internal/engine/merkle_tree.hpp"
#include "internal/util/arrow_utils.hpp"
#include "internal/util/digest.hpp"

namespace sealbench::engine {

namespace {

constexpr std::size_t kNode = MerkleTree::kNodeBytes;

// comm_r, comm_d, root_r, comm_c
constexpr std::size_t kSealHeaderBytes = 4 * kNode;
constexpr std::size_t kSealProofBytes  = 6 * kNode;
constexpr uint64_t    kWinningPostSectorCount = 1;

const std::vector<std::string> kHashers = {"sha256", "blake2s256"};

class TruncatedInput : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

class ByteWriter {
 public:
  ByteWriter& Put(const void* data, std::size_t size) {
    out_.append(static_cast<const char*>(data), size);
    return *this;
  }
  ByteWriter& Put(const util::Digest32& digest) {
    return Put(digest.data(), digest.size());
  }
  ByteWriter& Put(std::string_view bytes) {
    return Put(bytes.data(), bytes.size());
  }
  ByteWriter& PutU64(uint64_t value) {
    uint8_t le[8];
    for (int i = 0; i < 8; ++i) {
      le[i] = static_cast<uint8_t>(value >> (8 * i));
    }
    return Put(le, sizeof(le));
  }

  Artifact Finish() {
    return util::MakeBuffer(std::move(out_));
  }

 private:
  std::string out_;
};

class ByteReader {
 public:
  ByteReader(std::string_view data, std::string what) : data_(data), what_(std::move(what)) {
  }

  std::string_view Take(std::size_t size) {
    if (data_.size() - pos_ < size) {
      throw TruncatedInput("truncated " + what_);
    }
    auto out = data_.substr(pos_, size);
    pos_ += size;
    return out;
  }

  util::Digest32 Digest() {
    util::Digest32 out;
    std::memcpy(out.data(), Take(kNode).data(), kNode);
    return out;
  }

  uint64_t U64() {
    auto     bytes = Take(8);
    uint64_t value = 0;
    for (int i = 7; i >= 0; --i) {
      value = (value << 8) | static_cast<uint8_t>(bytes[i]);
    }
    return value;
  }

  std::size_t Remaining() const {
    return data_.size() - pos_;
  }

 private:
  std::string_view data_;
  std::size_t      pos_ = 0;
  std::string      what_;
};

struct SealHeader {
  util::Digest32 comm_r;
  util::Digest32 comm_d;
  util::Digest32 root_r;
  util::Digest32 comm_c;
};

const arrow::Buffer& Require(const Artifact& artifact, std::string_view what) {
  if (!artifact) {
    throw std::invalid_argument("missing " + std::string(what));
  }
  return *artifact;
}

util::Digest32 ToDigest(const std::string& bytes) {
  util::Digest32 out{};
  std::memcpy(out.data(), bytes.data(), std::min(bytes.size(), out.size()));
  return out;
}

uint64_t IndexFrom(const util::Digest32& digest, uint64_t modulo) {
  uint64_t value = 0;
  for (int i = 7; i >= 0; --i) {
    value = (value << 8) | digest[i];
  }
  return value % modulo;
}

std::size_t Log2(uint64_t value) {
  std::size_t bits = 0;
  while (value > 1) {
    value >>= 1;
    ++bits;
  }
  return bits;
}

void CheckSize(const arrow::Buffer& buffer, std::size_t expected, std::string_view what) {
  if (static_cast<std::size_t>(buffer.size()) != expected) {
    throw std::invalid_argument(std::string(what) + " is " + std::to_string(buffer.size()) + " bytes, expected " + std::to_string(expected));
  }
}

SealHeader ReadHeader(ByteReader& reader) {
  SealHeader header;
  header.comm_r = reader.Digest();
  header.comm_d = reader.Digest();
  header.root_r = reader.Digest();
  header.comm_c = reader.Digest();
  return header;
}

void WriteHeader(ByteWriter& writer, const SealHeader& header) {
  writer.Put(header.comm_r).Put(header.comm_d).Put(header.root_r).Put(header.comm_c);
}

// Splits a precommit-2 output into its header and replica.
std::pair<SealHeader, std::string_view> ParseSealed(const model::SealContext& ctx, const Artifact& phase2) {
  const auto& buffer = Require(phase2, "precommit phase 2 output");
  CheckSize(buffer, kSealHeaderBytes + ctx.sector_size, "precommit phase 2 output");

  ByteReader reader(util::View(buffer), "precommit phase 2 output");
  auto       header = ReadHeader(reader);
  return {header, reader.Take(ctx.sector_size)};
}

MerkleTree BuildReplicaTree(const SealHeader& header, std::string_view replica) {
  auto tree = MerkleTree::Build(reinterpret_cast<const uint8_t*>(replica.data()), replica.size());
  if (tree.Root() != header.root_r) {
    throw std::runtime_error("replica does not match its committed tree root");
  }
  if (MerkleTree::HashPair(header.comm_c, header.root_r) != header.comm_r) {
    throw std::runtime_error("comm_r does not commit to comm_c and the replica root");
  }
  return tree;
}

uint64_t PorepChallenge(const util::Digest32& comm_r, uint64_t j, uint64_t leaves) {
  util::Digester digester;
  digester.Update("porep-challenge").Update(comm_r.data(), comm_r.size()).UpdateU64(j);
  return IndexFrom(ToDigest(digester.Finish()), leaves);
}

uint64_t PorepChallengeCount(const model::SealContext& ctx) {
  const uint64_t count = ctx.parameters.porep_challenges * ctx.parameters.porep_partitions;
  if (count == 0) {
    throw std::invalid_argument("porep challenge count must be positive");
  }
  return count;
}

uint64_t PostChallenge(PostKind kind, std::string_view randomness, uint64_t partition, uint64_t sector_id, uint64_t j, uint64_t leaves) {
  util::Digester digester;
  digester.Update(PostKindName(kind)).Update(randomness).UpdateU64(partition).UpdateU64(sector_id).UpdateU64(j);
  return IndexFrom(ToDigest(digester.Finish()), leaves);
}

// Sectors per partition. Window PoSt splits its sectors into partitions of
// post_challenged_sectors each; winning PoSt is always one partition.
uint64_t PostPartitionSize(const model::SealContext& ctx, PostKind kind, uint64_t sector_count) {
  if (kind == PostKind::kWinning) {
    return sector_count;
  }
  if (ctx.parameters.post_challenged_sectors == 0) {
    throw std::invalid_argument("window post challenged sectors per partition must be positive");
  }
  return ctx.parameters.post_challenged_sectors;
}

uint64_t PostPartitionCount(uint64_t sector_count, uint64_t partition_size) {
  return (sector_count + partition_size - 1) / partition_size;
}

uint64_t PostChallengeCount(const model::SealContext& ctx, PostKind kind) {
  const uint64_t count = kind == PostKind::kWindow ? ctx.parameters.post_challenges : ctx.parameters.winning_post_challenges;
  if (count == 0) {
    throw std::invalid_argument(std::string(PostKindName(kind)) + " post challenge count must be positive");
  }
  return count;
}

Artifact SealProof(const model::SealContext& ctx, const SealHeader& header, const util::Digest32& vanilla_digest) {
  util::Digester digester;
  digester.Update("seal")
      .Update(header.comm_r.data(), kNode)
      .Update(header.comm_d.data(), kNode)
      .Update(vanilla_digest.data(), kNode)
      .UpdateU64(ctx.sector_id)
      .Update(ctx.api_version.ToString());
  auto link0 = ToDigest(digester.Finish());
  auto link1 = MerkleTree::HashPair(link0, header.comm_r);
  auto link2 = MerkleTree::HashPair(link1, header.comm_d);

  ByteWriter writer;
  writer.Put(header.comm_r).Put(header.comm_d).Put(vanilla_digest).Put(link0).Put(link1).Put(link2);
  return writer.Finish();
}

util::Digest32 AggregateRoot(const std::vector<util::Digest32>& digests) {
  std::size_t leaves = 2;
  while (leaves < digests.size()) {
    leaves <<= 1;
  }
  std::string data(leaves * kNode, '\0');
  for (std::size_t i = 0; i < digests.size(); ++i) {
    std::memcpy(data.data() + i * kNode, digests[i].data(), kNode);
  }
  return MerkleTree::Build(reinterpret_cast<const uint8_t*>(data.data()), data.size()).Root();
}

class ReferenceTree final : public CommittedTree {
 public:
  explicit ReferenceTree(MerkleTree tree) : tree_(std::move(tree)) {
  }

  Artifact Root() const override {
    const auto& root = tree_.Root();
    return util::MakeBuffer(std::string(reinterpret_cast<const char*>(root.data()), root.size()));
  }

  uint64_t LeafCount() const override {
    return tree_.LeafCount();
  }

  const MerkleTree& tree() const {
    return tree_;
  }

 private:
  MerkleTree tree_;
};

} // namespace

std::string_view PostKindName(PostKind kind) {
  switch (kind) {
    case PostKind::kWinning:
      return "winning";
    case PostKind::kWindow:
      return "window";
  }
  return "unknown";
}

// ------------------------------------------------------------
// Sealing
// ------------------------------------------------------------

Artifact ReferenceEngine::AddPiece(const model::SealContext& ctx) {
  const uint64_t nodes = ctx.Nodes();
  std::string    staged(ctx.sector_size, '\0');

  util::Digester digester;
  for (uint64_t i = 0; i < nodes; ++i) {
    auto node = digester.Update("piece").UpdateU64(ctx.sector_id).UpdateU64(i).Finish();
    // Keep every node below the field modulus.
    node[kNode - 1] = static_cast<char>(static_cast<uint8_t>(node[kNode - 1]) & 0x3F);
    std::memcpy(staged.data() + i * kNode, node.data(), kNode);
  }
  return util::MakeBuffer(std::move(staged));
}

/*
  Output: [comm_d][replica_id][labels of the last layer]

  Label (layer l, node i) = H(replica_id, l, i, label(l, i-1), label(l-1, i)),
  where layer 0 is the staged data.
*/
Artifact ReferenceEngine::PrecommitPhase1(const model::SealContext& ctx, const Artifact& staged) {
  const auto& data = Require(staged, "staged sector");
  CheckSize(data, ctx.sector_size, "staged sector");
  if (ctx.parameters.layers == 0) {
    throw std::invalid_argument("stacked layers must be positive");
  }

  const auto comm_d = MerkleTree::Build(data.data(), static_cast<std::size_t>(data.size())).Root();

  util::Digester digester;
  digester.Update("replica-id").UpdateU64(ctx.sector_id).Update(comm_d.data(), kNode).Update(ctx.api_version.ToString());
  const auto replica_id = ToDigest(digester.Finish());

  const uint64_t nodes = ctx.Nodes();
  std::string    previous(util::View(data));
  std::string    current(ctx.sector_size, '\0');
  for (uint32_t layer = 1; layer <= ctx.parameters.layers; ++layer) {
    for (uint64_t i = 0; i < nodes; ++i) {
      digester.Update(replica_id.data(), kNode).UpdateU64(layer).UpdateU64(i);
      if (i > 0) {
        digester.Update(current.data() + (i - 1) * kNode, kNode);
      }
      digester.Update(previous.data() + i * kNode, kNode);
      auto label      = digester.Finish();
      label[kNode - 1] = static_cast<char>(static_cast<uint8_t>(label[kNode - 1]) & 0x3F);
      std::memcpy(current.data() + i * kNode, label.data(), kNode);
    }
    std::swap(previous, current);
  }

  ByteWriter writer;
  writer.Put(comm_d).Put(replica_id).Put(previous);
  return writer.Finish();
}

/*
  Output: [comm_r][comm_d][root_r][comm_c][replica]

  replica = staged XOR labels, comm_c = root(labels), root_r = root(replica),
  comm_r = H(comm_c || root_r).
*/
Artifact ReferenceEngine::PrecommitPhase2(const model::SealContext& ctx, const Artifact& staged, const Artifact& phase1) {
  const auto& data = Require(staged, "staged sector");
  const auto& pc1  = Require(phase1, "precommit phase 1 output");
  CheckSize(data, ctx.sector_size, "staged sector");
  CheckSize(pc1, 2 * kNode + ctx.sector_size, "precommit phase 1 output");

  ByteReader reader(util::View(pc1), "precommit phase 1 output");
  SealHeader header;
  header.comm_d = reader.Digest();
  reader.Digest(); // replica id
  auto labels = reader.Take(ctx.sector_size);

  std::string replica(ctx.sector_size, '\0');
  const auto* unsealed = data.data();
  for (std::size_t i = 0; i < replica.size(); ++i) {
    replica[i] = static_cast<char>(unsealed[i] ^ static_cast<uint8_t>(labels[i]));
  }

  header.comm_c = MerkleTree::Build(reinterpret_cast<const uint8_t*>(labels.data()), labels.size()).Root();
  header.root_r = MerkleTree::Build(reinterpret_cast<const uint8_t*>(replica.data()), replica.size()).Root();
  header.comm_r = MerkleTree::HashPair(header.comm_c, header.root_r);

  ByteWriter writer;
  WriteHeader(writer, header);
  writer.Put(replica);
  return writer.Finish();
}

/*
  Output: [seal header][challenge count] then per challenge
  [leaf index][inclusion proof in the replica tree].
*/
Artifact ReferenceEngine::CommitPhase1(const model::SealContext& ctx, const Artifact& phase2) {
  auto [header, replica] = ParseSealed(ctx, phase2);
  auto tree              = BuildReplicaTree(header, replica);

  const uint64_t count = PorepChallengeCount(ctx);

  ByteWriter writer;
  WriteHeader(writer, header);
  writer.PutU64(count);
  for (uint64_t j = 0; j < count; ++j) {
    const auto index = PorepChallenge(header.comm_r, j, tree.LeafCount());
    writer.PutU64(index).Put(tree.Prove(index));
  }
  return writer.Finish();
}

/*
  Checks every vanilla proof, then compresses them into a fixed-size proof:
  [comm_r][comm_d][H(vanilla proofs)][link0][link1][link2].
*/
Artifact ReferenceEngine::CommitPhase2(const model::SealContext& ctx, const Artifact& commit1) {
  const auto& c1 = Require(commit1, "commit phase 1 output");

  ByteReader reader(util::View(c1), "commit phase 1 output");
  auto       header = ReadHeader(reader);
  if (MerkleTree::HashPair(header.comm_c, header.root_r) != header.comm_r) {
    throw std::runtime_error("comm_r does not commit to comm_c and the replica root");
  }

  const uint64_t count = reader.U64();
  if (count != PorepChallengeCount(ctx)) {
    throw std::runtime_error("commit phase 1 output has " + std::to_string(count) + " challenges, expected " +
                             std::to_string(PorepChallengeCount(ctx)));
  }

  const auto leaves     = ctx.Nodes();
  const auto proof_size = MerkleTree::ProofSize(Log2(leaves));
  for (uint64_t j = 0; j < count; ++j) {
    const auto index = reader.U64();
    if (index != PorepChallenge(header.comm_r, j, leaves)) {
      throw std::runtime_error("vanilla proof " + std::to_string(j) + " answers the wrong challenge");
    }
    if (!MerkleTree::Verify(header.root_r, index, reader.Take(proof_size))) {
      throw std::runtime_error("vanilla proof " + std::to_string(j) + " does not verify");
    }
  }
  if (reader.Remaining() != 0) {
    throw std::runtime_error("trailing bytes after commit phase 1 proofs");
  }

  const auto vanilla = util::View(c1).substr(kSealHeaderBytes);
  return SealProof(ctx, header, util::Sha256(vanilla.data(), vanilla.size()));
}

bool ReferenceEngine::VerifySeal(const model::SealContext& ctx, const Artifact& phase2, const Artifact& seal_proof) {
  if (!seal_proof || static_cast<std::size_t>(seal_proof->size()) != kSealProofBytes) {
    return false;
  }
  auto expected = CommitPhase2(ctx, CommitPhase1(ctx, phase2));
  return expected->Equals(*seal_proof);
}

// ------------------------------------------------------------
// Proof of spacetime
// ------------------------------------------------------------

std::vector<uint64_t> ReferenceEngine::WinningPostSectorChallenge(const model::SealContext& ctx, const Artifact& randomness, uint64_t sector_count) {
  const auto& seed = Require(randomness, "randomness");
  if (sector_count == 0) {
    throw std::invalid_argument("winning post needs at least one eligible sector");
  }

  std::vector<uint64_t> challenged;
  util::Digester        digester;
  for (uint64_t k = 0; k < kWinningPostSectorCount; ++k) {
    digester.Update("winning-sector").Update(util::View(seed)).UpdateU64(ctx.sector_id).UpdateU64(k);
    challenged.push_back(IndexFrom(ToDigest(digester.Finish()), sector_count));
  }
  return challenged;
}

/*
  Output: [partition count][sector count] then per sector
  [sector id][comm_c][root_r][inclusion proof per challenge]. Challenges
  are derived from the randomness, the sector's partition and its id.
*/
Artifact ReferenceEngine::GeneratePost(const model::SealContext& ctx, PostKind kind, const Artifact& randomness, const std::vector<PostSector>& sectors) {
  const auto seed = util::View(Require(randomness, "randomness"));
  if (sectors.empty()) {
    throw std::invalid_argument(std::string(PostKindName(kind)) + " post needs at least one sector");
  }
  const uint64_t challenges     = PostChallengeCount(ctx, kind);
  const uint64_t partition_size = PostPartitionSize(ctx, kind, sectors.size());

  ByteWriter writer;
  writer.PutU64(PostPartitionCount(sectors.size(), partition_size)).PutU64(sectors.size());
  for (std::size_t s = 0; s < sectors.size(); ++s) {
    const auto& sector     = sectors[s];
    const auto  partition  = s / partition_size;
    auto [header, replica] = ParseSealed(ctx, sector.sealed);
    auto tree              = BuildReplicaTree(header, replica);

    writer.PutU64(sector.sector_id).Put(header.comm_c).Put(header.root_r);
    for (uint64_t j = 0; j < challenges; ++j) {
      writer.Put(tree.Prove(PostChallenge(kind, seed, partition, sector.sector_id, j, tree.LeafCount())));
    }
  }
  return writer.Finish();
}

bool ReferenceEngine::VerifyPost(const model::SealContext&      ctx,
                                 PostKind                       kind,
                                 const Artifact&                randomness,
                                 const std::vector<PostSector>& sectors,
                                 const Artifact&                proof) {
  const auto seed = util::View(Require(randomness, "randomness"));
  if (!proof || sectors.empty()) {
    return false;
  }
  const uint64_t challenges     = PostChallengeCount(ctx, kind);
  const uint64_t partition_size = PostPartitionSize(ctx, kind, sectors.size());
  const auto     leaves         = ctx.Nodes();
  const auto     proof_size     = MerkleTree::ProofSize(Log2(leaves));

  // Public inputs first: a malformed sealed sector is an error, not a failed proof.
  std::vector<util::Digest32> comm_rs;
  for (const auto& sector : sectors) {
    comm_rs.push_back(ParseSealed(ctx, sector.sealed).first.comm_r);
  }

  try {
    ByteReader reader(util::View(*proof), "post proof");
    if (reader.U64() != PostPartitionCount(sectors.size(), partition_size) || reader.U64() != sectors.size()) {
      return false;
    }
    for (std::size_t s = 0; s < sectors.size(); ++s) {
      if (reader.U64() != sectors[s].sector_id) {
        return false;
      }
      const auto comm_c = reader.Digest();
      const auto root_r = reader.Digest();
      if (MerkleTree::HashPair(comm_c, root_r) != comm_rs[s]) {
        return false;
      }
      for (uint64_t j = 0; j < challenges; ++j) {
        const auto index = PostChallenge(kind, seed, s / partition_size, sectors[s].sector_id, j, leaves);
        if (!MerkleTree::Verify(root_r, index, reader.Take(proof_size))) {
          return false;
        }
      }
    }
    return reader.Remaining() == 0;
  } catch (const TruncatedInput&) {
    return false;
  }
}

// ------------------------------------------------------------
// Merkle openings
// ------------------------------------------------------------

std::unique_ptr<CommittedTree> ReferenceEngine::BuildMerkleTree(const Artifact& data) {
  const auto& buffer = Require(data, "merkle tree data");
  return std::make_unique<ReferenceTree>(MerkleTree::Build(buffer.data(), static_cast<std::size_t>(buffer.size())));
}

MerkleProof ReferenceEngine::GenerateMerkleProof(const CommittedTree& tree, uint64_t leaf_index) {
  const auto* reference = dynamic_cast<const ReferenceTree*>(&tree);
  if (reference == nullptr) {
    throw std::invalid_argument("tree was not built by the reference engine");
  }
  return {leaf_index, util::MakeBuffer(reference->tree().Prove(leaf_index))};
}

bool ReferenceEngine::VerifyMerkleProof(const Artifact& root, const MerkleProof& proof) {
  if (!root || static_cast<std::size_t>(root->size()) != kNode || !proof.bytes) {
    return false;
  }
  util::Digest32 expected;
  std::memcpy(expected.data(), root->data(), kNode);
  return MerkleTree::Verify(expected, proof.leaf_index, util::View(*proof.bytes));
}

// ------------------------------------------------------------
// Aggregation
// ------------------------------------------------------------

/*
  Output: [proof count][root over proof digests][digest per proof]
*/
Artifact ReferenceEngine::AggregateProofs(const model::SealContext&, const std::vector<Artifact>& proofs) {
  if (proofs.empty()) {
    throw std::invalid_argument("cannot aggregate an empty proof batch");
  }

  std::vector<util::Digest32> digests;
  digests.reserve(proofs.size());
  for (const auto& proof : proofs) {
    const auto& buffer = Require(proof, "proof");
    digests.push_back(util::Sha256(buffer.data(), static_cast<std::size_t>(buffer.size())));
  }

  ByteWriter writer;
  writer.PutU64(digests.size()).Put(AggregateRoot(digests));
  for (const auto& digest : digests) {
    writer.Put(digest);
  }
  return writer.Finish();
}

bool ReferenceEngine::VerifyAggregate(const model::SealContext&, uint64_t proof_count, const Artifact& aggregate) {
  if (!aggregate || proof_count == 0) {
    return false;
  }
  if (static_cast<uint64_t>(aggregate->size()) != 8 + kNode + kNode * proof_count) {
    return false;
  }

  ByteReader reader(util::View(*aggregate), "aggregate proof");
  if (reader.U64() != proof_count) {
    return false;
  }
  const auto root = reader.Digest();

  std::vector<util::Digest32> digests;
  digests.reserve(proof_count);
  for (uint64_t i = 0; i < proof_count; ++i) {
    digests.push_back(reader.Digest());
  }
  return AggregateRoot(digests) == root;
}

// ------------------------------------------------------------
// Hashers
// ------------------------------------------------------------

std::vector<std::string> ReferenceEngine::Hashers() const {
  return kHashers;
}

Artifact ReferenceEngine::Hash(std::string_view hasher, const Artifact& data) {
  const auto& buffer = Require(data, "hash input");

  std::string algorithm;
  if (hasher == "sha256") {
    algorithm = "SHA256";
  } else if (hasher == "blake2s256") {
    algorithm = "BLAKE2s256";
  } else {
    throw std::invalid_argument("unknown hasher: " + std::string(hasher));
  }

  util::Digester digester(algorithm);
  return util::MakeBuffer(digester.Update(buffer.data(), static_cast<std::size_t>(buffer.size())).Finish());
}

// The reference engine has no circuits.
std::optional<uint64_t> ReferenceEngine::CircuitConstraints(std::string_view) const {
  return std::nullopt;
}

} // namespace sealbench::engine
