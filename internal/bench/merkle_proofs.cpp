#include "merkle_proofs.hpp"

#include <random>
#include <string>
#include <utility>
#include <vector>

#include "internal/bench/report.hpp"
#include "internal/bench/runner_support.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/arrow_utils.hpp"

namespace sealbench::bench {

using observability::DurationField;
using observability::IntField;

namespace {

void ValidateDataSize(uint64_t size) {
  if (size < 64 || (size & (size - 1)) != 0) {
    throw util::InvalidSize("merkle data size must be a power of two of at least 64 bytes, got " + std::to_string(size));
  }
}

engine::Artifact GenerateData(uint64_t size) {
  std::mt19937_64 rng(kMerkleDataSeed);
  std::string     data(size, '\0');
  for (uint64_t offset = 0; offset < size; offset += 8) {
    auto word = rng();
    for (uint64_t b = 0; b < 8 && offset + b < size; ++b) {
      data[offset + b] = static_cast<char>(word >> (8 * b));
    }
  }
  return util::MakeBuffer(std::move(data));
}

} // namespace

MerkleProofRunner::MerkleProofRunner(std::shared_ptr<engine::ProofEngine> engine) : engine_(std::move(engine)) {
}

sealbench::v1::MerkleProofReport MerkleProofRunner::Run(const MerkleBenchOptions& options) {
  ValidateDataSize(options.data_size);
  if (options.proofs == 0) {
    throw util::InvalidArgument("--proofs must be at least 1");
  }

  observability::SpanScope span("sealbench.merkleproofs");

  sealbench::v1::MerkleProofReport report;
  *report.mutable_metadata() = BuildMetadata(*engine_);
  report.set_data_size_bytes(options.data_size);
  report.set_proofs(options.proofs);
  report.set_validated(options.validate);

  const auto data  = GenerateData(options.data_size);
  auto       built = TimedEngineCall("build-merkle-tree", [&] { return engine_->BuildMerkleTree(data); });
  auto       tree  = std::move(built.first);
  *report.mutable_build_tree() = ToProto(built.second);

  const uint64_t leaves = tree->LeafCount();
  if (leaves == 0) {
    throw util::ProofEngineFailure("merkle tree has no leaves");
  }

  std::vector<engine::MerkleProof> proofs;
  proofs.reserve(options.proofs);
  util::Measurement generate_total;
  for (uint64_t i = 0; i < options.proofs; ++i) {
    const auto leaf      = MerkleLeafIndex(i, options.proofs, leaves);
    auto       generated = TimedEngineCall("generate-merkle-proof", [&] { return engine_->GenerateMerkleProof(*tree, leaf); });
    generate_total += generated.second;

    auto* timing = report.add_timings();
    timing->set_index(i);
    timing->set_leaf_index(leaf);
    timing->set_generate_ns(static_cast<uint64_t>(generated.second.wall.count()));
    proofs.push_back(std::move(generated.first));
  }
  *report.mutable_generate_total() = ToProto(generate_total);
  report.set_generate_average_ns(AverageNs(generate_total, options.proofs));

  if (options.validate) {
    const auto        root = tree->Root();
    util::Measurement verify_total;
    for (uint64_t i = 0; i < options.proofs; ++i) {
      auto verified = TimedEngineCall("verify-merkle-proof", [&] { return engine_->VerifyMerkleProof(root, proofs[i]); });
      verify_total += verified.second;

      auto* timing = report.mutable_timings(static_cast<int>(i));
      timing->set_verify_ns(static_cast<uint64_t>(verified.second.wall.count()));
      timing->set_verified(verified.first);
      if (!verified.first) {
        throw util::ProofValidationFailed("merkle proof " + std::to_string(i) + " (leaf " + std::to_string(proofs[i].leaf_index) + ") did not verify",
                                          i);
      }
      report.set_proofs_verified(report.proofs_verified() + 1);
    }
    *report.mutable_verify_total() = ToProto(verify_total);
    report.set_verify_average_ns(AverageNs(verify_total, options.proofs));
  }

  SEALBENCH_LOG_INFO("merkle proofs complete",
                     {IntField("proofs", static_cast<std::int64_t>(options.proofs)),
                      IntField("leaves", static_cast<std::int64_t>(leaves)),
                      DurationField("generate_avg", static_cast<std::int64_t>(report.generate_average_ns()))});
  return report;
}

} // namespace sealbench::bench
