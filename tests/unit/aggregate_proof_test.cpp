#include "internal/bench/aggregate_proof.hpp"

#include <cassert>
#include <iostream>
#include <memory>

#include "internal/engine/reference_engine.hpp"
#include "internal/util/errors.hpp"
#include "test_support.hpp"

namespace {

using sealbench::bench::AggregateOptions;
using sealbench::bench::AggregateProofRunner;
using sealbench::testing::FakeProofEngine;
using sealbench::testing::TempDir;

AggregateOptions Options(const TempDir& root, uint64_t num_proofs) {
  AggregateOptions options;
  options.context    = sealbench::model::SealContext::Make(sealbench::model::kSectorSize2KiB, sealbench::model::kApiVersion1_0_0);
  options.num_proofs = num_proofs;
  options.cache_root = root.path();
  return options;
}

void TestEmptyBatchRejectedBeforeAnyWork() {
  TempDir root("aggregate_empty");
  auto    engine = std::make_shared<FakeProofEngine>();

  bool threw = false;
  try {
    (void)AggregateProofRunner(engine).Run(Options(root, 0));
  } catch (const sealbench::util::EmptyAggregateBatch&) {
    threw = true;
  }
  assert(threw);
  assert(engine->add_piece_calls == 0);
  assert(engine->generate_calls == 0);
  assert(engine->aggregate_calls == 0);
}

void TestSingleProofHasOneAggregationTiming() {
  TempDir root("aggregate_single");
  auto    engine = std::make_shared<FakeProofEngine>();

  auto report = AggregateProofRunner(engine).Run(Options(root, 1));
  assert(report.num_proofs() == 1);
  assert(report.has_aggregate());
  assert(report.has_generate_proofs());
  assert(report.has_verify_aggregate());
  assert(engine->generate_calls == 1);
  assert(engine->aggregate_calls == 1);
}

void TestReferenceEngineAggregatesBatch() {
  TempDir root("aggregate_batch");
  auto    engine = std::make_shared<sealbench::engine::ReferenceEngine>();

  auto report = AggregateProofRunner(engine).Run(Options(root, 8));
  assert(report.num_proofs() == 8);
  // [count][root][one digest per proof]
  assert(report.aggregate_proof_bytes() == 8 + 32 + 8 * 32);
}

void TestRejectedAggregateIsValidationFailure() {
  TempDir root("aggregate_invalid");
  auto    engine          = std::make_shared<FakeProofEngine>();
  engine->aggregate_valid = false;

  bool threw = false;
  try {
    (void)AggregateProofRunner(engine).Run(Options(root, 4));
  } catch (const sealbench::util::ProofValidationFailed&) {
    threw = true;
  }
  assert(threw);
  assert(engine->generate_calls == 4);
}

} // namespace

int main() {
  TestEmptyBatchRejectedBeforeAnyWork();
  TestSingleProofHasOneAggregationTiming();
  TestReferenceEngineAggregatesBatch();
  TestRejectedAggregateIsValidationFailure();

  std::cout << "sealbench_unit_aggregate_proof: pass\n";
  return 0;
}
