#include "internal/cli/command_line.hpp"

#include <cassert>
#include <iostream>
#include <string>
#include <vector>

#include "internal/model/sector.hpp"
#include "internal/util/errors.hpp"

namespace {

using sealbench::cli::Command;
using sealbench::cli::ParseCommandLine;
using sealbench::util::ErrorKind;

ErrorKind FailureKind(const std::vector<std::string>& args) {
  try {
    (void)ParseCommandLine(args);
  } catch (const sealbench::util::BenchError& e) {
    return e.kind();
  }
  assert(false && "expected a parse failure");
  return ErrorKind::kInvalidArgument;
}

void TestWindowPostFlags() {
  auto line = ParseCommandLine({"window-post", "--size", "2KiB", "--cache=/tmp/c", "--preserve-cache", "--skip-precommit-phase1",
                                "--skip-precommit-phase2", "--api-version", "1.1.0"});
  assert(line.command == Command::kWindowPost);
  assert(line.size == sealbench::model::kSectorSize2KiB);
  assert(line.cache == "/tmp/c");
  assert(line.preserve_cache);
  assert(line.flags.skip_precommit_phase1);
  assert(line.flags.skip_precommit_phase2);
  assert(!line.flags.skip_commit_phase1);
  assert(!line.test_resume);
  assert(line.api_version == sealbench::model::kApiVersion1_1_0);

  auto resume = ParseCommandLine({"window-post", "--size=2048", "--test-resume", "--preserve-cache=false"});
  assert(resume.test_resume);
  assert(!resume.preserve_cache);
  assert(resume.api_version == sealbench::model::kApiVersion1_0_0);
}

void TestGlobalRuntimeConfig() {
  auto line = ParseCommandLine({"--runtime-config", "/etc/sealbench.yaml", "hash-constraints"});
  assert(line.runtime_config == "/etc/sealbench.yaml");
  assert(line.command == Command::kHashConstraints);
}

void TestMerkleProofDefaultsAndValidate() {
  auto line = ParseCommandLine({"merkleproofs", "--size", "8MiB"});
  assert(line.proofs == 1024);
  assert(line.validate);

  assert(!ParseCommandLine({"merkleproofs", "--size", "8MiB", "--validate", "false"}).validate);
  assert(!ParseCommandLine({"merkleproofs", "--size", "8MiB", "--validate=false"}).validate);
  assert(ParseCommandLine({"merkleproofs", "--validate", "--size", "8MiB"}).validate);
  assert(ParseCommandLine({"merkleproofs", "--size", "8MiB", "--proofs", "0"}).proofs == 0);
}

void TestAggregateSpellings() {
  assert(ParseCommandLine({"aggregate-proof", "--size", "2KiB"}).num_agg == 128);
  assert(ParseCommandLine({"aggregate-proof", "--size", "2KiB", "--num_agg", "8"}).num_agg == 8);
  assert(ParseCommandLine({"aggregate-proof", "--size", "2KiB", "--num-agg=3"}).num_agg == 3);
  // Zero parses; the runner rejects it.
  assert(ParseCommandLine({"aggregate-proof", "--size", "2KiB", "--num_agg", "0"}).num_agg == 0);
}

void TestProdbenchFlags() {
  auto line = ParseCommandLine({"prodbench", "--config", "bench.json", "--skip-post-proof", "--only-replicate"});
  assert(line.command == Command::kProdbench);
  assert(line.prodbench_config == "bench.json");
  assert(line.stage_flags.skip_post_proof);
  assert(line.stage_flags.only_replicate);
  assert(!line.stage_flags.skip_seal_proof);
  assert(!line.stage_flags.only_add_piece);

  // No --config means the document comes from stdin.
  assert(ParseCommandLine({"prodbench"}).prodbench_config.empty());
}

void TestHelp() {
  assert(ParseCommandLine({"--help"}).command == Command::kHelp);
  assert(ParseCommandLine({"help"}).command == Command::kHelp);
  assert(ParseCommandLine({"window-post", "--help"}).command == Command::kHelp);
  assert(sealbench::cli::Usage().find("aggregate-proof") != std::string::npos);
}

void TestUsageErrors() {
  assert(FailureKind({}) == ErrorKind::kInvalidArgument);
  assert(FailureKind({"seal-everything"}) == ErrorKind::kInvalidArgument);
  assert(FailureKind({"window-post"}) == ErrorKind::kInvalidArgument);
  assert(FailureKind({"window-post", "--size"}) == ErrorKind::kInvalidArgument);
  assert(FailureKind({"winning-post", "--size", "2KiB", "--cache", "x"}) == ErrorKind::kInvalidArgument);
  assert(FailureKind({"hash-constraints", "--size", "2KiB"}) == ErrorKind::kInvalidArgument);
  assert(FailureKind({"merkleproofs", "--size", "2KiB", "--proofs", "-1"}) == ErrorKind::kInvalidArgument);
  assert(FailureKind({"merkleproofs", "--size", "2KiB", "--validate=maybe"}) == ErrorKind::kInvalidArgument);
  assert(FailureKind({"--verbose", "hash-constraints"}) == ErrorKind::kInvalidArgument);
  assert(FailureKind({"window-post", "stray", "--size", "2KiB"}) == ErrorKind::kInvalidArgument);
}

void TestValueErrors() {
  assert(FailureKind({"window-post", "--size", "lots"}) == ErrorKind::kInvalidSize);
  assert(FailureKind({"winning-post", "--size", "2KiB", "--api-version", "2.0.0"}) == ErrorKind::kInvalidApiVersion);
  assert(FailureKind({"aggregate-proof", "--size", "2KiB", "--api-version", "one"}) == ErrorKind::kInvalidApiVersion);
}

} // namespace

int main() {
  TestWindowPostFlags();
  TestGlobalRuntimeConfig();
  TestMerkleProofDefaultsAndValidate();
  TestAggregateSpellings();
  TestProdbenchFlags();
  TestHelp();
  TestUsageErrors();
  TestValueErrors();

  std::cout << "sealbench_unit_command_line: pass\n";
  return 0;
}
