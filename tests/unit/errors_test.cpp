#include "internal/util/errors.hpp"

#include <cassert>
#include <filesystem>
#include <iostream>
#include <new>
#include <stdexcept>
#include <string>
#include <system_error>

#include "internal/util/result.hpp"

namespace {

using sealbench::util::ErrorKind;

void TestKindOfBenchErrors() {
  assert(sealbench::util::KindOf(sealbench::util::InvalidSize("x")) == ErrorKind::kInvalidSize);
  assert(sealbench::util::KindOf(sealbench::util::CacheIo("x")) == ErrorKind::kCacheIo);
  assert(sealbench::util::KindOf(sealbench::util::ResumeMismatch("x", "a", "b")) == ErrorKind::kResumeMismatch);
}

void TestForeignExceptionsAreEngineFailures() {
  assert(sealbench::util::KindOf(std::runtime_error("boom")) == ErrorKind::kProofEngineFailure);
  assert(sealbench::util::KindOf(std::invalid_argument("bad layers")) == ErrorKind::kProofEngineFailure);
}

void TestSystemFailuresKeepTheirOwnKind() {
  const std::filesystem::filesystem_error missing("rename", std::make_error_code(std::errc::no_such_file_or_directory));
  assert(sealbench::util::KindOf(missing) == ErrorKind::kCacheIo);
  assert(sealbench::util::KindOf(std::system_error(std::make_error_code(std::errc::resource_unavailable_try_again)))
         == ErrorKind::kCacheIo);
  assert(sealbench::util::KindOf(std::bad_alloc()) == ErrorKind::kResourceExhausted);
  assert(sealbench::util::KindOf(std::bad_array_new_length()) == ErrorKind::kResourceExhausted);
  assert(sealbench::util::ErrorKindName(ErrorKind::kResourceExhausted) == "ResourceExhausted");
}

void TestThrowRaisesMatchingSubclass() {
  const ErrorKind kinds[] = {
      ErrorKind::kInvalidArgument,
      ErrorKind::kInvalidSize,
      ErrorKind::kInvalidApiVersion,
      ErrorKind::kIncompatibleCache,
      ErrorKind::kMissingPrerequisite,
      ErrorKind::kProofEngineFailure,
      ErrorKind::kProofValidationFailed,
      ErrorKind::kResumeMismatch,
      ErrorKind::kEmptyAggregateBatch,
      ErrorKind::kMalformedInputDocument,
      ErrorKind::kCancelled,
      ErrorKind::kCacheIo,
      ErrorKind::kResourceExhausted,
  };

  for (auto kind : kinds) {
    bool caught = false;
    try {
      sealbench::util::Throw(kind, "message");
    } catch (const sealbench::util::BenchError& e) {
      caught = true;
      assert(e.kind() == kind);
      assert(std::string(e.what()) == "message");
    }
    assert(caught);
    assert(sealbench::util::ErrorKindName(kind) != "Unknown");
  }
}

void TestValidationFailureCarriesIndex() {
  sealbench::util::ProofValidationFailed with_index("proof 7", 7);
  assert(with_index.index().has_value());
  assert(*with_index.index() == 7);

  sealbench::util::ProofValidationFailed without_index("seal");
  assert(!without_index.index().has_value());
}

void TestResultStatus() {
  auto ok = sealbench::util::Result::Ok();
  assert(static_cast<bool>(ok));

  auto failed = sealbench::util::Result::Err(ErrorKind::kCancelled, "stop");
  assert(!failed);
  assert(failed.code == ErrorKind::kCancelled);
  assert(failed.message == "stop");
}

} // namespace

int main() {
  TestKindOfBenchErrors();
  TestForeignExceptionsAreEngineFailures();
  TestSystemFailuresKeepTheirOwnKind();
  TestThrowRaisesMatchingSubclass();
  TestValidationFailureCarriesIndex();
  TestResultStatus();

  std::cout << "sealbench_unit_errors: pass\n";
  return 0;
}
