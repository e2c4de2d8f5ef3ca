#pragma once

#include <cstdint>
#include <exception>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace sealbench::util {

/*
  Central error types.

  Every failure the harness reports maps to exactly one ErrorKind. The CLI
  turns the kind into a log line and a non-zero exit status.
*/

enum class ErrorKind {
  kOk = 0,

  kInvalidArgument,
  kInvalidSize,
  kInvalidApiVersion,
  kIncompatibleCache,
  kMissingPrerequisite,
  kProofEngineFailure,
  kProofValidationFailed,
  kResumeMismatch,
  kEmptyAggregateBatch,
  kMalformedInputDocument,
  kCancelled,
  kCacheIo,
  kResourceExhausted,
};

std::string_view ErrorKindName(ErrorKind kind);

class BenchError : public std::runtime_error {
 public:
  BenchError(ErrorKind kind, const std::string& msg) : std::runtime_error(msg), kind_(kind) {
  }

  ErrorKind kind() const noexcept {
    return kind_;
  }

 private:
  ErrorKind kind_;
};

class InvalidArgument : public BenchError {
 public:
  explicit InvalidArgument(const std::string& msg) : BenchError(ErrorKind::kInvalidArgument, msg) {
  }
};

class InvalidSize : public BenchError {
 public:
  explicit InvalidSize(const std::string& msg) : BenchError(ErrorKind::kInvalidSize, msg) {
  }
};

class InvalidApiVersion : public BenchError {
 public:
  explicit InvalidApiVersion(const std::string& msg) : BenchError(ErrorKind::kInvalidApiVersion, msg) {
  }
};

class IncompatibleCache : public BenchError {
 public:
  explicit IncompatibleCache(const std::string& msg) : BenchError(ErrorKind::kIncompatibleCache, msg) {
  }
};

class MissingPrerequisite : public BenchError {
 public:
  explicit MissingPrerequisite(const std::string& msg) : BenchError(ErrorKind::kMissingPrerequisite, msg) {
  }
};

class ProofEngineFailure : public BenchError {
 public:
  explicit ProofEngineFailure(const std::string& msg) : BenchError(ErrorKind::kProofEngineFailure, msg) {
  }
};

/*
  A proof was produced but did not verify. Index is set when the failing
  proof is one of a batch (merkle benchmark).
*/
class ProofValidationFailed : public BenchError {
 public:
  explicit ProofValidationFailed(const std::string& msg, std::optional<std::uint64_t> index = std::nullopt)
      : BenchError(ErrorKind::kProofValidationFailed, msg), index_(index) {
  }

  std::optional<std::uint64_t> index() const noexcept {
    return index_;
  }

 private:
  std::optional<std::uint64_t> index_;
};

class ResumeMismatch : public BenchError {
 public:
  ResumeMismatch(const std::string& msg, std::string baseline_artifact, std::string resumed_artifact)
      : BenchError(ErrorKind::kResumeMismatch, msg),
        baseline_artifact_(std::move(baseline_artifact)),
        resumed_artifact_(std::move(resumed_artifact)) {
  }

  const std::string& baseline_artifact() const noexcept {
    return baseline_artifact_;
  }

  const std::string& resumed_artifact() const noexcept {
    return resumed_artifact_;
  }

 private:
  std::string baseline_artifact_;
  std::string resumed_artifact_;
};

class EmptyAggregateBatch : public BenchError {
 public:
  explicit EmptyAggregateBatch(const std::string& msg) : BenchError(ErrorKind::kEmptyAggregateBatch, msg) {
  }
};

class MalformedInputDocument : public BenchError {
 public:
  explicit MalformedInputDocument(const std::string& msg) : BenchError(ErrorKind::kMalformedInputDocument, msg) {
  }
};

class Cancelled : public BenchError {
 public:
  explicit Cancelled(const std::string& msg) : BenchError(ErrorKind::kCancelled, msg) {
  }
};

class CacheIo : public BenchError {
 public:
  explicit CacheIo(const std::string& msg) : BenchError(ErrorKind::kCacheIo, msg) {
  }
};

class ResourceExhausted : public BenchError {
 public:
  explicit ResourceExhausted(const std::string& msg) : BenchError(ErrorKind::kResourceExhausted, msg) {
  }
};

/*
  Classifies any exception. Outside BenchError, a std::system_error (which
  covers filesystem and stream failures) is CacheIo and std::bad_alloc is
  ResourceExhausted. Everything else came out of a collaborator we do not
  interpret and is reported as an engine failure.
*/
ErrorKind KindOf(const std::exception& e);

/*
  Throws the BenchError subclass matching kind.
*/
[[noreturn]] void Throw(ErrorKind kind, const std::string& msg);

} // namespace sealbench::util
