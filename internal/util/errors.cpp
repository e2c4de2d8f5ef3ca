#include "errors.hpp"

#include <new>
#include <system_error>

namespace sealbench::util {

std::string_view ErrorKindName(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kOk:
      return "Ok";
    case ErrorKind::kInvalidArgument:
      return "InvalidArgument";
    case ErrorKind::kInvalidSize:
      return "InvalidSize";
    case ErrorKind::kInvalidApiVersion:
      return "InvalidApiVersion";
    case ErrorKind::kIncompatibleCache:
      return "IncompatibleCache";
    case ErrorKind::kMissingPrerequisite:
      return "MissingPrerequisite";
    case ErrorKind::kProofEngineFailure:
      return "ProofEngineFailure";
    case ErrorKind::kProofValidationFailed:
      return "ProofValidationFailed";
    case ErrorKind::kResumeMismatch:
      return "ResumeMismatch";
    case ErrorKind::kEmptyAggregateBatch:
      return "EmptyAggregateBatch";
    case ErrorKind::kMalformedInputDocument:
      return "MalformedInputDocument";
    case ErrorKind::kCancelled:
      return "Cancelled";
    case ErrorKind::kCacheIo:
      return "CacheIo";
    case ErrorKind::kResourceExhausted:
      return "ResourceExhausted";
  }
  return "Unknown";
}

ErrorKind KindOf(const std::exception& e) {
  if (const auto* bench = dynamic_cast<const BenchError*>(&e)) {
    return bench->kind();
  }
  if (dynamic_cast<const std::system_error*>(&e) != nullptr) {
    return ErrorKind::kCacheIo;
  }
  if (dynamic_cast<const std::bad_alloc*>(&e) != nullptr) {
    return ErrorKind::kResourceExhausted;
  }
  return ErrorKind::kProofEngineFailure;
}

void Throw(ErrorKind kind, const std::string& msg) {
  switch (kind) {
    case ErrorKind::kInvalidArgument:
      throw InvalidArgument(msg);
    case ErrorKind::kInvalidSize:
      throw InvalidSize(msg);
    case ErrorKind::kInvalidApiVersion:
      throw InvalidApiVersion(msg);
    case ErrorKind::kIncompatibleCache:
      throw IncompatibleCache(msg);
    case ErrorKind::kMissingPrerequisite:
      throw MissingPrerequisite(msg);
    case ErrorKind::kProofEngineFailure:
      throw ProofEngineFailure(msg);
    case ErrorKind::kProofValidationFailed:
      throw ProofValidationFailed(msg);
    case ErrorKind::kEmptyAggregateBatch:
      throw EmptyAggregateBatch(msg);
    case ErrorKind::kMalformedInputDocument:
      throw MalformedInputDocument(msg);
    case ErrorKind::kCancelled:
      throw Cancelled(msg);
    case ErrorKind::kCacheIo:
      throw CacheIo(msg);
    case ErrorKind::kResourceExhausted:
      throw ResourceExhausted(msg);
    case ErrorKind::kResumeMismatch:
      throw ResumeMismatch(msg, {}, {});
    case ErrorKind::kOk:
      break;
  }
  throw BenchError(kind, msg);
}

} // namespace sealbench::util
