#pragma once

#include <string>

#include "internal/util/errors.hpp"

namespace sealbench::util {

/*
  Status value for operations whose failure must travel together with
  accumulated output instead of unwinding it away.
*/
struct Result {
  ErrorKind   code = ErrorKind::kOk;
  std::string message;

  static Result Ok() {
    return {};
  }

  static Result Err(ErrorKind c, std::string msg = {}) {
    return {c, std::move(msg)};
  }

  explicit operator bool() const {
    return code == ErrorKind::kOk;
  }
};

} // namespace sealbench::util
