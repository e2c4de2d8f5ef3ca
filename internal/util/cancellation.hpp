#pragma once

#include <atomic>

namespace sealbench::util {

/*
  Cooperative cancellation flag. Set from a signal handler, polled by the
  pipeline between phases only.
*/
class CancellationToken {
 public:
  void Cancel() noexcept {
    cancelled_.store(true, std::memory_order_relaxed);
  }

  bool IsCancelled() const noexcept {
    return cancelled_.load(std::memory_order_relaxed);
  }

 private:
  std::atomic<bool> cancelled_{false};
};

static_assert(std::atomic<bool>::is_always_lock_free);

} // namespace sealbench::util
