#pragma once

#include <atomic>

namespace roster::util {

/*
  Cooperative cancellation flag.

  Set from a signal handler or another thread, polled by long
  running loops between units of work. Never reset once set.
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

} // namespace roster::util
