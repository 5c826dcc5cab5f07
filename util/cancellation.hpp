#ifndef UTIL_CANCELLATION_HPP
#define UTIL_CANCELLATION_HPP

#include <atomic>

#include "absl/base/thread_annotations.h"
#include "absl/synchronization/mutex.h"
#include "absl/time/time.h"

namespace util {

// One-way flag shared by everybody taking part in a race. Once cancelled it
// stays cancelled.
class CancellationToken {
 public:
  void Cancel();
  bool IsCancelled() const { return cancelled_.load(std::memory_order_acquire); }

  // Blocks until the token is cancelled or the timeout expires. Returns
  // whether the token is cancelled.
  bool WaitFor(absl::Duration timeout) const;

  CancellationToken() = default;
  CancellationToken(const CancellationToken&) = delete;
  CancellationToken& operator=(const CancellationToken&) = delete;

 private:
  mutable absl::Mutex mutex_;
  bool signalled_ GUARDED_BY(mutex_) = false;
  std::atomic<bool> cancelled_{false};
};

}  // namespace util

#endif
