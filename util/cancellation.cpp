#include "util/cancellation.hpp"

namespace util {

void CancellationToken::Cancel() {
  absl::MutexLock lck(&mutex_);
  signalled_ = true;
  cancelled_.store(true, std::memory_order_release);
}

bool CancellationToken::WaitFor(absl::Duration timeout) const {
  absl::MutexLock lck(&mutex_);
  mutex_.AwaitWithTimeout(absl::Condition(&signalled_), timeout);
  return signalled_;
}

}  // namespace util
