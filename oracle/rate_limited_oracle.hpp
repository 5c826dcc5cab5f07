#ifndef ORACLE_RATE_LIMITED_ORACLE_HPP
#define ORACLE_RATE_LIMITED_ORACLE_HPP

#include <memory>

#include "absl/base/thread_annotations.h"
#include "absl/synchronization/mutex.h"
#include "oracle/oracle.hpp"

namespace oracle {

// Lets at most max_concurrent requests reach the wrapped oracle; the others
// wait for a slot, or give up when their token is cancelled.
class RateLimitedOracle : public Oracle {
 public:
  RateLimitedOracle(std::shared_ptr<Oracle> inner, int max_concurrent);

  proto::Bundle Generate(const proto::Task& task,
                         const proto::AttemptContext* prior,
                         const util::CancellationToken& token) override;

  int InFlight() const;

 private:
  class SlotGuard {
   public:
    SlotGuard(RateLimitedOracle* owner, const util::CancellationToken& token);
    ~SlotGuard();
    SlotGuard(const SlotGuard&) = delete;
    SlotGuard& operator=(const SlotGuard&) = delete;

   private:
    RateLimitedOracle* owner_;
  };

  std::shared_ptr<Oracle> inner_;
  const int max_concurrent_;
  mutable absl::Mutex mutex_;
  int in_flight_ GUARDED_BY(mutex_) = 0;
};

}  // namespace oracle

#endif
