#include "oracle/rate_limited_oracle.hpp"

#include "glog/logging.h"

namespace {
const absl::Duration kCancellationPoll = absl::Milliseconds(50);
}  // namespace

namespace oracle {

RateLimitedOracle::RateLimitedOracle(std::shared_ptr<Oracle> inner,
                                     int max_concurrent)
    : inner_(std::move(inner)), max_concurrent_(max_concurrent) {
  CHECK(inner_ != nullptr);
  CHECK_GT(max_concurrent_, 0);
}

RateLimitedOracle::SlotGuard::SlotGuard(RateLimitedOracle* owner,
                                        const util::CancellationToken& token)
    : owner_(owner) {
  absl::MutexLock lck(&owner_->mutex_);
  auto slot_free = [this]() {
    owner_->mutex_.AssertHeld();
    return owner_->in_flight_ < owner_->max_concurrent_;
  };
  while (!owner_->mutex_.AwaitWithTimeout(absl::Condition(&slot_free),
                                          kCancellationPoll)) {
    if (token.IsCancelled()) {
      throw generation_cancelled("Cancelled while waiting for the oracle");
    }
  }
  owner_->in_flight_++;
}

RateLimitedOracle::SlotGuard::~SlotGuard() {
  absl::MutexLock lck(&owner_->mutex_);
  owner_->in_flight_--;
}

proto::Bundle RateLimitedOracle::Generate(
    const proto::Task& task, const proto::AttemptContext* prior,
    const util::CancellationToken& token) {
  if (token.IsCancelled()) throw generation_cancelled("Cancelled");
  SlotGuard guard(this, token);
  if (token.IsCancelled()) throw generation_cancelled("Cancelled");
  return inner_->Generate(task, prior, token);
}

int RateLimitedOracle::InFlight() const {
  absl::MutexLock lck(&mutex_);
  return in_flight_;
}

}  // namespace oracle
