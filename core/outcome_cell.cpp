#include "core/outcome_cell.hpp"

#include "glog/logging.h"

namespace core {

bool OutcomeCell::TryCommit(proto::SwarmOutcome outcome) {
  CHECK_NE(outcome.result_case(), proto::SwarmOutcome::RESULT_NOT_SET)
      << "Empty outcome";
  int expected = kUnset;
  if (!state_.compare_exchange_strong(expected, kWriting,
                                      std::memory_order_acq_rel)) {
    return false;
  }
  outcome_ = std::move(outcome);
  state_.store(kCommitted, std::memory_order_release);
  return true;
}

absl::optional<proto::SwarmOutcome> OutcomeCell::Get() const {
  if (!IsCommitted()) return {};
  return outcome_;
}

}  // namespace core
