#ifndef CORE_OUTCOME_CELL_HPP
#define CORE_OUTCOME_CELL_HPP

#include <atomic>

#include "absl/types/optional.h"
#include "proto/swarm.pb.h"

namespace core {

// Holds the outcome of a race. It can be written only once: the first
// TryCommit wins and every later one is rejected. Readers never observe a
// partially written outcome.
class OutcomeCell {
 public:
  // Returns false, leaving the cell untouched, if an outcome was already
  // committed or is being committed by another thread.
  bool TryCommit(proto::SwarmOutcome outcome);

  bool IsCommitted() const {
    return state_.load(std::memory_order_acquire) == kCommitted;
  }

  // The committed outcome, if any.
  absl::optional<proto::SwarmOutcome> Get() const;

  OutcomeCell() = default;
  OutcomeCell(const OutcomeCell&) = delete;
  OutcomeCell& operator=(const OutcomeCell&) = delete;

 private:
  enum State { kUnset, kWriting, kCommitted };
  std::atomic<int> state_{kUnset};
  proto::SwarmOutcome outcome_;
};

}  // namespace core

#endif
