#ifndef CORE_EVENT_QUEUE_HPP
#define CORE_EVENT_QUEUE_HPP

#include <queue>
#include <string>

#include "absl/base/thread_annotations.h"
#include "absl/synchronization/mutex.h"
#include "absl/types/optional.h"
#include "proto/swarm.pb.h"

namespace core {

// Stream of the state transitions of every agent, for logging and
// monitoring only.
class EventQueue {
 public:
  void Drafting(const proto::AgentIdentity& agent, int32_t iteration) {
    Publish(agent, proto::CandidateStatus::DRAFTING, iteration);
  }
  void Testing(const proto::AgentIdentity& agent, int32_t iteration) {
    Publish(agent, proto::CandidateStatus::TESTING, iteration);
  }
  void Executing(const proto::AgentIdentity& agent, int32_t iteration) {
    Publish(agent, proto::CandidateStatus::EXECUTING, iteration);
  }
  void Passed(const proto::AgentIdentity& agent, int32_t iteration) {
    Publish(agent, proto::CandidateStatus::PASSED, iteration);
  }
  void Failed(const proto::AgentIdentity& agent, int32_t iteration,
              const std::string& reason) {
    Publish(agent, proto::CandidateStatus::FAILED, iteration, reason);
  }
  void Exhausted(const proto::AgentIdentity& agent, int32_t iteration,
                 const std::string& reason) {
    Publish(agent, proto::CandidateStatus::EXHAUSTED, iteration, reason);
  }
  void Cancelled(const proto::AgentIdentity& agent, int32_t iteration,
                 const std::string& reason = "") {
    Publish(agent, proto::CandidateStatus::CANCELLED, iteration, reason);
  }

  void Enqueue(proto::AgentEvent&& event);

  // Blocks until an event is available. Returns an empty optional once the
  // queue is stopped and every event was consumed.
  absl::optional<proto::AgentEvent> Dequeue();
  void Stop();

 private:
  void Publish(const proto::AgentIdentity& agent,
               proto::CandidateStatus status, int32_t iteration,
               const std::string& message = "");

  absl::Mutex queue_mutex_;
  std::queue<proto::AgentEvent> queue_ GUARDED_BY(queue_mutex_);
  bool stopped_ GUARDED_BY(queue_mutex_) = false;
};

}  // namespace core

#endif
