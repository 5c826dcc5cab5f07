#include "core/event_queue.hpp"

#include "util/misc.hpp"

namespace core {

void EventQueue::Publish(const proto::AgentIdentity& agent,
                         proto::CandidateStatus status, int32_t iteration,
                         const std::string& message) {
  proto::AgentEvent event;
  *event.mutable_agent() = agent;
  event.set_status(status);
  event.set_iteration(iteration);
  event.set_message(message);
  event.set_timestamp_millis(util::now_millis());
  Enqueue(std::move(event));
}

void EventQueue::Enqueue(proto::AgentEvent&& event) {
  absl::MutexLock lck(&queue_mutex_);
  queue_.push(std::move(event));
}

absl::optional<proto::AgentEvent> EventQueue::Dequeue() {
  absl::MutexLock lck(&queue_mutex_);
  auto cond = [this]() {
    queue_mutex_.AssertHeld();
    return stopped_ || !queue_.empty();
  };
  queue_mutex_.Await(absl::Condition(&cond));
  if (queue_.empty()) return {};
  absl::optional<proto::AgentEvent> event = std::move(queue_.front());
  queue_.pop();
  return event;
}

void EventQueue::Stop() {
  absl::MutexLock lck(&queue_mutex_);
  stopped_ = true;
}

}  // namespace core
