#include "core/event_queue.hpp"

#include <thread>

#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace {

proto::AgentIdentity Agent(const std::string& id) {
  proto::AgentIdentity agent;
  agent.set_id(id);
  return agent;
}

// NOLINTNEXTLINE
TEST(EventQueue, TypedEvents) {
  core::EventQueue queue;
  queue.Drafting(Agent("agent-1"), 0);
  queue.Failed(Agent("agent-1"), 1, "assert 2 == 3");
  queue.Stop();

  auto event = queue.Dequeue();
  ASSERT_TRUE(event);
  EXPECT_EQ(event->agent().id(), "agent-1");
  EXPECT_EQ(event->status(), proto::CandidateStatus::DRAFTING);
  EXPECT_GT(event->timestamp_millis(), 0);

  event = queue.Dequeue();
  ASSERT_TRUE(event);
  EXPECT_EQ(event->status(), proto::CandidateStatus::FAILED);
  EXPECT_EQ(event->iteration(), 1);
  EXPECT_EQ(event->message(), "assert 2 == 3");

  EXPECT_FALSE(queue.Dequeue());
}

// NOLINTNEXTLINE
TEST(EventQueue, DequeueWaitsForEvents) {
  core::EventQueue queue;
  std::thread producer([&queue]() {
    queue.Passed(Agent("agent-2"), 2);
    queue.Stop();
  });
  auto event = queue.Dequeue();
  ASSERT_TRUE(event);
  EXPECT_EQ(event->status(), proto::CandidateStatus::PASSED);
  EXPECT_FALSE(queue.Dequeue());
  producer.join();
}

}  // namespace
