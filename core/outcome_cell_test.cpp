#include "core/outcome_cell.hpp"

#include <atomic>
#include <thread>
#include <vector>

#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace {

proto::SwarmOutcome Winner(const std::string& agent) {
  proto::SwarmOutcome outcome;
  outcome.mutable_winner()->mutable_agent()->set_id(agent);
  return outcome;
}

// NOLINTNEXTLINE
TEST(OutcomeCell, StartsUnset) {
  core::OutcomeCell cell;
  EXPECT_FALSE(cell.IsCommitted());
  EXPECT_FALSE(cell.Get());
}

// NOLINTNEXTLINE
TEST(OutcomeCell, SecondCommitIsRejected) {
  core::OutcomeCell cell;
  EXPECT_TRUE(cell.TryCommit(Winner("agent-1")));
  proto::SwarmOutcome aborted;
  aborted.mutable_aborted()->set_reason(proto::AbortReason::RACE_TIMEOUT);
  EXPECT_FALSE(cell.TryCommit(aborted));
  EXPECT_FALSE(cell.TryCommit(Winner("agent-2")));
  ASSERT_TRUE(cell.Get());
  EXPECT_EQ(cell.Get()->winner().agent().id(), "agent-1");
}

// NOLINTNEXTLINE
TEST(OutcomeCell, ConcurrentCommitsHaveOneWinner) {
  for (int round = 0; round < 100; round++) {
    core::OutcomeCell cell;
    std::atomic<bool> go{false};
    std::atomic<int> accepted{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 2; i++) {
      threads.emplace_back([&, i]() {
        while (!go) {
        }
        if (cell.TryCommit(Winner("agent-" + std::to_string(i)))) accepted++;
      });
    }
    go = true;
    for (std::thread& thread : threads) thread.join();
    EXPECT_EQ(accepted, 1);
    ASSERT_TRUE(cell.IsCommitted());
    EXPECT_THAT(cell.Get()->winner().agent().id(),
                ::testing::AnyOf("agent-0", "agent-1"));
  }
}

}  // namespace
