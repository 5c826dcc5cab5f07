#include "oracle/rate_limited_oracle.hpp"

#include <atomic>
#include <memory>
#include <thread>
#include <vector>

#include "absl/time/clock.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace {

// Takes some time to answer, and remembers how many calls overlapped.
class SlowOracle : public oracle::Oracle {
 public:
  proto::Bundle Generate(const proto::Task& /*task*/,
                         const proto::AttemptContext* /*prior*/,
                         const util::CancellationToken& /*token*/) override {
    int now = ++running_;
    int seen = max_running_.load();
    while (now > seen && !max_running_.compare_exchange_weak(seen, now)) {
    }
    absl::SleepFor(absl::Milliseconds(50));
    --running_;
    calls_++;
    return proto::Bundle();
  }
  int MaxRunning() const { return max_running_; }
  int Calls() const { return calls_; }

 private:
  std::atomic<int> running_{0};
  std::atomic<int> max_running_{0};
  std::atomic<int> calls_{0};
};

// NOLINTNEXTLINE
TEST(RateLimitedOracle, LimitsConcurrency) {
  auto inner = std::make_shared<SlowOracle>();
  oracle::RateLimitedOracle limited(inner, 2);
  util::CancellationToken token;
  proto::Task task;
  std::vector<std::thread> threads;
  for (int i = 0; i < 6; i++) {
    threads.emplace_back(
        [&limited, &task, &token]() { limited.Generate(task, nullptr, token); });
  }
  for (std::thread& thread : threads) thread.join();
  EXPECT_EQ(inner->Calls(), 6);
  EXPECT_LE(inner->MaxRunning(), 2);
  EXPECT_EQ(limited.InFlight(), 0);
}

// NOLINTNEXTLINE
TEST(RateLimitedOracle, CancelledWhileQueued) {
  util::CancellationToken blocker_token;
  util::CancellationToken token;
  proto::Task task;

  // Keep the only slot busy for a while.
  class BlockingOracle : public oracle::Oracle {
   public:
    proto::Bundle Generate(const proto::Task&, const proto::AttemptContext*,
                           const util::CancellationToken& token) override {
      token.WaitFor(absl::Seconds(10));
      return proto::Bundle();
    }
  };
  oracle::RateLimitedOracle shared(std::make_shared<BlockingOracle>(), 1);
  std::thread holder([&shared, &task, &blocker_token]() {
    shared.Generate(task, nullptr, blocker_token);
  });
  while (shared.InFlight() == 0) absl::SleepFor(absl::Milliseconds(5));

  std::thread canceller([&token]() {
    absl::SleepFor(absl::Milliseconds(100));
    token.Cancel();
  });
  EXPECT_THROW(shared.Generate(task, nullptr, token),  // NOLINT
               oracle::generation_cancelled);
  canceller.join();
  blocker_token.Cancel();
  holder.join();
  EXPECT_EQ(shared.InFlight(), 0);
}

// NOLINTNEXTLINE
TEST(RateLimitedOracle, AlreadyCancelled) {
  auto inner = std::make_shared<SlowOracle>();
  oracle::RateLimitedOracle limited(inner, 1);
  util::CancellationToken token;
  token.Cancel();
  EXPECT_THROW(limited.Generate(proto::Task(), nullptr, token),  // NOLINT
               oracle::generation_cancelled);
  EXPECT_EQ(inner->Calls(), 0);
}

}  // namespace
