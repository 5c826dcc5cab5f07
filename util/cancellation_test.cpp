#include "util/cancellation.hpp"

#include <thread>

#include "absl/time/clock.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace {

// NOLINTNEXTLINE
TEST(CancellationToken, StartsClear) {
  util::CancellationToken token;
  EXPECT_FALSE(token.IsCancelled());
  EXPECT_FALSE(token.WaitFor(absl::Milliseconds(10)));
}

// NOLINTNEXTLINE
TEST(CancellationToken, StaysCancelled) {
  util::CancellationToken token;
  token.Cancel();
  token.Cancel();
  EXPECT_TRUE(token.IsCancelled());
  EXPECT_TRUE(token.WaitFor(absl::ZeroDuration()));
}

// NOLINTNEXTLINE
TEST(CancellationToken, WakesWaiters) {
  util::CancellationToken token;
  std::thread canceller([&token]() {
    absl::SleepFor(absl::Milliseconds(50));
    token.Cancel();
  });
  EXPECT_TRUE(token.WaitFor(absl::Seconds(10)));
  canceller.join();
}

}  // namespace
