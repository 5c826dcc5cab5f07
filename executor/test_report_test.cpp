#include "executor/test_report.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace {

using ::testing::IsEmpty;

const char* kVerboseOutput = R"(============ test session starts ============
platform linux -- Python 3.11.4, pytest-7.4.0
collecting ... collected 4 items

tests/test_calc.py::test_add PASSED                                 [ 25%]
tests/test_calc.py::test_sub FAILED                                 [ 50%]
tests/test_calc.py::TestDiv::test_zero SKIPPED (no reason)          [ 75%]
tests/test_calc.py::test_mul[2-4] XFAIL                             [100%]

================= FAILURES ==================
_________________ test_sub __________________
    def test_sub():
>       assert sub(3, 1) == 1
E       assert 2 == 1
========= short test summary info ===========
FAILED tests/test_calc.py::test_sub - assert 2 == 1
======= 1 failed, 1 passed, 1 skipped, 1 xfailed in 0.12s =======
)";

// NOLINTNEXTLINE
TEST(TestReport, ParsesVerboseOutput) {
  auto tests = executor::ParseTestReport(kVerboseOutput);
  ASSERT_EQ(tests.size(), 4u);
  EXPECT_EQ(tests[0].name(), "tests/test_calc.py::test_add");
  EXPECT_TRUE(tests[0].passed());
  EXPECT_EQ(tests[1].name(), "tests/test_calc.py::test_sub");
  EXPECT_FALSE(tests[1].passed());
  EXPECT_EQ(tests[1].outcome(), "FAILED");
  EXPECT_EQ(tests[2].name(), "tests/test_calc.py::TestDiv::test_zero");
  EXPECT_EQ(tests[2].outcome(), "SKIPPED");
  EXPECT_FALSE(tests[2].passed());
  EXPECT_EQ(tests[3].outcome(), "XFAIL");
  EXPECT_FALSE(tests[3].passed());
}

// NOLINTNEXTLINE
TEST(TestReport, ParsesCollectionErrors) {
  auto tests = executor::ParseTestReport(
      "==== short test summary info ====\n"
      "ERROR tests/test_app.py - ModuleNotFoundError: No module named 'app'\n"
      "!!!! Interrupted: 1 error during collection !!!!\n");
  ASSERT_EQ(tests.size(), 1u);
  EXPECT_EQ(tests[0].name(), "tests/test_app.py");
  EXPECT_EQ(tests[0].outcome(), "ERROR");
  EXPECT_FALSE(tests[0].passed());
}

// NOLINTNEXTLINE
TEST(TestReport, IgnoresOtherLines) {
  EXPECT_THAT(executor::ParseTestReport("PASSED\nall tests FAILED badly\n\n"),
              IsEmpty());
}

// NOLINTNEXTLINE
TEST(TestReport, AllTestsPassed) {
  proto::ExecutionResult result;
  result.add_tests()->set_passed(true);
  EXPECT_TRUE(executor::AllTestsPassed(result));
}

// NOLINTNEXTLINE
TEST(TestReport, EmptyReportFails) {
  proto::ExecutionResult result;
  EXPECT_FALSE(executor::AllTestsPassed(result));
}

// NOLINTNEXTLINE
TEST(TestReport, SkippedOnlyFails) {
  proto::ExecutionResult result;
  for (proto::TestCaseResult& test : executor::ParseTestReport(
           "tests/test_calc.py::test_add SKIPPED (no impl) [100%]\n")) {
    *result.add_tests() = test;
  }
  ASSERT_EQ(result.tests_size(), 1);
  EXPECT_FALSE(executor::AllTestsPassed(result));
}

// NOLINTNEXTLINE
TEST(TestReport, ExpectedFailureIsNotAPass) {
  proto::ExecutionResult result;
  for (proto::TestCaseResult& test : executor::ParseTestReport(
           "tests/test_calc.py::test_add PASSED\n"
           "tests/test_calc.py::test_div XFAIL\n"
           "tests/test_calc.py::test_mul XPASS\n")) {
    *result.add_tests() = test;
  }
  ASSERT_EQ(result.tests_size(), 3);
  EXPECT_TRUE(result.tests(2).passed());
  EXPECT_FALSE(executor::AllTestsPassed(result));
}

// NOLINTNEXTLINE
TEST(TestReport, FailedTestFails) {
  proto::ExecutionResult result;
  result.add_tests()->set_passed(true);
  result.add_tests()->set_passed(false);
  EXPECT_FALSE(executor::AllTestsPassed(result));
}

// NOLINTNEXTLINE
TEST(TestReport, NonZeroExitFails) {
  proto::ExecutionResult result;
  result.set_exit_status(5);
  EXPECT_FALSE(executor::AllTestsPassed(result));
}

// NOLINTNEXTLINE
TEST(TestReport, FaultFails) {
  proto::ExecutionResult result;
  result.set_fault(proto::SandboxFault::TIMEOUT);
  EXPECT_FALSE(executor::AllTestsPassed(result));
}

}  // namespace
