#ifndef EXECUTOR_TEST_REPORT_HPP
#define EXECUTOR_TEST_REPORT_HPP

#include <string>
#include <vector>

#include "proto/swarm.pb.h"

namespace executor {

// Extracts the per-test outcomes from the verbose output of the test runner.
// Both the progress lines ("tests/test_a.py::test_b PASSED [ 50%]") and the
// summary lines ("FAILED tests/test_a.py::test_b - assert 0") are understood;
// every test is reported once, in order of first appearance.
std::vector<proto::TestCaseResult> ParseTestReport(const std::string& output);

// True if the tests ran without faults, the test command succeeded, at least
// one test was reported and every reported test passed. Skipped and expected
// failures are not passes.
bool AllTestsPassed(const proto::ExecutionResult& result);

}  // namespace executor

#endif
