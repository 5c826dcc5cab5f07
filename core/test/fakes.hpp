#ifndef CORE_TEST_FAKES_HPP
#define CORE_TEST_FAKES_HPP

#include <functional>
#include <string>
#include <vector>

#include "absl/base/thread_annotations.h"
#include "absl/strings/numbers.h"
#include "absl/synchronization/mutex.h"
#include "core/event_queue.hpp"
#include "executor/executor.hpp"
#include "oracle/oracle.hpp"

namespace core {
namespace test {

inline proto::Bundle GoodBundle() {
  proto::Bundle bundle;
  proto::CodeUnit* source = bundle.add_source();
  source->set_name("calc.py");
  source->set_content("def add(a, b):\n    return a + b\n");
  proto::CodeUnit* test = bundle.add_tests();
  test->set_name("tests/test_calc.py");
  test->set_content(
      "from calc import add\n\n\ndef test_add():\n    assert add(1, 2) == 3\n");
  bundle.add_dependencies("pytest");
  return bundle;
}

inline proto::ExecutionResult Passing() {
  proto::ExecutionResult result;
  proto::TestCaseResult* test = result.add_tests();
  test->set_name("tests/test_calc.py::test_add");
  test->set_passed(true);
  test->set_outcome("PASSED");
  result.set_stdout_log("tests/test_calc.py::test_add PASSED\n");
  return result;
}

inline proto::ExecutionResult Failing(const std::string& log = "assert 2 == 3") {
  proto::ExecutionResult result;
  result.set_exit_status(1);
  proto::TestCaseResult* test = result.add_tests();
  test->set_name("tests/test_calc.py::test_add");
  test->set_passed(false);
  test->set_outcome("FAILED");
  result.set_stdout_log("tests/test_calc.py::test_add FAILED\n" + log + "\n");
  return result;
}

inline proto::ExecutionResult Faulted(proto::SandboxFault fault) {
  proto::ExecutionResult result;
  result.set_fault(fault);
  result.set_fault_message(proto::SandboxFault_Name(fault));
  return result;
}

// Agent id and iteration encoded in the environment tag ("agent-1#2").
inline std::string AgentOf(const proto::ExecutionRequest& request) {
  const std::string& tag = request.environment_tag();
  return tag.substr(0, tag.find('#'));
}

inline int IterationOf(const proto::ExecutionRequest& request) {
  const std::string& tag = request.environment_tag();
  int iteration = 0;
  size_t pos = tag.find('#');
  if (pos == std::string::npos ||
      !absl::SimpleAtoi(tag.substr(pos + 1), &iteration)) {
    return -1;
  }
  return iteration;
}

class FunctionOracle : public oracle::Oracle {
 public:
  using Behavior = std::function<proto::Bundle(
      const proto::Task&, const proto::AttemptContext*,
      const util::CancellationToken&)>;

  FunctionOracle()
      : behavior_([](const proto::Task&, const proto::AttemptContext*,
                     const util::CancellationToken&) { return GoodBundle(); }) {
  }
  explicit FunctionOracle(Behavior behavior) : behavior_(std::move(behavior)) {}

  proto::Bundle Generate(const proto::Task& task,
                         const proto::AttemptContext* prior,
                         const util::CancellationToken& token) override {
    {
      absl::MutexLock lck(&mutex_);
      calls_++;
    }
    return behavior_(task, prior, token);
  }

  int Calls() {
    absl::MutexLock lck(&mutex_);
    return calls_;
  }

 private:
  Behavior behavior_;
  absl::Mutex mutex_;
  int calls_ GUARDED_BY(mutex_) = 0;
};

// Sandbox handle whose results come from a function. Keeps track of the
// calls in progress.
class FunctionExecutor : public executor::Executor {
 public:
  using Behavior = std::function<proto::ExecutionResult(
      const proto::ExecutionRequest&, const util::CancellationToken&)>;

  FunctionExecutor() = default;
  explicit FunctionExecutor(Behavior behavior)
      : behavior_(std::move(behavior)) {}
  void SetBehavior(Behavior behavior) { behavior_ = std::move(behavior); }

  std::string Id() const override { return "FAKE"; }

  proto::ExecutionResult Execute(const proto::ExecutionRequest& request,
                                 const util::CancellationToken& token) override {
    {
      absl::MutexLock lck(&mutex_);
      calls_++;
      running_++;
      if (token.IsCancelled()) started_after_cancel_++;
      tags_.push_back(request.environment_tag());
    }
    proto::ExecutionResult result = behavior_(request, token);
    absl::MutexLock lck(&mutex_);
    running_--;
    released_++;
    return result;
  }

  void ForceRelease() override {
    absl::MutexLock lck(&mutex_);
    force_releases_++;
  }

  // Blocks until count calls are in progress at the same time.
  void WaitForRunning(int count) {
    absl::MutexLock lck(&mutex_);
    auto cond = [this, count]() {
      mutex_.AssertHeld();
      return running_ >= count;
    };
    mutex_.Await(absl::Condition(&cond));
  }

  // Blocks until ForceRelease is called.
  void WaitForRelease() {
    absl::MutexLock lck(&mutex_);
    auto cond = [this]() {
      mutex_.AssertHeld();
      return force_releases_ > 0;
    };
    mutex_.Await(absl::Condition(&cond));
  }

  int Calls() {
    absl::MutexLock lck(&mutex_);
    return calls_;
  }
  int Running() {
    absl::MutexLock lck(&mutex_);
    return running_;
  }
  int Released() {
    absl::MutexLock lck(&mutex_);
    return released_;
  }
  int StartedAfterCancel() {
    absl::MutexLock lck(&mutex_);
    return started_after_cancel_;
  }
  int ForceReleases() {
    absl::MutexLock lck(&mutex_);
    return force_releases_;
  }
  std::vector<std::string> Tags() {
    absl::MutexLock lck(&mutex_);
    return tags_;
  }

 private:
  Behavior behavior_ = [](const proto::ExecutionRequest&,
                          const util::CancellationToken&) { return Passing(); };
  absl::Mutex mutex_;
  int calls_ GUARDED_BY(mutex_) = 0;
  int running_ GUARDED_BY(mutex_) = 0;
  int released_ GUARDED_BY(mutex_) = 0;
  int started_after_cancel_ GUARDED_BY(mutex_) = 0;
  int force_releases_ GUARDED_BY(mutex_) = 0;
  std::vector<std::string> tags_ GUARDED_BY(mutex_);
};

// Every event published so far. Stops the queue.
inline std::vector<proto::AgentEvent> DrainEvents(EventQueue* events) {
  events->Stop();
  std::vector<proto::AgentEvent> result;
  while (absl::optional<proto::AgentEvent> event = events->Dequeue()) {
    result.push_back(std::move(*event));
  }
  return result;
}

// Statuses published for one agent, in order.
inline std::vector<proto::CandidateStatus> StatusesOf(
    const std::vector<proto::AgentEvent>& events, const std::string& agent) {
  std::vector<proto::CandidateStatus> result;
  for (const proto::AgentEvent& event : events) {
    if (event.agent().id() == agent) result.push_back(event.status());
  }
  return result;
}

}  // namespace test
}  // namespace core

#endif
