#ifndef CORE_AGENT_HPP
#define CORE_AGENT_HPP

#include <cstdint>
#include <memory>
#include <string>

#include "core/event_queue.hpp"
#include "executor/executor.hpp"
#include "oracle/oracle.hpp"
#include "proto/swarm.pb.h"
#include "util/cancellation.hpp"

namespace core {

struct AgentConfig {
  int32_t max_iterations = 5;
  int32_t max_sandbox_faults = 3;
  int32_t max_generation_retries = 3;
  int32_t max_structural_defects = 5;
  int64_t sandbox_timeout_millis = 0;

  static AgentConfig FromFlags();

  // Returns false and sets reason if some limit is not positive.
  bool Validate(std::string* reason) const;
};

// How an agent stopped.
struct AgentReport {
  enum class Kind { PASSED, EXHAUSTED, CANCELLED, FATAL };
  Kind kind = Kind::FATAL;
  proto::AgentIdentity agent;
  proto::Candidate candidate;
  std::string message;
  // Only meaningful for FATAL reports.
  proto::AbortReason fatal_reason = proto::AbortReason::INTERNAL_ERROR;
};

// Size of the failure log handed back to the oracle.
static const constexpr size_t kFailureLogBytes = 2500;

// One generate -> validate -> execute loop, improving a single candidate
// until it passes its tests or runs out of budget.
class Agent {
 public:
  // The agent shares ownership of its collaborators, so that it can finish
  // a call that ignores cancellation after the race has moved on. events may
  // be null.
  Agent(proto::AgentIdentity identity, proto::Task task, AgentConfig config,
        std::shared_ptr<oracle::Oracle> oracle,
        std::shared_ptr<executor::Executor> executor,
        std::shared_ptr<EventQueue> events);

  // Runs the loop to completion on the calling thread. The token is checked
  // before and after every oracle and sandbox call. Errors are folded into
  // the report; the only exceptions that can escape are bugs.
  // A passing candidate is reported but not published as PASSED: only the
  // commit of the win makes it one.
  AgentReport Run(const util::CancellationToken& token);

  const proto::AgentIdentity& Identity() const { return identity_; }

  Agent(const Agent&) = delete;
  Agent& operator=(const Agent&) = delete;

 private:
  // Asks the oracle for a bundle, retrying generation faults. Returns false
  // if every attempt failed, setting error.
  bool Draft(const util::CancellationToken& token, proto::Bundle* bundle,
             std::string* error);

  void SetStatus(proto::CandidateStatus status, const std::string& message);
  void Retry(const std::string& kind, const std::string& log,
             const proto::Bundle& bundle);
  AgentReport Finish(AgentReport::Kind kind, const std::string& message);

  proto::AgentIdentity identity_;
  proto::Task task_;
  AgentConfig config_;
  std::shared_ptr<oracle::Oracle> oracle_;
  std::shared_ptr<executor::Executor> executor_;
  std::shared_ptr<EventQueue> events_;

  proto::Candidate candidate_;
  proto::AttemptContext prior_;
  bool has_prior_ = false;
};

}  // namespace core

#endif
