#include "core/agent.hpp"

#include "absl/strings/str_cat.h"
#include "core/validator.hpp"
#include "executor/test_report.hpp"
#include "glog/logging.h"
#include "util/flags.hpp"
#include "util/misc.hpp"

namespace {

std::string FailureKind(const proto::ExecutionResult& result) {
  switch (result.fault()) {
    case proto::SandboxFault::NO_FAULT:
      return "test_failure";
    case proto::SandboxFault::DEPENDENCY_ERROR:
      return "dependency_error";
    case proto::SandboxFault::TIMEOUT:
      return "timeout";
    case proto::SandboxFault::ENVIRONMENT_ERROR:
      return "environment_error";
    default:
      return "interrupted";
  }
}

std::string FailureLog(const proto::ExecutionResult& result) {
  std::string log;
  if (!result.fault_message().empty()) {
    absl::StrAppend(&log, result.fault_message(), "\n");
  }
  absl::StrAppend(&log, result.stdout_log(), result.stderr_log());
  return util::tail(log, core::kFailureLogBytes);
}

}  // namespace

namespace core {

AgentConfig AgentConfig::FromFlags() {
  AgentConfig config;
  config.max_iterations = FLAGS_max_iterations;
  config.max_sandbox_faults = FLAGS_max_sandbox_faults;
  config.max_generation_retries = FLAGS_max_generation_retries;
  config.max_structural_defects = FLAGS_max_structural_defects;
  config.sandbox_timeout_millis = FLAGS_sandbox_timeout_ms;
  return config;
}

bool AgentConfig::Validate(std::string* reason) const {
  if (max_iterations <= 0) {
    *reason = "max_iterations must be positive";
  } else if (max_sandbox_faults <= 0) {
    *reason = "max_sandbox_faults must be positive";
  } else if (max_generation_retries <= 0) {
    *reason = "max_generation_retries must be positive";
  } else if (max_structural_defects <= 0) {
    *reason = "max_structural_defects must be positive";
  } else if (sandbox_timeout_millis < 0) {
    *reason = "sandbox_timeout_millis must not be negative";
  } else {
    return true;
  }
  return false;
}

Agent::Agent(proto::AgentIdentity identity, proto::Task task,
             AgentConfig config, std::shared_ptr<oracle::Oracle> oracle,
             std::shared_ptr<executor::Executor> executor,
             std::shared_ptr<EventQueue> events)
    : identity_(std::move(identity)),
      task_(std::move(task)),
      config_(config),
      oracle_(std::move(oracle)),
      executor_(std::move(executor)),
      events_(std::move(events)) {
  CHECK(oracle_ != nullptr);
  CHECK(executor_ != nullptr);
}

void Agent::SetStatus(proto::CandidateStatus status,
                      const std::string& message) {
  candidate_.set_status(status);
  VLOG(1) << identity_.id() << " #" << candidate_.iteration() << ": "
          << proto::CandidateStatus_Name(status)
          << (message.empty() ? "" : " ") << message;
  if (!events_) return;
  int32_t iteration = candidate_.iteration();
  switch (status) {
    case proto::CandidateStatus::DRAFTING:
      events_->Drafting(identity_, iteration);
      break;
    case proto::CandidateStatus::TESTING:
      events_->Testing(identity_, iteration);
      break;
    case proto::CandidateStatus::EXECUTING:
      events_->Executing(identity_, iteration);
      break;
    case proto::CandidateStatus::PASSED:
      // Published by whoever commits the win.
      break;
    case proto::CandidateStatus::FAILED:
      events_->Failed(identity_, iteration, message);
      break;
    case proto::CandidateStatus::EXHAUSTED:
      events_->Exhausted(identity_, iteration, message);
      break;
    case proto::CandidateStatus::CANCELLED:
      events_->Cancelled(identity_, iteration, message);
      break;
    default:
      LOG(FATAL) << "Unknown status " << status;
  }
}

void Agent::Retry(const std::string& kind, const std::string& log,
                  const proto::Bundle& bundle) {
  prior_.Clear();
  prior_.set_iteration(candidate_.iteration());
  prior_.set_failure_kind(kind);
  prior_.set_failure_log(util::tail(log, kFailureLogBytes));
  *prior_.mutable_previous() = bundle;
  has_prior_ = true;
}

AgentReport Agent::Finish(AgentReport::Kind kind, const std::string& message) {
  AgentReport report;
  report.kind = kind;
  report.agent = identity_;
  report.message = message;
  switch (kind) {
    case AgentReport::Kind::PASSED:
      SetStatus(proto::CandidateStatus::PASSED, message);
      break;
    case AgentReport::Kind::EXHAUSTED:
      SetStatus(proto::CandidateStatus::EXHAUSTED, message);
      break;
    case AgentReport::Kind::CANCELLED:
      SetStatus(proto::CandidateStatus::CANCELLED, message);
      break;
    case AgentReport::Kind::FATAL:
      SetStatus(proto::CandidateStatus::FAILED, "fatal: " + message);
      break;
  }
  report.candidate = candidate_;
  return report;
}

bool Agent::Draft(const util::CancellationToken& token, proto::Bundle* bundle,
                  std::string* error) {
  for (int32_t attempt = 0; attempt < config_.max_generation_retries;
       attempt++) {
    if (token.IsCancelled()) {
      throw oracle::generation_cancelled("Cancelled before generation");
    }
    try {
      *bundle = oracle_->Generate(task_, has_prior_ ? &prior_ : nullptr,
                                  token);
      return true;
    } catch (const oracle::generation_fault& exc) {
      LOG(WARNING) << identity_.id() << ": generation attempt " << attempt + 1
                   << " failed: " << exc.what();
      *error = exc.what();
    }
  }
  return false;
}

AgentReport Agent::Run(const util::CancellationToken& token) {
  int32_t faults = 0;
  int32_t defects = 0;
  try {
    while (true) {
      if (token.IsCancelled()) {
        return Finish(AgentReport::Kind::CANCELLED, "Cancelled");
      }

      SetStatus(proto::CandidateStatus::DRAFTING, "");
      proto::Bundle bundle;
      std::string error;
      if (!Draft(token, &bundle, &error)) {
        // The oracle kept failing: count it as a failed iteration.
        candidate_.set_iteration(candidate_.iteration() + 1);
        SetStatus(proto::CandidateStatus::FAILED, "Generation failed: " + error);
        Retry("generation_fault", error, candidate_.bundle());
        if (candidate_.iteration() >= config_.max_iterations) {
          return Finish(AgentReport::Kind::EXHAUSTED,
                        "Iteration limit reached");
        }
        continue;
      }
      if (token.IsCancelled()) {
        return Finish(AgentReport::Kind::CANCELLED, "Cancelled");
      }

      SetStatus(proto::CandidateStatus::TESTING, "");
      std::string defect;
      if (!ValidateBundle(bundle, &defect)) {
        defects++;
        SetStatus(proto::CandidateStatus::FAILED,
                  "Structural defect: " + defect);
        Retry("structural_defect", defect, bundle);
        if (defects >= config_.max_structural_defects) {
          return Finish(AgentReport::Kind::EXHAUSTED,
                        "Too many structurally invalid bundles");
        }
        continue;
      }

      if (token.IsCancelled()) {
        return Finish(AgentReport::Kind::CANCELLED, "Cancelled");
      }
      candidate_.set_iteration(candidate_.iteration() + 1);
      *candidate_.mutable_bundle() = bundle;
      candidate_.clear_last_result();
      SetStatus(proto::CandidateStatus::EXECUTING, "");

      proto::ExecutionRequest request;
      *request.mutable_bundle() = bundle;
      request.set_timeout_millis(config_.sandbox_timeout_millis);
      request.set_environment_tag(
          absl::StrCat(identity_.id(), "#", candidate_.iteration()));
      *candidate_.mutable_last_result() = executor_->Execute(request, token);
      const proto::ExecutionResult& result = candidate_.last_result();

      if (result.fault() == proto::SandboxFault::INTERRUPTED) {
        return Finish(AgentReport::Kind::CANCELLED,
                      "Interrupted while executing");
      }
      if (executor::AllTestsPassed(result)) {
        return Finish(AgentReport::Kind::PASSED, "");
      }
      if (token.IsCancelled()) {
        return Finish(AgentReport::Kind::CANCELLED, "Cancelled");
      }

      std::string kind = FailureKind(result);
      if (result.fault() != proto::SandboxFault::NO_FAULT) faults++;
      SetStatus(proto::CandidateStatus::FAILED,
                result.fault_message().empty() ? kind
                                               : result.fault_message());
      Retry(kind, FailureLog(result), bundle);
      if (candidate_.iteration() >= config_.max_iterations) {
        return Finish(AgentReport::Kind::EXHAUSTED, "Iteration limit reached");
      }
      if (faults >= config_.max_sandbox_faults) {
        return Finish(AgentReport::Kind::EXHAUSTED,
                      "Too many sandbox faults");
      }
    }
  } catch (const oracle::generation_cancelled& exc) {
    return Finish(AgentReport::Kind::CANCELLED, exc.what());
  } catch (const oracle::oracle_unreachable& exc) {
    LOG(ERROR) << identity_.id() << ": " << exc.what();
    AgentReport report = Finish(AgentReport::Kind::FATAL, exc.what());
    report.fatal_reason = proto::AbortReason::ORACLE_UNREACHABLE;
    return report;
  }
}

}  // namespace core
