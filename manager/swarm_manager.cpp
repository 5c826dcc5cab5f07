#include "manager/swarm_manager.hpp"

#include <memory>
#include <vector>

#include "absl/strings/str_cat.h"
#include "glog/logging.h"
#include "util/misc.hpp"

namespace {

proto::SwarmOutcome Aborted(proto::AbortReason reason,
                            const std::string& message) {
  proto::SwarmOutcome outcome;
  outcome.mutable_aborted()->set_reason(reason);
  outcome.mutable_aborted()->set_message(message);
  return outcome;
}

}  // namespace

namespace manager {

SwarmManager::SwarmManager(std::shared_ptr<oracle::Oracle> oracle,
                           std::shared_ptr<executor::Executor> executor,
                           core::RaceConfig race_config,
                           std::shared_ptr<core::EventQueue> events)
    : oracle_(std::move(oracle)),
      executor_(std::move(executor)),
      race_config_(race_config),
      events_(std::move(events)) {}

proto::SwarmOutcome SwarmManager::Race(const proto::Task& task,
                                       int32_t swarm_size,
                                       const core::AgentConfig& agent_config) {
  std::string reason;
  if (swarm_size < 1) {
    return Aborted(proto::AbortReason::INVALID_CONFIGURATION,
                   absl::StrCat("Invalid swarm size ", swarm_size));
  }
  if (!agent_config.Validate(&reason)) {
    return Aborted(proto::AbortReason::INVALID_CONFIGURATION, reason);
  }
  if (race_config_.race_timeout_millis < 0 ||
      race_config_.drain_timeout_millis < 0) {
    return Aborted(proto::AbortReason::INVALID_CONFIGURATION,
                   "Race timeouts must not be negative");
  }
  if (!oracle_ || !executor_) {
    return Aborted(proto::AbortReason::INVALID_CONFIGURATION,
                   "Missing oracle or executor");
  }

  const int64_t created_at = util::now_millis();
  std::vector<std::shared_ptr<core::Agent>> agents;
  for (int32_t ordinal = 1; ordinal <= swarm_size; ordinal++) {
    proto::AgentIdentity identity;
    identity.set_id(absl::StrCat("agent-", ordinal, "-",
                                 absl::Hex(created_at)));
    identity.set_created_at_millis(created_at);
    identity.set_ordinal(ordinal);
    agents.push_back(std::make_shared<core::Agent>(
        std::move(identity), task, agent_config, oracle_, executor_,
        events_));
  }

  core::RaceCoordinator coordinator(race_config_, executor_, events_);
  return coordinator.Run(agents);
}

proto::SwarmOutcome SwarmManager::Solve(const proto::Task& task,
                                        int32_t swarm_size,
                                        const core::AgentConfig& agent_config) {
  proto::SwarmOutcome outcome;
  try {
    outcome = Race(task, swarm_size, agent_config);
  } catch (const std::exception& exc) {
    LOG(ERROR) << "The race failed: " << exc.what();
    outcome = Aborted(proto::AbortReason::INTERNAL_ERROR, exc.what());
  }
  if (outcome.has_aborted()) {
    LOG(WARNING) << "Aborted: "
                 << proto::AbortReason_Name(outcome.aborted().reason()) << " "
                 << outcome.aborted().message();
  }
  if (outcome_handler_) outcome_handler_(outcome);
  return outcome;
}

}  // namespace manager
