#ifndef MANAGER_SWARM_MANAGER_HPP
#define MANAGER_SWARM_MANAGER_HPP

#include <functional>
#include <memory>

#include "core/agent.hpp"
#include "core/event_queue.hpp"
#include "core/race_coordinator.hpp"
#include "executor/executor.hpp"
#include "oracle/oracle.hpp"
#include "proto/swarm.pb.h"

namespace manager {

class SwarmManager {
 public:
  using OutcomeHandler = std::function<void(const proto::SwarmOutcome&)>;

  // The collaborators are shared with the agents, which may outlive Solve if
  // they ignore cancellation. events may be null.
  SwarmManager(std::shared_ptr<oracle::Oracle> oracle,
               std::shared_ptr<executor::Executor> executor,
               core::RaceConfig race_config,
               std::shared_ptr<core::EventQueue> events = nullptr);

  // Called once at the end of every Solve, with the value it returns.
  void SetOutcomeHandler(OutcomeHandler handler) {
    outcome_handler_ = std::move(handler);
  }

  // Races swarm_size agents on the task. Never throws: every failure is
  // reported as an Aborted outcome.
  proto::SwarmOutcome Solve(const proto::Task& task, int32_t swarm_size,
                            const core::AgentConfig& agent_config);

 private:
  proto::SwarmOutcome Race(const proto::Task& task, int32_t swarm_size,
                           const core::AgentConfig& agent_config);

  std::shared_ptr<oracle::Oracle> oracle_;
  std::shared_ptr<executor::Executor> executor_;
  core::RaceConfig race_config_;
  std::shared_ptr<core::EventQueue> events_;
  OutcomeHandler outcome_handler_;
};

}  // namespace manager

#endif
