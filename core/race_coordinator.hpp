#ifndef CORE_RACE_COORDINATOR_HPP
#define CORE_RACE_COORDINATOR_HPP

#include <cstdint>
#include <deque>
#include <memory>
#include <vector>

#include "absl/base/thread_annotations.h"
#include "absl/synchronization/mutex.h"
#include "absl/time/time.h"
#include "core/agent.hpp"
#include "core/event_queue.hpp"
#include "core/outcome_cell.hpp"
#include "executor/executor.hpp"

namespace core {

struct RaceConfig {
  // 0 means no race-level timeout.
  int64_t race_timeout_millis = 0;
  int64_t drain_timeout_millis = 10 * 1000;

  static RaceConfig FromFlags();
};

// Runs a set of agents concurrently, one thread each. The first agent whose
// candidate passes is committed as the winner and every other agent is
// cancelled. Cancelled agents get the drain timeout to stop; then the
// executor is force-released and they get the drain timeout once more.
// Agents still running after that are abandoned: their threads are detached
// and keep the agent and the race state alive until they return.
class RaceCoordinator {
 public:
  // executor is the one shared by the agents.
  RaceCoordinator(RaceConfig config,
                  std::shared_ptr<executor::Executor> executor,
                  std::shared_ptr<EventQueue> events = nullptr);

  virtual ~RaceCoordinator() = default;

  // An agent can not take part in another race at the same time. If a thread
  // can not be created, the race is aborted with INTERNAL_ERROR and the
  // agents already started are cancelled.
  proto::SwarmOutcome Run(const std::vector<std::shared_ptr<Agent>>& agents);

  RaceCoordinator(const RaceCoordinator&) = delete;
  RaceCoordinator& operator=(const RaceCoordinator&) = delete;

 protected:
  // Hook that is executed just before the thread of the index-th agent is
  // created. May throw like the thread constructor does.
  virtual void OnAgentStart(size_t index) {}

 private:
  // Reports of the agents that stopped, in arrival order.
  class ReportQueue {
   public:
    void Push(AgentReport report);
    // Waits until deadline for a report. Returns false on timeout.
    bool Pop(absl::Time deadline, AgentReport* report);

   private:
    absl::Mutex mutex_;
    std::deque<AgentReport> reports_ GUARDED_BY(mutex_);
  };

  // Shared by Run and the agent threads, which may outlive it.
  struct RaceState {
    util::CancellationToken token;
    OutcomeCell cell;
    ReportQueue reports;
    std::shared_ptr<EventQueue> events;
  };

  // Body of the thread of one agent. Touches nothing but its arguments.
  static void RunAgent(std::shared_ptr<Agent> agent,
                       std::shared_ptr<RaceState> state);

  // Pops reports until count of them arrived or deadline passes. Returns the
  // number of reports popped.
  static size_t Drain(RaceState* state, size_t count, absl::Time deadline);

  RaceConfig config_;
  std::shared_ptr<executor::Executor> executor_;
  std::shared_ptr<EventQueue> events_;
};

}  // namespace core

#endif
