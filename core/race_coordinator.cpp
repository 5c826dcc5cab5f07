#include "core/race_coordinator.hpp"

#include <exception>
#include <thread>

#include "absl/strings/str_cat.h"
#include "absl/time/clock.h"
#include "glog/logging.h"
#include "util/flags.hpp"

namespace core {

RaceConfig RaceConfig::FromFlags() {
  RaceConfig config;
  config.race_timeout_millis = FLAGS_race_timeout_ms;
  config.drain_timeout_millis = FLAGS_drain_timeout_ms;
  return config;
}

RaceCoordinator::RaceCoordinator(RaceConfig config,
                                 std::shared_ptr<executor::Executor> executor,
                                 std::shared_ptr<EventQueue> events)
    : config_(config),
      executor_(std::move(executor)),
      events_(std::move(events)) {
  CHECK(executor_ != nullptr);
}

void RaceCoordinator::ReportQueue::Push(AgentReport report) {
  absl::MutexLock lck(&mutex_);
  reports_.push_back(std::move(report));
}

bool RaceCoordinator::ReportQueue::Pop(absl::Time deadline,
                                       AgentReport* report) {
  absl::MutexLock lck(&mutex_);
  auto cond = [this]() {
    mutex_.AssertHeld();
    return !reports_.empty();
  };
  if (!mutex_.AwaitWithDeadline(absl::Condition(&cond), deadline)) {
    return false;
  }
  *report = std::move(reports_.front());
  reports_.pop_front();
  return true;
}

void RaceCoordinator::RunAgent(std::shared_ptr<Agent> agent,
                               std::shared_ptr<RaceState> state) {
  AgentReport report;
  try {
    report = agent->Run(state->token);
  } catch (const std::exception& exc) {
    LOG(ERROR) << agent->Identity().id() << " crashed: " << exc.what();
    report.kind = AgentReport::Kind::FATAL;
    report.agent = agent->Identity();
    report.message = exc.what();
    report.fatal_reason = proto::AbortReason::INTERNAL_ERROR;
    if (state->events) state->events->Failed(agent->Identity(), 0, exc.what());
  }

  if (report.kind == AgentReport::Kind::PASSED) {
    proto::SwarmOutcome outcome;
    *outcome.mutable_winner()->mutable_agent() = report.agent;
    *outcome.mutable_winner()->mutable_candidate() = report.candidate;
    if (state->cell.TryCommit(std::move(outcome))) {
      LOG(INFO) << "Winner: " << report.agent.id() << " at iteration "
                << report.candidate.iteration();
      if (state->events) {
        state->events->Passed(report.agent, report.candidate.iteration());
      }
      state->token.Cancel();
    } else {
      LOG(WARNING) << "Discarding the late win of " << report.agent.id();
      report.kind = AgentReport::Kind::CANCELLED;
      report.candidate.set_status(proto::CandidateStatus::CANCELLED);
      if (state->events) {
        state->events->Cancelled(report.agent, report.candidate.iteration(),
                                 "Late win discarded");
      }
    }
  }
  state->reports.Push(std::move(report));
}

size_t RaceCoordinator::Drain(RaceState* state, size_t count,
                              absl::Time deadline) {
  AgentReport report;
  size_t popped = 0;
  while (popped < count && state->reports.Pop(deadline, &report)) {
    popped++;
    VLOG(1) << report.agent.id() << " stopped: " << report.message;
  }
  return popped;
}

proto::SwarmOutcome RaceCoordinator::Run(
    const std::vector<std::shared_ptr<Agent>>& agents) {
  CHECK(!agents.empty()) << "A race needs at least one agent";
  auto state = std::make_shared<RaceState>();
  state->events = events_;

  LOG(INFO) << "Starting a race between " << agents.size() << " agents";
  std::vector<std::thread> threads;
  threads.reserve(agents.size());
  try {
    for (const std::shared_ptr<Agent>& agent : agents) {
      OnAgentStart(threads.size());
      threads.emplace_back(&RaceCoordinator::RunAgent, agent, state);
    }
  } catch (const std::exception& exc) {
    // std::system_error when the system is out of threads.
    LOG(ERROR) << "Unable to start agent " << threads.size() + 1 << ": "
               << exc.what();
    proto::SwarmOutcome outcome;
    outcome.mutable_aborted()->set_reason(proto::AbortReason::INTERNAL_ERROR);
    outcome.mutable_aborted()->set_message(
        absl::StrCat("Unable to start agent ", threads.size() + 1, ": ",
                     exc.what()));
    state->cell.TryCommit(std::move(outcome));
  }
  const size_t started = threads.size();

  const absl::Time deadline =
      config_.race_timeout_millis > 0
          ? absl::Now() + absl::Milliseconds(config_.race_timeout_millis)
          : absl::InfiniteFuture();
  size_t finished = 0;
  size_t unreachable = 0;
  std::vector<std::string> fatal_messages;
  bool timed_out = false;
  AgentReport report;
  while (finished < started && !state->cell.IsCommitted()) {
    if (!state->reports.Pop(deadline, &report)) {
      timed_out = true;
      break;
    }
    finished++;
    VLOG(1) << report.agent.id() << " stopped: " << report.message;
    if (report.kind == AgentReport::Kind::FATAL) {
      fatal_messages.push_back(
          absl::StrCat(report.agent.id(), ": ", report.message));
      if (report.fatal_reason == proto::AbortReason::ORACLE_UNREACHABLE) {
        unreachable++;
      }
    }
  }

  if (timed_out) {
    LOG(WARNING) << "The race timed out after " << config_.race_timeout_millis
                 << "ms";
    proto::SwarmOutcome outcome;
    outcome.mutable_aborted()->set_reason(proto::AbortReason::RACE_TIMEOUT);
    outcome.mutable_aborted()->set_message(absl::StrCat(
        "No winner within ", config_.race_timeout_millis, "ms"));
    state->cell.TryCommit(std::move(outcome));
  } else if (!state->cell.IsCommitted()) {
    proto::SwarmOutcome outcome;
    if (fatal_messages.size() == agents.size()) {
      outcome.mutable_aborted()->set_reason(
          unreachable == agents.size() ? proto::AbortReason::ORACLE_UNREACHABLE
                                       : proto::AbortReason::INTERNAL_ERROR);
      outcome.mutable_aborted()->set_message(fatal_messages.front());
    } else {
      outcome.mutable_all_exhausted()->set_agents(agents.size());
    }
    // Only an agent could have committed in the meantime, and agents only
    // commit wins.
    if (!state->cell.TryCommit(std::move(outcome))) {
      LOG(WARNING) << "An agent won while the race was being closed";
    }
  }

  // Stop the others and wait for them.
  state->token.Cancel();
  const absl::Duration drain = absl::Milliseconds(config_.drain_timeout_millis);
  finished += Drain(state.get(), started - finished, absl::Now() + drain);
  if (finished < started) {
    LOG(WARNING) << started - finished << " agents did not stop within "
                 << config_.drain_timeout_millis << "ms";
    executor_->ForceRelease();
    finished += Drain(state.get(), started - finished, absl::Now() + drain);
  }
  if (finished < started) {
    LOG(ERROR) << "Abandoning " << started - finished
               << " agents that ignore cancellation";
    for (std::thread& thread : threads) thread.detach();
  } else {
    // Every thread has pushed its last report and is returning.
    for (std::thread& thread : threads) thread.join();
  }

  absl::optional<proto::SwarmOutcome> outcome = state->cell.Get();
  CHECK(outcome) << "The race ended without an outcome";
  if (!outcome->has_winner()) {
    LOG(INFO) << "Race outcome: " << outcome->ShortDebugString();
  }
  return *outcome;
}

}  // namespace core
