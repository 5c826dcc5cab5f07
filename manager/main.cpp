#include <iostream>
#include <memory>
#include <thread>

#include "core/agent.hpp"
#include "core/event_queue.hpp"
#include "core/race_coordinator.hpp"
#include "executor/local_executor.hpp"
#include "gflags/gflags.h"
#include "glog/logging.h"
#include "google/protobuf/text_format.h"
#include "manager/swarm_manager.hpp"
#include "oracle/process_oracle.hpp"
#include "oracle/rate_limited_oracle.hpp"
#include "util/file.hpp"
#include "util/flags.hpp"
#include "util/misc.hpp"

DEFINE_string(task, "", "Requirement to implement");  // NOLINT
DEFINE_string(task_file, "",
              "File containing the requirement, overrides --task");  // NOLINT
DEFINE_string(acceptance_criteria, "",
              "Acceptance criteria of the task, separated by ';'");  // NOLINT

namespace {

void LogEvents(core::EventQueue* events) {
  while (absl::optional<proto::AgentEvent> event = events->Dequeue()) {
    LOG(INFO) << event->agent().id() << " #" << event->iteration() << " "
              << proto::CandidateStatus_Name(event->status())
              << (event->message().empty() ? "" : ": ")
              << util::tail(event->message(), 200);
  }
}

}  // namespace

int main(int argc, char** argv) {
  gflags::SetUsageMessage(
      "Races a swarm of agents to implement a task until one passes its "
      "tests");
  gflags::ParseCommandLineFlags(&argc, &argv, true);
  google::InitGoogleLogging(argv[0]);
  google::InstallFailureSignalHandler();

  proto::Task task;
  if (!FLAGS_task_file.empty()) {
    try {
      task.set_requirement(util::File::Read(FLAGS_task_file));
    } catch (const util::file_not_found& exc) {
      LOG(ERROR) << "Cannot read the task: " << exc.what();
      return 1;
    }
  } else {
    task.set_requirement(FLAGS_task);
  }
  if (task.requirement().empty()) {
    LOG(ERROR) << "No task given, use --task or --task_file";
    return 1;
  }
  for (const std::string& criterion :
       util::split(FLAGS_acceptance_criteria, ';')) {
    task.add_acceptance_criteria(criterion);
  }
  if (FLAGS_oracle_command.empty()) {
    LOG(ERROR) << "No generation oracle given, use --oracle_command";
    return 1;
  }
  if (FLAGS_oracle_concurrency < 1) {
    LOG(ERROR) << "--oracle_concurrency must be positive";
    return 1;
  }

  auto oracle = std::make_shared<oracle::RateLimitedOracle>(
      std::make_shared<oracle::ProcessOracle>(
          util::split(FLAGS_oracle_command, ' '), FLAGS_oracle_timeout_ms,
          FLAGS_temp_directory),
      FLAGS_oracle_concurrency);
  std::shared_ptr<executor::LocalExecutor> executor;
  try {
    executor = std::make_shared<executor::LocalExecutor>(
        executor::LocalExecutorOptions::FromFlags());
  } catch (const std::system_error& exc) {
    LOG(ERROR) << "Cannot prepare " << FLAGS_temp_directory << ": "
               << exc.what();
    return 1;
  }

  auto events = std::make_shared<core::EventQueue>();
  std::thread logger(LogEvents, events.get());

  int status = 1;
  manager::SwarmManager manager(oracle, executor,
                                core::RaceConfig::FromFlags(), events);
  manager.SetOutcomeHandler([&status](const proto::SwarmOutcome& outcome) {
    status = outcome.has_winner() ? 0 : 1;
    std::string text;
    if (!google::protobuf::TextFormat::PrintToString(outcome, &text)) {
      LOG(ERROR) << "Cannot print the outcome";
      return;
    }
    std::cout << text << std::flush;
  });
  manager.Solve(task, FLAGS_swarm_size, core::AgentConfig::FromFlags());

  events->Stop();
  logger.join();
  return status;
}
