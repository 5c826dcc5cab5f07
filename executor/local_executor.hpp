#ifndef EXECUTOR_LOCAL_EXECUTOR_HPP
#define EXECUTOR_LOCAL_EXECUTOR_HPP

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "executor/executor.hpp"
#include "sandbox/sandbox.hpp"
#include "util/file.hpp"

namespace executor {

struct LocalExecutorOptions {
  std::string temp_directory;
  // Run from the root of the environment, where requirements.txt lists the
  // packages to install into .deps.
  std::vector<std::string> install_command;
  std::vector<std::string> test_command;
  int64_t install_timeout_millis = 0;
  // Used when the request does not specify a timeout.
  int64_t default_timeout_millis = 0;
  int64_t max_log_bytes = 0;

  // Options built from the command line flags.
  static LocalExecutorOptions FromFlags();
};

// Runs every request inside a fresh temporary directory, using the best
// available sandbox implementation. Thread safe.
class LocalExecutor : public Executor {
 public:
  std::string Id() const override { return "LOCAL"; }
  proto::ExecutionResult Execute(const proto::ExecutionRequest& request,
                                 const util::CancellationToken& token) override;
  void ForceRelease() override;

  // The listener, if not null, must outlive the executor.
  LocalExecutor(LocalExecutorOptions options,
                EnvironmentListener* listener = nullptr);
  ~LocalExecutor() override = default;

 private:
  static const constexpr char* kBoxDir = "box";
  static const constexpr char* kDepsDir = ".deps";
  static const constexpr char* kRequirementsFile = "requirements.txt";

  // Acquired environment: notifies the listener once on creation and once on
  // destruction, after the directory is gone.
  class Environment {
   public:
    Environment(const std::string& temp_directory, const std::string& tag,
                EnvironmentListener* listener);
    ~Environment();
    const std::string& Path() const { return dir_->Path(); }
    const std::string& Name() const { return name_; }

    Environment(const Environment&) = delete;
    Environment& operator=(const Environment&) = delete;

   private:
    std::unique_ptr<util::TempDir> dir_;
    std::string name_;
    EnvironmentListener* listener_;
  };

  // Runs command inside the environment. Returns false and sets error_msg if
  // the command could not be started.
  bool Run(const Environment& env, const std::vector<std::string>& command,
           const std::string& log_prefix, int64_t timeout_millis,
           const std::function<bool()>& should_stop,
           sandbox::ExecutionInfo* info, std::string* error_msg);

  std::vector<std::string> Environ(const Environment& env) const;

  LocalExecutorOptions options_;
  EnvironmentListener* listener_;
  std::atomic<uint64_t> release_epoch_{0};
};

}  // namespace executor

#endif
