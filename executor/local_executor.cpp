#include "executor/local_executor.hpp"

#include <stdlib.h>
#include <unistd.h>

#include "absl/memory/memory.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "executor/dependencies.hpp"
#include "executor/test_report.hpp"
#include "glog/logging.h"
#include "util/flags.hpp"
#include "util/which.hpp"

namespace {

std::string AbsolutePath(const std::string& path) {
  if (!path.empty() && path[0] == '/') return path;
  std::unique_ptr<char, decltype(&free)> cwd{getcwd(nullptr, 0), &free};
  if (!cwd) throw std::system_error(errno, std::system_category(), "getcwd");
  return util::File::JoinPath(cwd.get(), path);
}

void SetFault(proto::SandboxFault fault, const std::string& message,
              proto::ExecutionResult* result) {
  result->set_fault(fault);
  result->set_fault_message(message);
}

}  // namespace

namespace executor {

LocalExecutorOptions LocalExecutorOptions::FromFlags() {
  LocalExecutorOptions options;
  options.temp_directory = FLAGS_temp_directory;
  options.install_command = {FLAGS_python,
                             "-m",
                             "pip",
                             "install",
                             "--quiet",
                             "--disable-pip-version-check",
                             "--no-input",
                             "--target",
                             ".deps",
                             "-r",
                             "requirements.txt"};
  options.test_command = {FLAGS_python, "-m", "pytest", "-v",
                          "-p",         "no:cacheprovider"};
  options.install_timeout_millis = FLAGS_install_timeout_ms;
  options.default_timeout_millis = FLAGS_sandbox_timeout_ms;
  options.max_log_bytes = FLAGS_max_log_bytes;
  return options;
}

LocalExecutor::LocalExecutor(LocalExecutorOptions options,
                             EnvironmentListener* listener)
    : options_(std::move(options)), listener_(listener) {
  options_.temp_directory = AbsolutePath(options_.temp_directory);
  util::File::MakeDirs(options_.temp_directory);
}

LocalExecutor::Environment::Environment(const std::string& temp_directory,
                                        const std::string& tag,
                                        EnvironmentListener* listener)
    : dir_(absl::make_unique<util::TempDir>(temp_directory)),
      listener_(listener) {
  name_ = tag.empty() ? dir_->Path() : absl::StrCat(tag, "@", dir_->Path());
  util::File::MakeDirs(util::File::JoinPath(dir_->Path(), kBoxDir));
  VLOG(2) << "Acquired environment " << name_;
  if (listener_) listener_->OnAcquire(name_);
}

LocalExecutor::Environment::~Environment() {
  dir_.reset();
  VLOG(2) << "Released environment " << name_;
  if (listener_) listener_->OnRelease(name_);
}

void LocalExecutor::ForceRelease() {
  LOG(WARNING) << "Forcing the release of all the running environments";
  release_epoch_.fetch_add(1);
}

std::vector<std::string> LocalExecutor::Environ(const Environment& env) const {
  const char* path = getenv("PATH");
  std::string box = util::File::JoinPath(env.Path(), kBoxDir);
  return {absl::StrCat("PATH=", path ? path : "/usr/local/bin:/usr/bin:/bin"),
          absl::StrCat("HOME=", box),
          absl::StrCat("PYTHONPATH=", kDepsDir, ":."),
          "PYTHONDONTWRITEBYTECODE=1",
          "PYTHONUNBUFFERED=1",
          "LANG=C.UTF-8"};
}

bool LocalExecutor::Run(const Environment& env,
                        const std::vector<std::string>& command,
                        const std::string& log_prefix, int64_t timeout_millis,
                        const std::function<bool()>& should_stop,
                        sandbox::ExecutionInfo* info, std::string* error_msg) {
  if (command.empty()) {
    *error_msg = "Empty command";
    return false;
  }
  std::string executable = util::which(command[0]);
  if (executable.empty()) {
    *error_msg = "Command not found: " + command[0];
    return false;
  }
  sandbox::ExecutionOptions exec_options(
      util::File::JoinPath(env.Path(), kBoxDir), executable);
  exec_options.args.assign(command.begin() + 1, command.end());
  exec_options.env = Environ(env);
  exec_options.wall_limit_millis = timeout_millis;
  exec_options.stdout_file =
      util::File::JoinPath(env.Path(), log_prefix + "stdout");
  exec_options.stderr_file =
      util::File::JoinPath(env.Path(), log_prefix + "stderr");
  exec_options.should_stop = should_stop;

  VLOG(3) << "Running in " << env.Name() << ": "
          << absl::StrJoin(command, " ");
  std::unique_ptr<sandbox::Sandbox> sb = sandbox::Sandbox::Create();
  if (!sb) {
    *error_msg = "No sandbox implementation available";
    return false;
  }
  return sb->Execute(exec_options, info, error_msg);
}

proto::ExecutionResult LocalExecutor::Execute(
    const proto::ExecutionRequest& request,
    const util::CancellationToken& token) {
  proto::ExecutionResult result;
  const uint64_t epoch = release_epoch_.load();
  std::function<bool()> should_stop = [this, &token, epoch]() {
    return token.IsCancelled() || release_epoch_.load() != epoch;
  };
  if (should_stop()) {
    SetFault(proto::SandboxFault::INTERRUPTED, "Cancelled before start",
             &result);
    return result;
  }

  try {
    Environment env(options_.temp_directory, request.environment_tag(),
                    listener_);
    std::string box = util::File::JoinPath(env.Path(), kBoxDir);

    // Code units.
    for (const auto* units : {&request.bundle().source(),
                              &request.bundle().tests()}) {
      for (const proto::CodeUnit& unit : *units) {
        if (!util::File::IsSafeRelativePath(unit.name())) {
          SetFault(proto::SandboxFault::ENVIRONMENT_ERROR,
                   "Invalid file name: " + unit.name(), &result);
          return result;
        }
        util::File::Write(util::File::JoinPath(box, unit.name()),
                          unit.content(), /*overwrite=*/true);
      }
    }

    std::string error_msg;
    sandbox::ExecutionInfo info;

    // Dependencies.
    std::vector<std::string> dependencies =
        SanitizeDependencies(request.bundle().dependencies());
    if (!dependencies.empty()) {
      util::File::Write(util::File::JoinPath(box, kRequirementsFile),
                        absl::StrJoin(dependencies, "\n") + "\n");
      if (!Run(env, options_.install_command, "install.",
               options_.install_timeout_millis, should_stop, &info,
               &error_msg)) {
        SetFault(proto::SandboxFault::ENVIRONMENT_ERROR, error_msg, &result);
        return result;
      }
      if (info.stopped) {
        SetFault(proto::SandboxFault::INTERRUPTED,
                 "Interrupted while installing dependencies", &result);
        return result;
      }
      if (info.timed_out || info.status_code != 0 || info.signal != 0) {
        std::string log = util::File::ReadTail(
            util::File::JoinPath(env.Path(), "install.stderr"),
            options_.max_log_bytes);
        if (log.empty()) {
          log = util::File::ReadTail(
              util::File::JoinPath(env.Path(), "install.stdout"),
              options_.max_log_bytes);
        }
        result.set_stderr_log(log);
        SetFault(proto::SandboxFault::DEPENDENCY_ERROR,
                 info.timed_out
                     ? "Dependency installation timed out"
                     : absl::StrCat("Dependency installation failed: ",
                                    absl::StrJoin(dependencies, " ")),
                 &result);
        return result;
      }
    }

    // Tests.
    info = sandbox::ExecutionInfo();
    int64_t timeout = request.timeout_millis() > 0
                          ? request.timeout_millis()
                          : options_.default_timeout_millis;
    if (!Run(env, options_.test_command, "", timeout, should_stop, &info,
             &error_msg)) {
      SetFault(proto::SandboxFault::ENVIRONMENT_ERROR, error_msg, &result);
      return result;
    }
    result.set_exit_status(info.status_code);
    result.set_signal(info.signal);
    result.set_wall_time_millis(info.wall_time_millis);
    result.set_stdout_log(util::File::ReadTail(
        util::File::JoinPath(env.Path(), "stdout"), options_.max_log_bytes));
    result.set_stderr_log(util::File::ReadTail(
        util::File::JoinPath(env.Path(), "stderr"), options_.max_log_bytes));
    for (proto::TestCaseResult& test : ParseTestReport(result.stdout_log())) {
      *result.add_tests() = std::move(test);
    }
    if (info.stopped) {
      SetFault(proto::SandboxFault::INTERRUPTED, "Interrupted while testing",
               &result);
    } else if (info.timed_out) {
      SetFault(proto::SandboxFault::TIMEOUT,
               absl::StrCat("Tests did not finish within ", timeout, "ms"),
               &result);
    }
  } catch (const std::runtime_error& exc) {
    LOG(ERROR) << "Environment failure: " << exc.what();
    SetFault(proto::SandboxFault::ENVIRONMENT_ERROR, exc.what(), &result);
  }
  return result;
}

}  // namespace executor
