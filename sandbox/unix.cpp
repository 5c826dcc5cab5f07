#include "sandbox/unix.hpp"

#include <chrono>
#include <system_error>
#include <thread>

#include <errno.h>
#include <fcntl.h>
#include <signal.h>
#include <string.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include "glog/logging.h"

namespace sandbox {

namespace {

static const constexpr auto kPollInterval = std::chrono::milliseconds(10);
// Attempts at exec while the executable is still open for writing.
static const constexpr int kExecAttempts = 16;

// Sent by the child over the report pipe when it fails before exec. Small
// enough for the write to be atomic.
struct StartupFailure {
  char step[16];
  int error;
};

std::string ErrorString(int error) {
  return std::error_code(error, std::system_category()).message();
}

[[noreturn]] void Fail(int fd, const char* step, int error) {
  StartupFailure failure = {};
  strncpy(failure.step, step, sizeof(failure.step) - 1);
  failure.error = error;
  (void)!write(fd, &failure, sizeof(failure));
  _exit(127);
}

int OpenOutput(const std::string& path) {
  return open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC,
              S_IRUSR | S_IWUSR);
}

}  // namespace

bool Unix::Execute(const ExecutionOptions& options, ExecutionInfo* info,
                   std::string* error_msg) {
  if (!Prepare(options, error_msg)) return false;
  child_pid_ = fork();
  if (child_pid_ == -1) {
    *error_msg = "fork: " + ErrorString(errno);
    close(report_fds_[0]);
    close(report_fds_[1]);
    return false;
  }
  if (child_pid_ == 0) Child(options);
  return Supervise(options, info, error_msg);
}

bool Unix::Prepare(const ExecutionOptions& options, std::string* error_msg) {
  arg_storage_.clear();
  arg_storage_.push_back(options.executable);
  arg_storage_.insert(arg_storage_.end(), options.args.begin(),
                      options.args.end());
  env_storage_ = options.env;
  argv_.clear();
  envp_.clear();
  for (std::string& arg : arg_storage_) argv_.push_back(&arg[0]);
  argv_.push_back(nullptr);
  for (std::string& var : env_storage_) envp_.push_back(&var[0]);
  envp_.push_back(nullptr);

  if (pipe2(report_fds_, O_CLOEXEC) == -1) {
    *error_msg = "pipe: " + ErrorString(errno);
    return false;
  }
  return true;
}

void Unix::Child(const ExecutionOptions& options) {
  int report = report_fds_[1];
  close(report_fds_[0]);

  if (setsid() == -1) Fail(report, "setsid", errno);

  int in = open(options.stdin_file.empty() ? "/dev/null"
                                           : options.stdin_file.c_str(),
                O_RDONLY | O_CLOEXEC);
  if (in == -1) Fail(report, "open stdin", errno);
  if (dup2(in, STDIN_FILENO) == -1) Fail(report, "dup2", errno);
  if (!options.stdout_file.empty()) {
    int out = OpenOutput(options.stdout_file);
    if (out == -1) Fail(report, "open stdout", errno);
    if (dup2(out, STDOUT_FILENO) == -1) Fail(report, "dup2", errno);
  }
  if (!options.stderr_file.empty()) {
    int err = OpenOutput(options.stderr_file);
    if (err == -1) Fail(report, "open stderr", errno);
    if (dup2(err, STDERR_FILENO) == -1) Fail(report, "dup2", errno);
  }

  if (chdir(options.root.c_str()) == -1) Fail(report, "chdir", errno);

  for (int attempt = 0; attempt < kExecAttempts; attempt++) {
    if (options.env.empty()) {
      execv(argv_[0], argv_.data());
    } else {
      execve(argv_[0], argv_.data(), envp_.data());
    }
    if (errno != ETXTBSY) break;
    usleep(100);
  }
  Fail(report, "exec", errno);
}

bool Unix::Supervise(const ExecutionOptions& options, ExecutionInfo* info,
                     std::string* error_msg) {
  close(report_fds_[1]);
  StartupFailure failure = {};
  ssize_t got;
  do {
    got = read(report_fds_[0], &failure, sizeof(failure));
  } while (got == -1 && errno == EINTR);
  close(report_fds_[0]);
  if (got == sizeof(failure)) {
    while (waitpid(child_pid_, nullptr, 0) == -1 && errno == EINTR) {
    }
    *error_msg = std::string(failure.step) + ": " + ErrorString(failure.error);
    return false;
  }

  auto start = std::chrono::steady_clock::now();
  auto elapsed_millis = [&start]() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::steady_clock::now() - start)
        .count();
  };

  int status = 0;
  bool exited = false;
  while (true) {
    int ret = waitpid(child_pid_, &status, WNOHANG);
    if (ret == child_pid_) {
      exited = true;
      break;
    }
    if (ret == -1 && errno != EINTR) {
      *error_msg = "waitpid: " + ErrorString(errno);
      kill(-child_pid_, SIGKILL);
      return false;
    }
    if (options.should_stop && options.should_stop()) {
      info->stopped = true;
      break;
    }
    if (options.wall_limit_millis > 0 &&
        elapsed_millis() >= options.wall_limit_millis) {
      info->timed_out = true;
      break;
    }
    std::this_thread::sleep_for(kPollInterval);
  }
  if (!exited) {
    VLOG(2) << "Killing process group " << child_pid_;
    if (kill(-child_pid_, SIGKILL) == -1 && errno != ESRCH) {
      PLOG(WARNING) << "kill";
    }
    while (waitpid(child_pid_, &status, 0) == -1) {
      if (errno == EINTR) continue;
      *error_msg = "waitpid: " + ErrorString(errno);
      return false;
    }
  }
  // Nothing the program started may outlive it.
  kill(-child_pid_, SIGKILL);

  info->wall_time_millis = elapsed_millis();
  info->status_code = WIFEXITED(status) ? WEXITSTATUS(status) : 0;
  info->signal = WIFSIGNALED(status) ? WTERMSIG(status) : 0;
  return true;
}

namespace {
Sandbox::Register<Unix> registration;
}  // namespace

}  // namespace sandbox
