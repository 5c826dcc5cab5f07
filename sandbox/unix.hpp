#ifndef SANDBOX_UNIX_HPP
#define SANDBOX_UNIX_HPP

#include <string>
#include <vector>

#include "sandbox/sandbox.hpp"

namespace sandbox {

// Sandbox for POSIX systems. The program is the leader of a new session, so
// killing its process group also kills everything it spawned.
class Unix : public Sandbox {
 public:
  bool Execute(const ExecutionOptions& options, ExecutionInfo* info,
               std::string* error_msg) override;
  static Sandbox* Create() { return new Unix(); }
  static int Score() { return 2; }

 private:
  Unix() = default;

  // Builds argv and envp and opens the pipe used by the child to report
  // failures before exec.
  bool Prepare(const ExecutionOptions& options, std::string* error_msg);

  // Runs in the child. Never returns and must not allocate.
  [[noreturn]] void Child(const ExecutionOptions& options);

  // Reads the child's startup report, then polls it until it exits, the wall
  // limit is hit or should_stop fires.
  bool Supervise(const ExecutionOptions& options, ExecutionInfo* info,
                 std::string* error_msg);

  int report_fds_[2] = {-1, -1};
  int child_pid_ = 0;
  std::vector<std::string> arg_storage_;
  std::vector<std::string> env_storage_;
  std::vector<char*> argv_;
  std::vector<char*> envp_;
};

}  // namespace sandbox

#endif
