#ifndef SANDBOX_SANDBOX_HPP
#define SANDBOX_SANDBOX_HPP

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace sandbox {

// How a program should be run.
struct ExecutionOptions {
  // Directory the program runs in.
  std::string root;
  std::string executable;
  std::vector<std::string> args;
  // "NAME=value" entries. If empty, the environment is inherited.
  std::vector<std::string> env;

  // Empty means /dev/null for stdin and the inherited descriptor otherwise.
  std::string stdin_file;
  std::string stdout_file;
  std::string stderr_file;

  // 0 means no limit.
  int64_t wall_limit_millis = 0;

  // Polled while the program runs. When it returns true the whole process
  // group is killed.
  std::function<bool()> should_stop;

  ExecutionOptions(std::string root, std::string executable)
      : root(std::move(root)), executable(std::move(executable)) {}
};

// What happened to the program.
struct ExecutionInfo {
  int64_t wall_time_millis = 0;
  int32_t status_code = 0;
  int32_t signal = 0;
  // Killed for exceeding wall_limit_millis.
  bool timed_out = false;
  // Killed because should_stop returned true.
  bool stopped = false;
};

// Runs programs as separate processes. Implementations register themselves
// with a global Sandbox::Register<Impl> object and provide two static
// functions: Create, returning a new instance, and Score, telling how suitable
// the implementation is on this machine (negative if it cannot be used,
// higher is better). Registration happens during static initialization.
class Sandbox {
 public:
  using create_t = std::function<Sandbox*()>;
  using score_t = std::function<int()>;

  // Returns the best registered implementation, or nullptr if none is usable.
  static std::unique_ptr<Sandbox> Create();

  // Runs the program described by options. Returns false and sets error_msg
  // if it could not be started; otherwise fills info. Every process started
  // by the call has been killed when it returns. Instances are not thread
  // safe.
  virtual bool Execute(const ExecutionOptions& options, ExecutionInfo* info,
                       std::string* error_msg) = 0;

  virtual ~Sandbox() = default;
  Sandbox() = default;
  Sandbox(const Sandbox&) = delete;
  Sandbox& operator=(const Sandbox&) = delete;

  template <typename T>
  class Register {
   public:
    Register() { Sandbox::Add(&T::Create, &T::Score); }
  };

 private:
  using registry_t = std::vector<std::pair<create_t, score_t>>;
  static registry_t* Registry();
  static void Add(create_t create, score_t score);
};

}  // namespace sandbox

#endif
