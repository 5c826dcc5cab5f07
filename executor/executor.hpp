#ifndef EXECUTOR_EXECUTOR_HPP
#define EXECUTOR_EXECUTOR_HPP
#include <string>

#include "proto/swarm.pb.h"
#include "util/cancellation.hpp"

namespace executor {

// Observes the lifetime of the isolated environments created by an executor.
// Both methods may be called concurrently from different threads.
class EnvironmentListener {
 public:
  virtual void OnAcquire(const std::string& environment) = 0;
  virtual void OnRelease(const std::string& environment) = 0;
  virtual ~EnvironmentListener() = default;
};

// The sandbox handle: runs the tests of a bundle inside an environment that is
// created for that single call and released before the call returns.
class Executor {
 public:
  // A string that identifies this executor.
  virtual std::string Id() const = 0;

  // Installs the dependencies of the bundle and runs its tests. Sandbox-level
  // problems are reported through ExecutionResult::fault, never thrown. If
  // the token is cancelled during the call, the environment is torn down and
  // the fault is INTERRUPTED.
  virtual proto::ExecutionResult Execute(
      const proto::ExecutionRequest& request,
      const util::CancellationToken& token) = 0;

  // Stops every environment that is running, from outside. The calls in
  // progress return with an INTERRUPTED fault.
  virtual void ForceRelease() = 0;

  Executor() = default;
  virtual ~Executor() = default;
  Executor(const Executor&) = delete;
  Executor& operator=(const Executor&) = delete;
  Executor(Executor&&) = delete;
  Executor& operator=(Executor&&) = delete;
};

}  // namespace executor

#endif
