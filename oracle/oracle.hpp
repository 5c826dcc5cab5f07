#ifndef ORACLE_ORACLE_HPP
#define ORACLE_ORACLE_HPP

#include <stdexcept>
#include <string>

#include "proto/swarm.pb.h"
#include "util/cancellation.hpp"

namespace oracle {

// The oracle could not produce a bundle for this request. Retrying may help.
class generation_fault : public std::runtime_error {
 public:
  explicit generation_fault(const std::string& msg)
      : std::runtime_error(msg) {}
};

// The oracle cannot be reached at all. Retrying will not help.
class oracle_unreachable : public std::runtime_error {
 public:
  explicit oracle_unreachable(const std::string& msg)
      : std::runtime_error(msg) {}
};

// The request was abandoned because the token was cancelled.
class generation_cancelled : public std::runtime_error {
 public:
  explicit generation_cancelled(const std::string& msg)
      : std::runtime_error(msg) {}
};

// Produces a bundle for a task. When prior is not null the oracle is asked to
// patch the previous attempt using the failure described there. Must be safe
// to call from many threads at once.
class Oracle {
 public:
  virtual proto::Bundle Generate(const proto::Task& task,
                                 const proto::AttemptContext* prior,
                                 const util::CancellationToken& token) = 0;
  virtual ~Oracle() = default;
};

}  // namespace oracle

#endif
