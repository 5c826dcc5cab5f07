#ifndef ORACLE_PROCESS_ORACLE_HPP
#define ORACLE_PROCESS_ORACLE_HPP

#include <cstdint>
#include <string>
#include <vector>

#include "oracle/oracle.hpp"
#include "sandbox/sandbox.hpp"

namespace oracle {

// Asks an external program for the bundles. The program receives a
// GenerationRequest in protobuf text format on its standard input and must
// print a Bundle, in the same format, on its standard output.
//
// Throws oracle_unreachable only when the command is missing or cannot be
// looked up. Failures to start or talk to it are generation faults.
class ProcessOracle : public Oracle {
 public:
  ProcessOracle(std::vector<std::string> command, int64_t timeout_millis,
                std::string temp_directory);

  proto::Bundle Generate(const proto::Task& task,
                         const proto::AttemptContext* prior,
                         const util::CancellationToken& token) override;

 private:
  // Runs the oracle once in a fresh scratch directory.
  proto::Bundle Exchange(sandbox::Sandbox* sb, const std::string& executable,
                         const std::string& request_text,
                         const util::CancellationToken& token);

  std::vector<std::string> command_;
  int64_t timeout_millis_;
  std::string temp_directory_;
};

}  // namespace oracle

#endif
