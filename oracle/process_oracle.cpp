#include "oracle/process_oracle.hpp"

#include <stdexcept>
#include <system_error>

#include "absl/strings/str_cat.h"
#include "glog/logging.h"
#include "google/protobuf/text_format.h"
#include "sandbox/sandbox.hpp"
#include "util/file.hpp"
#include "util/misc.hpp"
#include "util/which.hpp"

namespace {
const constexpr size_t kMaxErrorBytes = 2048;

void CleanUnits(google::protobuf::RepeatedPtrField<proto::CodeUnit>* units) {
  for (proto::CodeUnit& unit : *units) {
    unit.set_content(util::strip_code_fences(unit.content()));
  }
}
}  // namespace

namespace oracle {

ProcessOracle::ProcessOracle(std::vector<std::string> command,
                             int64_t timeout_millis,
                             std::string temp_directory)
    : command_(std::move(command)),
      timeout_millis_(timeout_millis),
      temp_directory_(std::move(temp_directory)) {}

proto::Bundle ProcessOracle::Generate(const proto::Task& task,
                                      const proto::AttemptContext* prior,
                                      const util::CancellationToken& token) {
  if (command_.empty()) throw oracle_unreachable("No oracle command");
  std::string executable;
  try {
    executable = util::which(command_[0]);
  } catch (const std::runtime_error& exc) {
    throw oracle_unreachable(
        absl::StrCat("Unable to look up ", command_[0], ": ", exc.what()));
  }
  if (executable.empty() || !util::File::Exists(executable)) {
    throw oracle_unreachable("Oracle command not found: " + command_[0]);
  }

  proto::GenerationRequest request;
  *request.mutable_task() = task;
  if (prior) *request.mutable_prior() = *prior;
  std::string request_text;
  if (!google::protobuf::TextFormat::PrintToString(request, &request_text)) {
    throw generation_fault("Unable to serialize the request");
  }

  std::unique_ptr<sandbox::Sandbox> sb = sandbox::Sandbox::Create();
  if (!sb) throw oracle_unreachable("No sandbox implementation available");

  // Scratch file errors only fail this attempt.
  try {
    return Exchange(sb.get(), executable, request_text, token);
  } catch (const std::system_error& exc) {
    throw generation_fault(
        absl::StrCat("Unable to exchange files with the oracle: ",
                     exc.what()));
  }
}

proto::Bundle ProcessOracle::Exchange(sandbox::Sandbox* sb,
                                      const std::string& executable,
                                      const std::string& request_text,
                                      const util::CancellationToken& token) {
  util::TempDir tmp(temp_directory_);
  std::string request_file = util::File::JoinPath(tmp.Path(), "request.txt");
  util::File::Write(request_file, request_text);

  sandbox::ExecutionOptions options(tmp.Path(), executable);
  options.args.assign(command_.begin() + 1, command_.end());
  options.stdin_file = request_file;
  options.stdout_file = util::File::JoinPath(tmp.Path(), "stdout");
  options.stderr_file = util::File::JoinPath(tmp.Path(), "stderr");
  options.wall_limit_millis = timeout_millis_;
  options.should_stop = [&token]() { return token.IsCancelled(); };

  sandbox::ExecutionInfo info;
  std::string error_msg;
  if (!sb->Execute(options, &info, &error_msg)) {
    throw generation_fault("Unable to start the oracle: " + error_msg);
  }
  if (info.stopped) throw generation_cancelled("Cancelled during generation");
  if (info.timed_out) {
    throw generation_fault(
        absl::StrCat("Oracle did not answer within ", timeout_millis_, "ms"));
  }
  if (info.status_code != 0 || info.signal != 0) {
    std::string err = util::File::ReadTail(options.stderr_file, kMaxErrorBytes);
    throw generation_fault(absl::StrCat("Oracle failed (status ",
                                        info.status_code, ", signal ",
                                        info.signal, "): ", err));
  }

  proto::Bundle bundle;
  if (!google::protobuf::TextFormat::ParseFromString(
          util::File::Read(options.stdout_file), &bundle)) {
    throw generation_fault("Malformed oracle output");
  }
  CleanUnits(bundle.mutable_source());
  CleanUnits(bundle.mutable_tests());
  VLOG(2) << "Oracle produced " << bundle.source_size() << " source and "
          << bundle.tests_size() << " test units";
  return bundle;
}

}  // namespace oracle
