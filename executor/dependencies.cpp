#include "executor/dependencies.hpp"

#include <ctype.h>

#include <algorithm>
#include <set>

#include "absl/strings/ascii.h"
#include "absl/strings/string_view.h"
#include "glog/logging.h"

namespace {
bool IsIllegalChar(char c) {
  return !isalnum(static_cast<unsigned char>(c)) && c != '.' && c != '-' &&
         c != '_';
}

const std::set<std::string>& StandardModules() {
  static const auto* modules = new std::set<std::string>{
      "abc",        "argparse", "asyncio",   "base64",      "collections",
      "contextlib", "copy",     "csv",       "dataclasses", "datetime",
      "decimal",    "enum",     "functools", "hashlib",     "heapq",
      "io",         "itertools", "json",     "logging",     "math",
      "os",         "pathlib",  "pickle",    "random",      "re",
      "shutil",     "sqlite3",  "string",    "subprocess",  "sys",
      "tempfile",   "threading", "time",     "typing",      "unittest",
      "uuid"};
  return *modules;
}
}  // namespace

namespace executor {

std::string NormalizeDependency(const std::string& spec) {
  absl::string_view name = spec;
  size_t end = name.find_first_of("=<>!~;[@ \t");
  if (end != absl::string_view::npos) name = name.substr(0, end);
  name = absl::StripAsciiWhitespace(name);
  return absl::AsciiStrToLower(name);
}

bool IsStandardModule(const std::string& name) {
  return StandardModules().count(absl::AsciiStrToLower(name)) != 0;
}

bool IsLegalDependencyName(const std::string& name) {
  return !name.empty() &&
         std::find_if(name.begin(), name.end(), IsIllegalChar) == name.end();
}

std::vector<std::string> SanitizeDependencies(
    const google::protobuf::RepeatedPtrField<std::string>& dependencies) {
  std::vector<std::string> result;
  std::set<std::string> seen;
  for (const std::string& spec : dependencies) {
    std::string name = NormalizeDependency(spec);
    if (name.empty() || IsStandardModule(name)) continue;
    if (!IsLegalDependencyName(name)) {
      LOG(WARNING) << "Dropping dependency with an illegal name: " << spec;
      continue;
    }
    if (seen.insert(name).second) result.push_back(name);
  }
  return result;
}

}  // namespace executor
