#include "core/validator.hpp"

#include <set>
#include <vector>

#include "absl/strings/ascii.h"
#include "absl/strings/match.h"
#include "absl/strings/str_cat.h"
#include "executor/dependencies.hpp"
#include "util/file.hpp"

namespace {

char ClosingFor(char open) {
  switch (open) {
    case '(':
      return ')';
    case '[':
      return ']';
    default:
      return '}';
  }
}

bool CheckUnits(const google::protobuf::RepeatedPtrField<proto::CodeUnit>& units,
                std::set<std::string>* names, std::string* reason) {
  for (const proto::CodeUnit& unit : units) {
    if (!util::File::IsSafeRelativePath(unit.name())) {
      *reason = "Invalid unit name: '" + unit.name() + "'";
      return false;
    }
    if (!names->insert(unit.name()).second) {
      *reason = "Duplicate unit: " + unit.name();
      return false;
    }
    if (absl::StripAsciiWhitespace(unit.content()).empty()) {
      *reason = "Empty unit: " + unit.name();
      return false;
    }
    if (absl::EndsWith(unit.name(), ".py")) {
      std::string error;
      if (!core::CheckPythonSource(unit.content(), &error)) {
        *reason = absl::StrCat(unit.name(), ": ", error);
        return false;
      }
    }
  }
  return true;
}

}  // namespace

namespace core {

bool ValidateBundle(const proto::Bundle& bundle, std::string* reason) {
  if (bundle.source_size() == 0) {
    *reason = "No source units";
    return false;
  }
  if (bundle.tests_size() == 0) {
    *reason = "No test units";
    return false;
  }
  std::set<std::string> names;
  if (!CheckUnits(bundle.source(), &names, reason)) return false;
  if (!CheckUnits(bundle.tests(), &names, reason)) return false;
  for (const std::string& dependency : bundle.dependencies()) {
    std::string name = executor::NormalizeDependency(dependency);
    if (name.empty()) continue;
    if (!executor::IsLegalDependencyName(name)) {
      *reason = "Invalid dependency: " + dependency;
      return false;
    }
  }
  return true;
}

bool CheckPythonSource(const std::string& source, std::string* reason) {
  struct Open {
    char bracket;
    int line;
  };
  std::vector<Open> stack;
  int line = 1;
  size_t i = 0;
  while (i < source.size()) {
    char c = source[i];
    if (c == '\n') {
      line++;
      i++;
    } else if (c == '#') {
      while (i < source.size() && source[i] != '\n') i++;
    } else if (c == '\\') {
      // Line continuation, or a stray backslash the interpreter will reject.
      if (i + 1 < source.size() && source[i + 1] == '\n') line++;
      i += 2;
    } else if (c == '\'' || c == '"') {
      const int start_line = line;
      const bool triple = source.compare(i, 3, std::string(3, c)) == 0;
      i += triple ? 3 : 1;
      bool closed = false;
      while (i < source.size()) {
        if (source[i] == '\\') {
          if (i + 1 < source.size() && source[i + 1] == '\n') line++;
          i += 2;
          continue;
        }
        if (source[i] == '\n') {
          if (!triple) break;
          line++;
        } else if (source[i] == c &&
                   (!triple || source.compare(i, 3, std::string(3, c)) == 0)) {
          i += triple ? 3 : 1;
          closed = true;
          break;
        }
        i++;
      }
      if (!closed) {
        *reason =
            absl::StrCat("Unterminated string literal at line ", start_line);
        return false;
      }
    } else if (c == '(' || c == '[' || c == '{') {
      stack.push_back({c, line});
      i++;
    } else if (c == ')' || c == ']' || c == '}') {
      if (stack.empty() || ClosingFor(stack.back().bracket) != c) {
        *reason = absl::StrCat("Unmatched '", std::string(1, c), "' at line ",
                               line);
        return false;
      }
      stack.pop_back();
      i++;
    } else {
      i++;
    }
  }
  if (!stack.empty()) {
    *reason = absl::StrCat("'", std::string(1, stack.back().bracket),
                           "' opened at line ", stack.back().line,
                           " is never closed");
    return false;
  }
  return true;
}

}  // namespace core
