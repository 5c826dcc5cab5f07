#include "util/misc.hpp"

#include <iterator>

#include "absl/strings/ascii.h"
#include "absl/strings/match.h"
#include "absl/strings/strip.h"
#include "absl/time/clock.h"

namespace util {

std::vector<std::string> split(const std::string& s, char delim) {
  std::vector<std::string> elems;
  split(s, delim, std::back_inserter(elems));
  return elems;
}

std::string tail(const std::string& s, size_t max_bytes) {
  if (s.size() <= max_bytes) return s;
  return s.substr(s.size() - max_bytes);
}

std::string strip_code_fences(const std::string& content) {
  absl::string_view body = absl::StripAsciiWhitespace(content);
  if (!absl::StartsWith(body, "```")) return content;
  size_t first_newline = body.find('\n');
  if (first_newline == absl::string_view::npos) return content;
  body.remove_prefix(first_newline + 1);
  body = absl::StripTrailingAsciiWhitespace(body);
  if (absl::EndsWith(body, "```")) {
    body.remove_suffix(3);
  }
  return std::string(absl::StripTrailingAsciiWhitespace(body)) + "\n";
}

int64_t now_millis() { return absl::ToUnixMillis(absl::Now()); }

}  // namespace util
