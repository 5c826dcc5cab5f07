#ifndef UTIL_MISC_HPP
#define UTIL_MISC_HPP
#include <cstdint>
#include <sstream>
#include <string>
#include <vector>

namespace util {

template <typename Out>
void split(const std::string& s, char delim, Out result) {
  std::stringstream ss(s);
  std::string item;
  while (std::getline(ss, item, delim)) {
    if (!item.empty()) *(result++) = item;
  }
}
std::vector<std::string> split(const std::string& s, char delim);

// Returns the last max_bytes bytes of s.
std::string tail(const std::string& s, size_t max_bytes);

// Removes a surrounding Markdown code fence (```lang ... ```), if present.
std::string strip_code_fences(const std::string& content);

// Milliseconds since the Unix epoch.
int64_t now_millis();

}  // namespace util
#endif
