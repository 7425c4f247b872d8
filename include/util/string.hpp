#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace waywidgets::util {

inline constexpr std::string_view WHITESPACE = " \n\r\t\f\v";

inline std::string ltrim(std::string_view s) {
  size_t begin = s.find_first_not_of(WHITESPACE);
  return (begin == std::string_view::npos) ? "" : std::string(s.substr(begin));
}

inline std::string rtrim(std::string_view s) {
  size_t end = s.find_last_not_of(WHITESPACE);
  return (end == std::string_view::npos) ? "" : std::string(s.substr(0, end + 1));
}

inline std::string trim(std::string_view s) { return rtrim(ltrim(s)); }

inline std::vector<std::string> split(std::string_view s, std::string_view delimiter) {
  std::vector<std::string> result;
  size_t pos = 0;
  size_t next_pos = 0;
  while ((next_pos = s.find(delimiter, pos)) != std::string_view::npos) {
    result.emplace_back(s.substr(pos, next_pos - pos));
    pos = next_pos + delimiter.size();
  }
  result.emplace_back(s.substr(pos));
  return result;
}

// Everything after the first `delimiter`, or `s` itself when there is none
inline std::string stripThrough(std::string_view s, char delimiter) {
  auto pos = s.find(delimiter);
  return std::string(pos == std::string_view::npos ? s : s.substr(pos + 1));
}

}  // namespace waywidgets::util
