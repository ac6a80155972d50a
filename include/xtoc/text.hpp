/**
 * @file text.hpp
 * @brief Small ASCII text helpers shared by the framer and reassembler.
 */
#pragma once

#include <stddef.h>
#include <string>
#include <vector>

namespace xtoc {

inline bool is_space(char c) {
  return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\f' || c == '\v';
}

/// Copy of `s` without leading/trailing ASCII whitespace.
inline std::string trim_copy(const std::string& s) {
  size_t b = 0;
  size_t e = s.size();
  while (b < e && is_space(s[b])) ++b;
  while (e > b && is_space(s[e - 1])) --e;
  return s.substr(b, e - b);
}

/// Split on '\n'. A '\r' before the newline stays on the line; trim it.
inline std::vector<std::string> split_lines(const std::string& text) {
  std::vector<std::string> out;
  size_t start = 0;
  for (;;) {
    const size_t nl = text.find('\n', start);
    if (nl == std::string::npos) {
      out.push_back(text.substr(start));
      return out;
    }
    out.push_back(text.substr(start, nl - start));
    start = nl + 1;
  }
}

} // namespace xtoc
