#pragma once
#include "models/CoreTypes.hpp"
#include <algorithm>
#include <string>
#include <utility>

// (line, column) of a byte offset in raw text, both 1-based.
inline std::pair<size_t, size_t> calc_line_col(const std::string &s,
                                               size_t byte_pos) {
  byte_pos = std::min(byte_pos, s.size());
  size_t line = 1, col = 1;
  for (size_t i = 0; i < byte_pos; ++i) {
    if (s[i] == '\n') {
      ++line;
      col = 1;
    } else {
      ++col;
    }
  }
  return {line, col};
}

// Up to `window` bytes either side of the offset, then a caret line under it.
// Newlines inside the window are flattened so the caret stays aligned.
inline std::string context_snippet(const std::string &s, size_t byte_pos,
                                   size_t window = 40) {
  byte_pos = std::min(byte_pos, s.size());
  const size_t start = byte_pos > window ? byte_pos - window : 0;
  const size_t end = std::min(s.size(), byte_pos + window);
  std::string snippet = s.substr(start, end - start);
  std::replace(snippet.begin(), snippet.end(), '\n', ' ');
  return snippet + "\n" + std::string(byte_pos - start, ' ') + '^';
}

// Error body for a request whose JSON failed to parse.
inline Json parse_error_json(const std::string &body,
                             const Json::parse_error &e) {
  // nlohmann reports the byte *after* the offending character
  const size_t byte = e.byte > 0 ? e.byte - 1 : 0;
  auto [line, col] = calc_line_col(body, byte);
  return Json{{"ok", false},
              {"kind", "parse_error"},
              {"what", e.what()},
              {"byte", byte},
              {"line", line},
              {"column", col},
              {"context", context_snippet(body, byte)}};
}
