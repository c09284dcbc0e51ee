#pragma once

#include <string>
#include <string_view>

namespace pnn::core {

// Deterministic ASCII-only string helpers.
// Locale-independent; non-ASCII bytes pass through unchanged.

// normalize_ascii_lower converts ASCII uppercase (A-Z) to lowercase (a-z).
inline std::string normalize_ascii_lower(const std::string_view input) {
  std::string result;
  result.reserve(input.size());

  for (const char ch : input) {
    if (ch >= 'A' && ch <= 'Z') {
      constexpr char kCaseOffset = 'a' - 'A';
      result.push_back(static_cast<char>(ch + kCaseOffset));
    } else {
      result.push_back(ch);
    }
  }

  return result;
}

// normalize_ascii_upper converts ASCII lowercase (a-z) to uppercase (A-Z).
inline std::string normalize_ascii_upper(const std::string_view input) {
  std::string result;
  result.reserve(input.size());

  for (const char ch : input) {
    if (ch >= 'a' && ch <= 'z') {
      constexpr char kCaseOffset = 'a' - 'A';
      result.push_back(static_cast<char>(ch - kCaseOffset));
    } else {
      result.push_back(ch);
    }
  }

  return result;
}

inline bool is_ascii_space(const char ch) {
  return ch == ' ' || ch == '\t' || ch == '\n' || ch == '\r' || ch == '\f' || ch == '\v';
}

// trim removes leading and trailing ASCII whitespace
inline std::string trim(const std::string_view input) {
  std::size_t start = 0;
  while (start < input.size() && is_ascii_space(input[start])) {
    ++start;
  }

  std::size_t end = input.size();
  while (end > start && is_ascii_space(input[end - 1])) {
    --end;
  }

  return std::string{input.substr(start, end - start)};
}

// ends_with_ascii_ci reports whether input ends with suffix, ignoring ASCII case.
inline bool ends_with_ascii_ci(const std::string_view input, const std::string_view suffix) {
  if (suffix.size() > input.size()) {
    return false;
  }
  return normalize_ascii_lower(input.substr(input.size() - suffix.size())) ==
         normalize_ascii_lower(suffix);
}

}  // namespace pnn::core
