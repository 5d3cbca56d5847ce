#ifndef CANDIDATE_REGISTRY_TEXT_UTILS_H
#define CANDIDATE_REGISTRY_TEXT_UTILS_H

#include <cctype>
#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace text {

inline std::string Trim(std::string_view value) {
  std::size_t start = 0;
  std::size_t end = value.size();
  while (start < end && std::isspace(static_cast<unsigned char>(value[start]))) {
    ++start;
  }
  while (end > start && std::isspace(static_cast<unsigned char>(value[end - 1]))) {
    --end;
  }
  return std::string(value.substr(start, end - start));
}

// Base-10 integer with optional sign and surrounding whitespace. Anything
// else, including overflow, yields nullopt.
inline std::optional<long long> ParseInteger(std::string_view value) {
  const std::string trimmed = Trim(value);
  if (trimmed.empty()) {
    return std::nullopt;
  }
  try {
    std::size_t consumed = 0;
    const long long parsed = std::stoll(trimmed, &consumed, 10);
    if (consumed != trimmed.size()) {
      return std::nullopt;
    }
    return parsed;
  } catch (const std::logic_error &) {
    return std::nullopt;
  }
}

}  // namespace text

#endif  // CANDIDATE_REGISTRY_TEXT_UTILS_H
