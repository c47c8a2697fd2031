#pragma once

#include <algorithm>
#include <cctype>
#include <string>

namespace cadence::util {

inline std::string ToLower(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return text;
}

} // namespace cadence::util
