#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace r3b1nd::catalog {

inline std::string_view basename_view(std::string_view path) {
  const size_t pos = path.find_last_of('/');
  if (pos == std::string_view::npos) {
    return path;
  }
  return path.substr(pos + 1);
}

// a pattern containing '/' must equal the full path, otherwise it is compared against the basename
inline bool image_matches(std::string_view pattern, std::string_view path) {
  if (pattern.empty()) {
    return true;
  }
  if (path.empty()) {
    return false;
  }
  if (pattern.find('/') != std::string_view::npos) {
    return path == pattern;
  }
  return basename_view(path) == pattern;
}

inline bool image_in_list(const std::vector<std::string>& patterns, std::string_view path) {
  for (const auto& pattern : patterns) {
    if (!pattern.empty() && image_matches(pattern, path)) {
      return true;
    }
  }
  return false;
}

} // namespace r3b1nd::catalog
