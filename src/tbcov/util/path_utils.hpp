#pragma once

#include <string>
#include <string_view>

namespace tbcov::util {

// file name of a guest or host path; both separator styles count and trailing ones are dropped
inline std::string basename_for_path(std::string_view path) {
  constexpr std::string_view separators = "/\\";

  size_t last = path.find_last_not_of(separators);
  if (last == std::string_view::npos) {
    return {};
  }
  path = path.substr(0, last + 1);

  size_t cut = path.find_last_of(separators);
  return std::string(cut == std::string_view::npos ? path : path.substr(cut + 1));
}

} // namespace tbcov::util
