#include "module_path_resolver.hpp"

#include <algorithm>
#include <filesystem>

#include "tbcov/util/path_utils.hpp"

namespace tbcov {

namespace {

bool is_separator(char c) { return c == '/' || c == '\\'; }

bool is_existing_file(const std::filesystem::path& candidate) {
  std::error_code ec;
  return std::filesystem::is_regular_file(candidate, ec);
}

// remainder of path below prefix, matching whole components only
std::optional<std::string_view> relative_below(std::string_view path, std::string_view prefix) {
  while (prefix.size() > 1 && is_separator(prefix.back())) {
    prefix.remove_suffix(1);
  }
  if (path.substr(0, prefix.size()) != prefix) {
    return std::nullopt;
  }
  std::string_view rest = path.substr(prefix.size());
  if (!rest.empty() && !is_separator(rest.front()) && !is_separator(prefix.back())) {
    return std::nullopt;
  }
  while (!rest.empty() && is_separator(rest.front())) {
    rest.remove_prefix(1);
  }
  return rest;
}

} // namespace

bool is_valid_guest_root(std::string_view entry) {
  auto eq_pos = entry.find('=');
  return eq_pos != std::string_view::npos && eq_pos != 0 && eq_pos + 1 < entry.size();
}

search_path_resolver::search_path_resolver(
    const std::vector<std::string>& guest_roots, std::vector<std::string> search_dirs
)
    : search_dirs_(std::move(search_dirs)) {
  for (const auto& entry : guest_roots) {
    if (!is_valid_guest_root(entry)) {
      continue;
    }
    auto eq_pos = entry.find('=');
    roots_.push_back(guest_root{entry.substr(0, eq_pos), entry.substr(eq_pos + 1)});
  }

  // most specific guest prefix wins
  std::stable_sort(roots_.begin(), roots_.end(), [](const guest_root& left, const guest_root& right) {
    return left.guest_prefix.size() > right.guest_prefix.size();
  });
}

std::optional<std::string> search_path_resolver::resolve_under_roots(std::string_view recorded_path) const {
  for (const auto& root : roots_) {
    auto relative = relative_below(recorded_path, root.guest_prefix);
    if (!relative || relative->empty()) {
      continue;
    }

    std::string host_relative(*relative);
    std::replace(host_relative.begin(), host_relative.end(), '\\', '/');
    std::filesystem::path candidate = std::filesystem::path(root.host_dir) / host_relative;
    if (is_existing_file(candidate)) {
      return candidate.string();
    }
  }
  return std::nullopt;
}

std::optional<std::string> search_path_resolver::resolve_module_path(std::string_view recorded_path) const {
  if (recorded_path.empty()) {
    return std::nullopt;
  }

  if (auto rooted = resolve_under_roots(recorded_path)) {
    return rooted;
  }

  std::string module_name = util::basename_for_path(recorded_path);
  if (module_name.empty()) {
    return std::nullopt;
  }

  for (const auto& dir : search_dirs_) {
    if (dir.empty()) {
      continue;
    }
    std::filesystem::path candidate = std::filesystem::path(dir) / module_name;
    if (is_existing_file(candidate)) {
      return candidate.string();
    }
  }

  std::filesystem::path recorded{std::string(recorded_path)};
  if (is_existing_file(recorded)) {
    return recorded.string();
  }
  return std::nullopt;
}

std::unique_ptr<module_path_resolver> make_module_path_resolver(
    const std::vector<std::string>& guest_roots, std::vector<std::string> search_dirs
) {
  return std::make_unique<search_path_resolver>(guest_roots, std::move(search_dirs));
}

} // namespace tbcov
