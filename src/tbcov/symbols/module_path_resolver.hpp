#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tbcov {

// maps a module path as recorded inside the guest onto a file on this machine
class module_path_resolver {
public:
  virtual ~module_path_resolver() = default;
  virtual std::optional<std::string> resolve_module_path(std::string_view recorded_path) const = 0;
};

/**
 * @brief Finds guest modules in a host copy of the guest filesystem or in search directories
 *
 * Guest roots are "guest_prefix=host_dir" entries: a recorded path under guest_prefix is looked
 * up at the same relative location under host_dir, longest prefix first. After that each search
 * directory is tried for the module's file name, and finally the recorded path itself.
 */
class search_path_resolver final : public module_path_resolver {
public:
  search_path_resolver(const std::vector<std::string>& guest_roots, std::vector<std::string> search_dirs);

  std::optional<std::string> resolve_module_path(std::string_view recorded_path) const override;

private:
  struct guest_root {
    std::string guest_prefix;
    std::string host_dir;
  };

  std::optional<std::string> resolve_under_roots(std::string_view recorded_path) const;

  std::vector<guest_root> roots_;
  std::vector<std::string> search_dirs_;
};

std::unique_ptr<module_path_resolver> make_module_path_resolver(
    const std::vector<std::string>& guest_roots, std::vector<std::string> search_dirs
);

// true for "guest_prefix=host_dir" with both sides present
bool is_valid_guest_root(std::string_view entry);

} // namespace tbcov
