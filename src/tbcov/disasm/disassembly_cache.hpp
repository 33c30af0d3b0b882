#pragma once

#include <optional>
#include <string>

#include <redlog.hpp>

#include "tbcov/core/result.hpp"
#include "tbcov/disasm/disassembler.hpp"
#include "tbcov/disasm/disassembly_info.hpp"

namespace tbcov {

/**
 * @brief Keeps sorted disassembly results in <cache_dir>/<module>.disas
 *
 * An artifact older than the module binary is regenerated. Whatever is returned has its
 * blocks sorted by start address.
 */
class disassembly_cache {
public:
  disassembly_cache(
      std::string cache_dir, disassembler& backend, redlog::logger log = redlog::get_logger("tbcov.cache")
  );

  result<disassembly_info> load_or_disassemble(const std::string& module_name, const std::string& module_path);

  // cached entry if present, fresh and readable
  std::optional<disassembly_info> load_cached(const std::string& module_name, const std::string& module_path) const;

  status store(const std::string& module_name, const disassembly_info& info) const;

  std::string cache_path_for(const std::string& module_name) const;

private:
  std::string cache_dir_;
  disassembler& backend_;
  redlog::logger log_;
};

} // namespace tbcov
