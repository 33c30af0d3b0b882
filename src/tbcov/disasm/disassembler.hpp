#pragma once

#include <memory>
#include <string>
#include <string_view>

#include <redlog.hpp>

#include "tbcov/core/result.hpp"
#include "tbcov/disasm/disassembly_info.hpp"

namespace tbcov {

struct report_config;

/**
 * @brief Source of static basic block information for a module
 *
 * Implementations wrap an external disassembler. Returned blocks need not be sorted.
 */
class disassembler {
public:
  virtual ~disassembler() = default;
  virtual std::string_view name() const = 0;
  virtual result<disassembly_info> disassemble(const std::string& module_path) = 0;
};

/**
 * @brief Loads the export an external disassembler plugin wrote for a module
 *
 * The plugin leaves <export_dir>/<module name>.bbs.json next to the project, using the same
 * document layout as the .disas cache.
 */
class json_export_disassembler final : public disassembler {
public:
  explicit json_export_disassembler(
      std::string export_dir, redlog::logger log = redlog::get_logger("tbcov.disasm.json_export")
  );

  std::string_view name() const override { return "json_export"; }
  result<disassembly_info> disassemble(const std::string& module_path) override;

  std::string export_path_for(const std::string& module_path) const;

private:
  std::string export_dir_;
  redlog::logger log_;
};

result<std::unique_ptr<disassembler>> make_disassembler(const report_config& config);

} // namespace tbcov
