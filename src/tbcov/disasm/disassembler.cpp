#include "disassembler.hpp"

#include <filesystem>

#include "tbcov/config/report_config.hpp"
#include "tbcov/util/path_utils.hpp"

namespace tbcov {

json_export_disassembler::json_export_disassembler(std::string export_dir, redlog::logger log)
    : export_dir_(std::move(export_dir)), log_(std::move(log)) {}

std::string json_export_disassembler::export_path_for(const std::string& module_path) const {
  return (std::filesystem::path(export_dir_) / (util::basename_for_path(module_path) + ".bbs.json")).string();
}

result<disassembly_info> json_export_disassembler::disassemble(const std::string& module_path) {
  std::string export_path = export_path_for(module_path);

  std::error_code ec;
  if (!std::filesystem::is_regular_file(export_path, ec)) {
    log_.wrn("no disassembler export found", redlog::field("module", module_path), redlog::field("path", export_path));
    return error_result<disassembly_info>(
        error_code::disassembly_unavailable, "no disassembler export for " + module_path + " at " + export_path
    );
  }

  auto loaded = load_disassembly_file(export_path);
  if (!loaded.ok()) {
    log_.err(
        "invalid disassembler export", redlog::field("path", export_path),
        redlog::field("error", loaded.status.message)
    );
    return error_result<disassembly_info>(error_code::disassembly_unavailable, loaded.status.message);
  }

  log_.dbg(
      "loaded disassembler export", redlog::field("path", export_path), redlog::field("blocks", loaded.value.bbs.size())
  );
  return loaded;
}

result<std::unique_ptr<disassembler>> make_disassembler(const report_config& config) {
  if (config.disassembler == "json_export") {
    return ok_result<std::unique_ptr<disassembler>>(
        std::make_unique<json_export_disassembler>(config.effective_export_dir())
    );
  }
  return error_result<std::unique_ptr<disassembler>>(
      error_code::unsupported, "unsupported disassembler backend: " + config.disassembler
  );
}

} // namespace tbcov
