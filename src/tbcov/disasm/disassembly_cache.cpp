#include "disassembly_cache.hpp"

#include <filesystem>

#include "tbcov/engine/coverage_engine.hpp"

namespace tbcov {

disassembly_cache::disassembly_cache(std::string cache_dir, disassembler& backend, redlog::logger log)
    : cache_dir_(std::move(cache_dir)), backend_(backend), log_(std::move(log)) {}

std::string disassembly_cache::cache_path_for(const std::string& module_name) const {
  return (std::filesystem::path(cache_dir_) / (module_name + ".disas")).string();
}

std::optional<disassembly_info> disassembly_cache::load_cached(
    const std::string& module_name, const std::string& module_path
) const {
  namespace fs = std::filesystem;

  std::string disas_path = cache_path_for(module_name);
  log_.trc("checking for existing .disas file", redlog::field("path", disas_path));

  std::error_code ec;
  if (!fs::is_regular_file(disas_path, ec)) {
    log_.trc("no .disas file found", redlog::field("path", disas_path));
    return std::nullopt;
  }

  auto disas_time = fs::last_write_time(disas_path, ec);
  if (ec) {
    log_.wrn("cannot stat .disas file", redlog::field("path", disas_path), redlog::field("error", ec.message()));
    return std::nullopt;
  }

  auto target_time = fs::last_write_time(module_path, ec);
  if (ec) {
    log_.wrn(
        "cannot stat module, not trusting cache", redlog::field("module", module_path),
        redlog::field("error", ec.message())
    );
    return std::nullopt;
  }

  if (disas_time < target_time) {
    log_.inf("cached disassembly is out of date, regenerating", redlog::field("path", disas_path));
    return std::nullopt;
  }

  auto loaded = load_disassembly_file(disas_path);
  if (!loaded.ok()) {
    log_.wrn(
        "ignoring unreadable .disas file", redlog::field("path", disas_path),
        redlog::field("error", loaded.status.message)
    );
    return std::nullopt;
  }

  // module names are file names, so two modules can share an artifact
  if (!loaded.value.module_path.empty() && loaded.value.module_path != module_path) {
    log_.inf(
        "cached disassembly belongs to another module, regenerating", redlog::field("path", disas_path),
        redlog::field("cached_for", loaded.value.module_path), redlog::field("module", module_path)
    );
    return std::nullopt;
  }

  if (loaded.value.bbs.empty()) {
    log_.wrn("ignoring .disas file without basic blocks", redlog::field("path", disas_path));
    return std::nullopt;
  }

  // artifacts written by other tools may not be sorted
  if (!is_sorted_by_start(loaded.value.bbs)) {
    sort_by_start(loaded.value.bbs);
  }

  log_.inf(
      "using cached basic blocks", redlog::field("path", disas_path), redlog::field("blocks", loaded.value.bbs.size())
  );
  return std::move(loaded.value);
}

status disassembly_cache::store(const std::string& module_name, const disassembly_info& info) const {
  std::string disas_path = cache_path_for(module_name);
  log_.inf("saving disassembly information", redlog::field("path", disas_path));

  std::error_code ec;
  std::filesystem::create_directories(cache_dir_, ec);
  if (ec) {
    return make_status(error_code::io_error, "cannot create cache directory " + cache_dir_ + ": " + ec.message());
  }
  return save_disassembly_file(disas_path, info);
}

result<disassembly_info> disassembly_cache::load_or_disassemble(
    const std::string& module_name, const std::string& module_path
) {
  if (auto cached = load_cached(module_name, module_path)) {
    return ok_result(std::move(*cached));
  }

  log_.inf(
      "disassembling module", redlog::field("module", module_path),
      redlog::field("backend", std::string(backend_.name()))
  );
  auto disassembled = backend_.disassemble(module_path);
  if (!disassembled.ok()) {
    return error_result<disassembly_info>(
        error_code::disassembly_unavailable,
        "no disassembly information found for " + module_name + ": " + disassembled.status.message
    );
  }
  if (disassembled.value.bbs.empty()) {
    return error_result<disassembly_info>(
        error_code::disassembly_unavailable, "no disassembly information found for " + module_name
    );
  }

  sort_by_start(disassembled.value.bbs);
  disassembled.value.module_path = module_path;

  auto stored = store(module_name, disassembled.value);
  if (!stored.ok()) {
    log_.wrn(
        "failed to cache disassembly", redlog::field("module", module_name), redlog::field("error", stored.message)
    );
  }

  return disassembled;
}

} // namespace tbcov
