#include "report_config.hpp"

#include "tbcov/symbols/module_path_resolver.hpp"
#include "tbcov/util/env_config.hpp"

namespace tbcov {

status report_config::validate() const {
  if (project_dir.empty()) {
    return make_status(error_code::invalid_argument, "project directory cannot be empty");
  }
  if (output_dir.empty()) {
    return make_status(error_code::invalid_argument, "output directory cannot be empty");
  }
  if (disassembler.empty()) {
    return make_status(error_code::invalid_argument, "disassembler backend cannot be empty");
  }
  for (const auto& root : guest_roots) {
    if (!is_valid_guest_root(root)) {
      return make_status(error_code::invalid_argument, "guest root must be guest_prefix=host_dir: " + root);
    }
  }
  if (verbose < 0) {
    return make_status(error_code::invalid_argument, "verbosity cannot be negative");
  }
  return ok_status();
}

void report_config::log_config(const redlog::logger& log) const {
  log.dbg("report configuration:");
  log.dbg("  project dir", redlog::field("dir", project_dir));
  log.dbg("  output dir", redlog::field("dir", output_dir));
  log.dbg("  format", redlog::field("format", report_format_name(format)));
  log.dbg(
      "  disassembler", redlog::field("backend", disassembler), redlog::field("export_dir", effective_export_dir())
  );
  log.dbg("  scan start", redlog::field("mode", scan_start_mode_name(scan_start)));
  for (const auto& root : guest_roots) {
    log.dbg("  guest root", redlog::field("mapping", root));
  }
  if (!search_paths.empty()) {
    log.dbg("  search paths", redlog::field("count", search_paths.size()));
    for (const auto& path : search_paths) {
      log.dbg("    path", redlog::field("path", path));
    }
  }
}

report_config report_config::from_environment() {
  util::env_config loader("TBCOV");

  report_config config;
  config.project_dir = loader.get<std::string>("PROJECT_DIR", config.project_dir);
  config.output_dir = loader.get<std::string>("OUTPUT_DIR", config.output_dir);
  config.format = loader.get_enum<report_format>(
      {
          {"json", report_format::json},
          {"drcov", report_format::drcov},
          {"lighthouse", report_format::drcov},
      },
      "FORMAT", config.format
  );
  config.disassembler = loader.get<std::string>("DISASSEMBLER", config.disassembler);
  config.export_dir = loader.get<std::string>("EXPORT_DIR", config.export_dir);
  config.guest_roots = loader.get_list("GUEST_ROOTS");
  config.search_paths = loader.get_list("SEARCH_PATHS");
  config.scan_start = loader.get_enum<scan_start_mode>(
      {
          {"insertion", scan_start_mode::insertion},
          {"exact", scan_start_mode::exact},
          {"legacy", scan_start_mode::exact},
      },
      "SCAN_START", config.scan_start
  );
  config.verbose = loader.get<int>("VERBOSE", config.verbose);
  return config;
}

redlog::level verbosity_to_level(int verbose) {
  if (verbose <= 0) {
    return redlog::level::info;
  }
  if (verbose == 1) {
    return redlog::level::verbose;
  }
  if (verbose == 2) {
    return redlog::level::trace;
  }
  if (verbose == 3) {
    return redlog::level::debug;
  }
  return redlog::level::pedantic;
}

} // namespace tbcov
