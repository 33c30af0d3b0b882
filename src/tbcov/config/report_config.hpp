#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include <redlog.hpp>

#include "tbcov/core/result.hpp"
#include "tbcov/engine/coverage_engine.hpp"

namespace tbcov {

enum class report_format : uint8_t {
  json,
  drcov,
};

inline constexpr const char* report_format_name(report_format format) {
  switch (format) {
  case report_format::json:
    return "json";
  case report_format::drcov:
    return "drcov";
  }
  return "unknown";
}

struct report_config {
  // holds the <module>.disas cache artifacts
  std::string project_dir = ".";
  // receives <module>_coverage.json or the drcov/ directory
  std::string output_dir = "s2e-last";
  report_format format = report_format::json;

  std::string disassembler = "json_export";
  // where the disassembler plugin leaves its exports; empty means project_dir
  std::string export_dir;

  // guest_prefix=host_dir entries for a host copy of the guest filesystem
  std::vector<std::string> guest_roots;
  std::vector<std::string> search_paths;

  scan_start_mode scan_start = scan_start_mode::insertion;
  int verbose = 0;

  std::string effective_export_dir() const { return export_dir.empty() ? project_dir : export_dir; }

  status validate() const;
  void log_config(const redlog::logger& log) const;

  static report_config from_environment();
};

// maps a verbosity count onto redlog levels, 0 = info
redlog::level verbosity_to_level(int verbose);

} // namespace tbcov
