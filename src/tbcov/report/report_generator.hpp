#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include <redlog.hpp>

#include "tbcov/config/report_config.hpp"
#include "tbcov/core/result.hpp"
#include "tbcov/disasm/disassembler.hpp"
#include "tbcov/engine/coverage_engine.hpp"
#include "tbcov/model/trace_types.hpp"
#include "tbcov/symbols/module_path_resolver.hpp"
#include "tbcov/trace/trace_source.hpp"

namespace tbcov {

struct module_report {
  // module path as the trace recorded it
  std::string recorded_path;
  // where it was found on this machine, empty if resolution failed
  std::string module_path;
  // JSON file or drcov directory
  std::string report_path;
  coverage_stats stats;
  tbcov::status status;
};

struct run_summary {
  std::vector<module_report> modules;

  size_t reports_written() const;
  size_t modules_skipped() const;
  size_t modules_failed() const;
};

/**
 * @brief Produces a coverage report for every module found in the trace
 *
 * Unresolvable modules are logged and skipped. A module whose disassembly or coverage is
 * missing, or whose report cannot be written, fails on its own; the run carries on and its
 * status is the first such failure. In drcov format the drcov/ directory is claimed when the
 * first module has coverage to write, and removed again if the run wrote nothing into it.
 */
class report_generator {
public:
  report_generator(
      report_config config, disassembler& backend, const module_path_resolver& resolver,
      redlog::logger log = redlog::get_logger("tbcov.report")
  );

  /**
   * @brief Validates config, applies its verbosity and runs with the configured backends
   *
   * The disassembler comes from make_disassembler(config) and the resolver from the config's
   * guest roots and search paths.
   */
  static result<run_summary> run(
      const report_config& config, trace_source& traces, redlog::logger log = redlog::get_logger("tbcov.report")
  );

  result<run_summary> generate(trace_source& traces) const;

  const report_config& config() const { return config_; }

private:
  module_report generate_module(
      const std::string& recorded_path, const state_intervals& intervals, bool& drcov_claimed
  ) const;

  result<std::string> write_report(
      const std::string& module_path, const disassembly_info& disas, const coverage_result& coverage,
      const coverage_stats& stats, bool& drcov_claimed
  ) const;

  report_config config_;
  disassembler& backend_;
  const module_path_resolver& resolver_;
  coverage_engine engine_;
  redlog::logger log_;
};

} // namespace tbcov
