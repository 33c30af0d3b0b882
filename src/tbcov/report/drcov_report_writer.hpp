#pragma once

#include <cstdint>
#include <string>

#include <redlog.hpp>

#include "tbcov/core/result.hpp"
#include "tbcov/formats/drcov.hpp"
#include "tbcov/model/trace_types.hpp"

namespace tbcov {

inline constexpr const char* drcov_flavor = "S2E";
inline constexpr const char* drcov_directory_name = "drcov";

/**
 * @brief Writes one drcov file per state under <output_dir>/drcov
 *
 * The directory is created by prepare(), which fails if it already exists so that an earlier
 * run's reports are never merged into or overwritten. write_binary() does both steps for a
 * single module.
 */
class drcov_report_writer {
public:
  explicit drcov_report_writer(std::string output_dir, redlog::logger log = redlog::get_logger("tbcov.report.drcov"));

  status prepare() const;

  // writes into the prepared directory; returns its path
  result<std::string> write_module(
      const std::string& module_path, uint64_t module_base, uint64_t module_end,
      const coverage_result& coverage_by_state
  ) const;

  result<std::string> write_binary(
      const std::string& module_path, uint64_t module_base, uint64_t module_end,
      const coverage_result& coverage_by_state
  ) const;

  std::string directory() const;
  std::string report_path_for(const std::string& module_path, state_id state) const;

  drcov::coverage_data build_state_coverage(
      const std::string& module_path, uint64_t module_base, uint64_t module_end, const covered_blocks& blocks
  ) const;

private:
  std::string output_dir_;
  redlog::logger log_;
};

} // namespace tbcov
