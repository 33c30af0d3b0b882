#pragma once

#include <cstddef>
#include <string>

#include <nlohmann/json.hpp>
#include <redlog.hpp>

#include "tbcov/core/result.hpp"
#include "tbcov/model/trace_types.hpp"

namespace tbcov {

/**
 * @brief Writes the aggregate <module>_coverage.json report
 *
 * Covered blocks of every state are concatenated into one list; a block hit by two states
 * appears twice. Per-state separation is only kept by the drcov writer.
 */
class json_report_writer {
public:
  explicit json_report_writer(std::string output_dir, redlog::logger log = redlog::get_logger("tbcov.report.json"));

  result<std::string> write_json(
      const std::string& module_name, const coverage_result& coverage_by_state, size_t total_bbs,
      size_t covered_bbs_count
  ) const;

  std::string report_path_for(const std::string& module_name) const;

  static nlohmann::json build_report(
      const coverage_result& coverage_by_state, size_t total_bbs, size_t covered_bbs_count
  );

private:
  std::string output_dir_;
  redlog::logger log_;
};

} // namespace tbcov
