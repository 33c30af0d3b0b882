#include "json_report_writer.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <vector>

namespace tbcov {

json_report_writer::json_report_writer(std::string output_dir, redlog::logger log)
    : output_dir_(std::move(output_dir)), log_(std::move(log)) {}

std::string json_report_writer::report_path_for(const std::string& module_name) const {
  return (std::filesystem::path(output_dir_) / (module_name + "_coverage.json")).string();
}

nlohmann::json json_report_writer::build_report(
    const coverage_result& coverage_by_state, size_t total_bbs, size_t covered_bbs_count
) {
  nlohmann::json blocks = nlohmann::json::array();
  for (const auto& [state, covered] : coverage_by_state) {
    std::vector<basic_block> ordered(covered.begin(), covered.end());
    std::sort(ordered.begin(), ordered.end());
    for (const auto& bb : ordered) {
      blocks.push_back(bb);
    }
  }

  return nlohmann::json{
      {"stats",
       {
           {"total_basic_blocks", total_bbs},
           {"covered_basic_blocks", covered_bbs_count},
       }},
      {"coverage", std::move(blocks)},
  };
}

result<std::string> json_report_writer::write_json(
    const std::string& module_name, const coverage_result& coverage_by_state, size_t total_bbs,
    size_t covered_bbs_count
) const {
  std::string report_path = report_path_for(module_name);
  log_.inf("saving basic block coverage", redlog::field("path", report_path));

  std::error_code ec;
  std::filesystem::create_directories(output_dir_, ec);
  if (ec) {
    return error_result<std::string>(
        error_code::io_error, "cannot create output directory " + output_dir_ + ": " + ec.message()
    );
  }

  std::ofstream output(report_path, std::ios::trunc);
  if (!output) {
    return error_result<std::string>(error_code::io_error, "cannot create " + report_path);
  }

  output << build_report(coverage_by_state, total_bbs, covered_bbs_count).dump();
  output.flush();
  if (!output) {
    return error_result<std::string>(error_code::io_error, "failed writing " + report_path);
  }

  return ok_result(std::move(report_path));
}

} // namespace tbcov
