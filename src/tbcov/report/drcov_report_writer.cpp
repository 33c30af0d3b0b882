#include "drcov_report_writer.hpp"

#include <algorithm>
#include <filesystem>
#include <iomanip>
#include <limits>
#include <sstream>
#include <vector>

#include "tbcov/util/path_utils.hpp"

namespace tbcov {

namespace {

std::string format_hex(uint64_t value) {
  std::ostringstream oss;
  oss << "0x" << std::hex << value;
  return oss.str();
}

} // namespace

drcov_report_writer::drcov_report_writer(std::string output_dir, redlog::logger log)
    : output_dir_(std::move(output_dir)), log_(std::move(log)) {}

std::string drcov_report_writer::directory() const {
  return (std::filesystem::path(output_dir_) / drcov_directory_name).string();
}

std::string drcov_report_writer::report_path_for(const std::string& module_path, state_id state) const {
  std::string file_name = util::basename_for_path(module_path) + "_coverage_" + std::to_string(state) + ".drcov";
  return (std::filesystem::path(directory()) / file_name).string();
}

status drcov_report_writer::prepare() const {
  namespace fs = std::filesystem;

  std::error_code ec;
  fs::create_directories(output_dir_, ec);
  if (ec) {
    return make_status(error_code::io_error, "cannot create output directory " + output_dir_ + ": " + ec.message());
  }

  // create_directory is the claim: it reports false when someone else got there first
  std::string drcov_dir = directory();
  bool created = fs::create_directory(drcov_dir, ec);
  if (ec) {
    return make_status(error_code::io_error, "cannot create " + drcov_dir + ": " + ec.message());
  }
  if (!created) {
    return make_status(error_code::report_already_exists, "drcov directory " + drcov_dir + " already exists");
  }

  log_.dbg("created drcov directory", redlog::field("path", drcov_dir));
  return ok_status();
}

drcov::coverage_data drcov_report_writer::build_state_coverage(
    const std::string& module_path, uint64_t module_base, uint64_t module_end, const covered_blocks& blocks
) const {
  drcov::coverage_data data;
  data.flavor = drcov_flavor;
  data.modules.emplace_back(0, module_path, module_base, module_end);

  std::vector<basic_block> ordered(blocks.begin(), blocks.end());
  std::sort(ordered.begin(), ordered.end());

  size_t skipped = 0;
  data.basic_blocks.reserve(ordered.size());
  for (const auto& bb : ordered) {
    if (bb.start_addr() < module_base || bb.end_addr() > module_end) {
      log_.wrn(
          "basic block outside module bounds", redlog::field("block", bb.to_string()),
          redlog::field("base", format_hex(module_base)), redlog::field("end", format_hex(module_end))
      );
      skipped++;
      continue;
    }

    uint64_t offset = bb.start_addr() - module_base;
    if (offset > std::numeric_limits<uint32_t>::max()) {
      log_.wrn("basic block offset does not fit drcov entry", redlog::field("block", bb.to_string()));
      skipped++;
      continue;
    }

    uint64_t size = bb.end_addr() - bb.start_addr();
    if (size > std::numeric_limits<uint16_t>::max()) {
      log_.wrn("basic block size clamped", redlog::field("block", bb.to_string()), redlog::field("size", size));
      size = std::numeric_limits<uint16_t>::max();
    }

    // single module table, so the module id is always 0
    data.basic_blocks.emplace_back(static_cast<uint32_t>(offset), static_cast<uint16_t>(size), uint16_t{0});
  }

  if (skipped != 0) {
    log_.wrn("skipped basic blocks", redlog::field("module", module_path), redlog::field("count", skipped));
  }
  return data;
}

result<std::string> drcov_report_writer::write_module(
    const std::string& module_path, uint64_t module_base, uint64_t module_end,
    const coverage_result& coverage_by_state
) const {
  namespace fs = std::filesystem;

  std::string drcov_dir = directory();
  std::error_code ec;
  if (!fs::is_directory(drcov_dir, ec)) {
    return error_result<std::string>(error_code::io_error, "drcov directory " + drcov_dir + " was not prepared");
  }

  // refuse up front so a collision never leaves a half-written module behind
  for (const auto& [state, blocks] : coverage_by_state) {
    std::string report_path = report_path_for(module_path, state);
    bool present = fs::exists(report_path, ec);
    if (ec) {
      return error_result<std::string>(error_code::io_error, "cannot check " + report_path + ": " + ec.message());
    }
    if (present) {
      return error_result<std::string>(
          error_code::report_already_exists, "drcov file " + report_path + " already exists"
      );
    }
  }

  for (const auto& [state, blocks] : coverage_by_state) {
    std::string report_path = report_path_for(module_path, state);
    try {
      drcov::write(report_path, build_state_coverage(module_path, module_base, module_end, blocks));
    } catch (const drcov::format_error& e) {
      return error_result<std::string>(error_code::io_error, report_path + ": " + e.what());
    }
    log_.dbg(
        "wrote drcov file", redlog::field("state", state), redlog::field("path", report_path),
        redlog::field("blocks", blocks.size())
    );
  }

  log_.inf(
      "saved drcov coverage", redlog::field("module", module_path), redlog::field("states", coverage_by_state.size()),
      redlog::field("path", drcov_dir)
  );
  return ok_result(std::move(drcov_dir));
}

result<std::string> drcov_report_writer::write_binary(
    const std::string& module_path, uint64_t module_base, uint64_t module_end,
    const coverage_result& coverage_by_state
) const {
  auto prepared = prepare();
  if (!prepared.ok()) {
    return error_result<std::string>(std::move(prepared));
  }
  return write_module(module_path, module_base, module_end, coverage_by_state);
}

} // namespace tbcov
