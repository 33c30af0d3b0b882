#include "report_generator.hpp"

#include <algorithm>
#include <filesystem>
#include <iomanip>
#include <sstream>

#include "tbcov/disasm/disassembly_cache.hpp"
#include "tbcov/report/drcov_report_writer.hpp"
#include "tbcov/report/json_report_writer.hpp"
#include "tbcov/util/path_utils.hpp"

namespace tbcov {

namespace {

std::string format_percent(double ratio) {
  std::ostringstream oss;
  oss << std::fixed << std::setprecision(1) << ratio * 100.0 << "%";
  return oss.str();
}

} // namespace

size_t run_summary::reports_written() const {
  return static_cast<size_t>(std::count_if(modules.begin(), modules.end(), [](const module_report& report) {
    return report.status.ok();
  }));
}

size_t run_summary::modules_skipped() const {
  return static_cast<size_t>(std::count_if(modules.begin(), modules.end(), [](const module_report& report) {
    return report.status.code == error_code::module_resolution_failed;
  }));
}

size_t run_summary::modules_failed() const { return modules.size() - reports_written() - modules_skipped(); }

report_generator::report_generator(
    report_config config, disassembler& backend, const module_path_resolver& resolver, redlog::logger log
)
    : config_(std::move(config)), backend_(backend), resolver_(resolver),
      engine_(config_.scan_start, redlog::get_logger("tbcov.engine")), log_(std::move(log)) {}

result<run_summary> report_generator::run(const report_config& config, trace_source& traces, redlog::logger log) {
  auto valid = config.validate();
  if (!valid.ok()) {
    log.err("invalid configuration", redlog::field("error", valid.message));
    return error_result<run_summary>(std::move(valid));
  }

  redlog::set_level(verbosity_to_level(config.verbose));

  auto backend = make_disassembler(config);
  if (!backend.ok()) {
    log.err("cannot create disassembler", redlog::field("error", backend.status.message));
    return error_result<run_summary>(backend.status);
  }
  auto resolver = make_module_path_resolver(config.guest_roots, config.search_paths);

  report_generator generator(config, *backend.value, *resolver, std::move(log));
  return generator.generate(traces);
}

result<run_summary> report_generator::generate(trace_source& traces) const {
  config_.log_config(log_);

  auto collected = traces.get_execution_intervals();
  if (!collected.ok()) {
    log_.err("failed to collect execution intervals", redlog::field("error", collected.status.message));
    return error_result<run_summary>(error_code::no_coverage_data, collected.status.message);
  }
  if (collected.value.empty()) {
    return error_result<run_summary>(error_code::no_coverage_data, "no translation block coverage found");
  }

  // refuse an earlier run's reports up front; the directory itself is claimed on first write
  std::string drcov_dir = drcov_report_writer(config_.output_dir).directory();
  if (config_.format == report_format::drcov) {
    std::error_code ec;
    bool present = std::filesystem::exists(drcov_dir, ec);
    if (ec) {
      return error_result<run_summary>(error_code::io_error, "cannot check " + drcov_dir + ": " + ec.message());
    }
    if (present) {
      log_.err("drcov output already exists", redlog::field("path", drcov_dir));
      return error_result<run_summary>(
          error_code::report_already_exists, "drcov directory " + drcov_dir + " already exists"
      );
    }
  }

  result<run_summary> outcome;
  bool drcov_claimed = false;
  for (const auto& [recorded_path, intervals] : collected.value) {
    module_report report = generate_module(recorded_path, intervals, drcov_claimed);

    bool fatal = !report.status.ok() && report.status.code != error_code::module_resolution_failed;
    if (fatal && outcome.status.ok()) {
      outcome.status = report.status;
    }
    outcome.value.modules.push_back(std::move(report));
  }

  if (drcov_claimed && outcome.value.reports_written() == 0) {
    std::error_code ec;
    if (std::filesystem::is_empty(drcov_dir, ec) && !ec) {
      std::filesystem::remove(drcov_dir, ec);
    }
    if (ec) {
      log_.wrn("could not remove unused drcov directory", redlog::field("path", drcov_dir));
    }
  }

  log_.inf(
      "coverage run finished", redlog::field("modules", outcome.value.modules.size()),
      redlog::field("written", outcome.value.reports_written()),
      redlog::field("skipped", outcome.value.modules_skipped()), redlog::field("failed", outcome.value.modules_failed())
  );
  return outcome;
}

module_report report_generator::generate_module(
    const std::string& recorded_path, const state_intervals& intervals, bool& drcov_claimed
) const {
  module_report report;
  report.recorded_path = recorded_path;

  auto resolved = resolver_.resolve_module_path(recorded_path);
  if (!resolved) {
    log_.err("could not locate module, skipping", redlog::field("module", recorded_path));
    report.status = make_status(error_code::module_resolution_failed, "cannot find module " + recorded_path);
    return report;
  }
  report.module_path = *resolved;
  std::string module_name = util::basename_for_path(report.module_path);

  disassembly_cache cache(config_.project_dir, backend_);
  auto disas = cache.load_or_disassemble(module_name, report.module_path);
  if (!disas.ok()) {
    log_.err(
        "no disassembly information", redlog::field("module", module_name),
        redlog::field("error", disas.status.message)
    );
    report.status = disas.status;
    return report;
  }

  // basic block coverage from the recorded translation blocks and the static block list
  coverage_result coverage = engine_.compute_coverage(intervals, disas.value.bbs);
  if (coverage.empty()) {
    log_.err("no basic block coverage information", redlog::field("module", module_name));
    report.status = make_status(
        error_code::no_coverage_data, "no basic block coverage information found for " + module_name
    );
    return report;
  }

  report.stats = summarize(coverage, disas.value.bbs.size());

  auto written = write_report(report.module_path, disas.value, coverage, report.stats, drcov_claimed);
  if (!written.ok()) {
    log_.err(
        "failed to write report", redlog::field("module", module_name), redlog::field("error", written.status.message)
    );
    report.status = written.status;
    return report;
  }
  report.report_path = written.value;

  log_.inf(
      "basic block coverage saved", redlog::field("path", report.report_path),
      redlog::field("total_basic_blocks", report.stats.total_basic_blocks),
      redlog::field("covered_basic_blocks", report.stats.covered_basic_blocks),
      redlog::field("percent", format_percent(report.stats.covered_ratio()))
  );
  return report;
}

result<std::string> report_generator::write_report(
    const std::string& module_path, const disassembly_info& disas, const coverage_result& coverage,
    const coverage_stats& stats, bool& drcov_claimed
) const {
  if (config_.format == report_format::drcov) {
    drcov_report_writer writer(config_.output_dir);
    if (!drcov_claimed) {
      auto prepared = writer.prepare();
      if (!prepared.ok()) {
        return error_result<std::string>(std::move(prepared));
      }
      drcov_claimed = true;
    }
    return writer.write_module(module_path, disas.base_addr, disas.end_addr, coverage);
  }
  return json_report_writer(config_.output_dir)
      .write_json(util::basename_for_path(module_path), coverage, stats.total_basic_blocks, stats.covered_basic_blocks);
}

} // namespace tbcov
