#include <doctest/doctest.h>

#include <filesystem>

#include <nlohmann/json.hpp>

#include "fake_collaborators.hpp"
#include "tbcov/disasm/disassembly_info.hpp"
#include "tbcov/formats/drcov.hpp"
#include "tbcov/report/report_generator.hpp"
#include "tbcov/test_helpers.hpp"

namespace fs = std::filesystem;

namespace {

tbcov::disassembly_info module_info(uint64_t base) {
  tbcov::disassembly_info info;
  info.base_addr = base;
  info.end_addr = base + 0x1000;
  info.bbs = {
      tbcov::basic_block(base, base + 0xf, "entry"),
      tbcov::basic_block(base + 0x10, base + 0x1f, "entry"),
      tbcov::basic_block(base + 0x100, base + 0x10f, "other"),
  };
  return info;
}

tbcov::state_intervals touch_first_block(uint64_t base) {
  tbcov::state_intervals intervals;
  intervals[0] = {{base, base + 0x4}};
  intervals[1] = {{base, base + 0x4}, {base + 0x100, base + 0x104}};
  return intervals;
}

// three modules recorded in the trace; only a and c exist on this machine
struct generator_fixture {
  tbcov::test::temp_dir dir{"generator"};
  tbcov::test::fake_disassembler backend;
  tbcov::test::fake_path_resolver resolver;
  tbcov::report_config config;
  tbcov::module_traces traces;

  generator_fixture() {
    for (const char* name : {"a", "c"}) {
      fs::path local = dir.path() / name;
      tbcov::test::write_text(local, "ELF");
      resolver.paths[std::string("/guest/") + name] = local.string();
    }
    backend.results[(dir.path() / "a").string()] = module_info(0x400000);
    backend.results[(dir.path() / "c").string()] = module_info(0x7f0000);

    traces["/guest/a"] = touch_first_block(0x400000);
    traces["/guest/b"] = touch_first_block(0x500000);
    traces["/guest/c"] = touch_first_block(0x7f0000);

    config.project_dir = dir.str();
    config.output_dir = (dir.path() / "s2e-last").string();
  }

  tbcov::module_report find(const tbcov::run_summary& summary, const std::string& recorded) const {
    for (const auto& report : summary.modules) {
      if (report.recorded_path == recorded) {
        return report;
      }
    }
    FAIL("no report for " << recorded);
    return {};
  }
};

} // namespace

TEST_CASE_FIXTURE(generator_fixture, "unresolvable module is skipped and the run continues") {
  tbcov::report_generator generator(config, backend, resolver);
  tbcov::in_memory_trace_source source(traces);

  auto run = generator.generate(source);
  CHECK(run.ok());
  REQUIRE(run.value.modules.size() == 3);
  CHECK(run.value.reports_written() == 2);
  CHECK(run.value.modules_skipped() == 1);
  CHECK(run.value.modules_failed() == 0);

  CHECK(find(run.value, "/guest/b").status.code == tbcov::error_code::module_resolution_failed);
  CHECK(fs::exists(dir.path() / "s2e-last" / "a_coverage.json"));
  CHECK(fs::exists(dir.path() / "s2e-last" / "c_coverage.json"));
  CHECK_FALSE(fs::exists(dir.path() / "s2e-last" / "b_coverage.json"));

  auto a = find(run.value, "/guest/a");
  CHECK(a.stats.total_basic_blocks == 3);
  CHECK(a.stats.covered_basic_blocks == 2);
  CHECK(a.report_path == (dir.path() / "s2e-last" / "a_coverage.json").string());

  auto report = nlohmann::json::parse(tbcov::test::read_text(a.report_path));
  CHECK(report["stats"]["covered_basic_blocks"] == 2);
  // state 0 contributes one block, state 1 two
  CHECK(report["coverage"].size() == 3);

  CHECK(fs::exists(dir.path() / "a.disas"));
  CHECK(fs::exists(dir.path() / "c.disas"));
}

TEST_CASE_FIXTURE(generator_fixture, "modules without disassembly or coverage fail individually") {
  backend.results.erase((dir.path() / "a").string());
  tbcov::state_intervals unrelated;
  unrelated[0] = {{0x10, 0x20}};
  traces["/guest/c"] = unrelated;

  tbcov::report_generator generator(config, backend, resolver);
  tbcov::in_memory_trace_source source(traces);
  auto run = generator.generate(source);

  CHECK(run.status.code == tbcov::error_code::disassembly_unavailable);
  REQUIRE(run.value.modules.size() == 3);
  CHECK(find(run.value, "/guest/a").status.code == tbcov::error_code::disassembly_unavailable);
  CHECK(find(run.value, "/guest/c").status.code == tbcov::error_code::no_coverage_data);
  CHECK(run.value.modules_failed() == 2);
  CHECK(run.value.reports_written() == 0);
}

TEST_CASE_FIXTURE(generator_fixture, "drcov runs write every module into one directory") {
  config.format = tbcov::report_format::drcov;
  tbcov::report_generator generator(config, backend, resolver);
  tbcov::in_memory_trace_source source(traces);

  auto run = generator.generate(source);
  REQUIRE(run.ok());
  CHECK(run.value.reports_written() == 2);

  fs::path drcov_dir = dir.path() / "s2e-last" / "drcov";
  CHECK(find(run.value, "/guest/a").report_path == drcov_dir.string());
  for (const char* name : {"a_coverage_0.drcov", "a_coverage_1.drcov", "c_coverage_0.drcov", "c_coverage_1.drcov"}) {
    CHECK(fs::exists(drcov_dir / name));
  }

  tbcov::drcov::module_entry module(0, (dir.path() / "c").string(), 0x7f0000, 0x7f1000);
  std::string text = tbcov::test::read_text(drcov_dir / "c_coverage_1.drcov");
  CHECK(text.find(tbcov::drcov::writer::format_module_row(module) + "\nBB Table: 2 bbs\n") != std::string::npos);

  // blocks at offsets 0x0 and 0x100, both 0xf long
  auto bytes = tbcov::test::read_bytes(drcov_dir / "c_coverage_1.drcov");
  REQUIRE(bytes.size() >= 16);
  const unsigned char records[16] = {0x00, 0x00, 0x00, 0x00, 0x0f, 0x00, 0x00, 0x00,
                                     0x00, 0x01, 0x00, 0x00, 0x0f, 0x00, 0x00, 0x00};
  for (size_t i = 0; i < 16; ++i) {
    CHECK(bytes[bytes.size() - 16 + i] == records[i]);
  }
}

TEST_CASE_FIXTURE(generator_fixture, "existing drcov directory aborts the run before any module") {
  config.format = tbcov::report_format::drcov;
  fs::create_directories(dir.path() / "s2e-last" / "drcov");

  tbcov::report_generator generator(config, backend, resolver);
  tbcov::in_memory_trace_source source(traces);
  auto run = generator.generate(source);

  CHECK(run.status.code == tbcov::error_code::report_already_exists);
  CHECK(backend.calls == 0);
}

TEST_CASE_FIXTURE(generator_fixture, "drcov run without any coverage leaves no directory behind") {
  config.format = tbcov::report_format::drcov;
  auto saved = backend.results;
  backend.results.clear();

  tbcov::report_generator generator(config, backend, resolver);
  tbcov::in_memory_trace_source source(traces);

  auto failed = generator.generate(source);
  CHECK(failed.status.code == tbcov::error_code::disassembly_unavailable);
  CHECK(failed.value.reports_written() == 0);
  CHECK_FALSE(fs::exists(dir.path() / "s2e-last" / "drcov"));

  backend.results = saved;
  auto retried = generator.generate(source);
  CHECK(retried.ok());
  CHECK(retried.value.reports_written() == 2);
  CHECK(fs::exists(dir.path() / "s2e-last" / "drcov" / "a_coverage_0.drcov"));
}

TEST_CASE("run resolves modules through the configured guest roots and search paths") {
  tbcov::test::temp_dir dir("generator_run");
  fs::create_directories(dir.path() / "bin");
  fs::create_directories(dir.path() / "image" / "lib");
  fs::create_directories(dir.path() / "exports");
  tbcov::test::write_text(dir.path() / "bin" / "prog", "ELF");
  tbcov::test::write_text(dir.path() / "image" / "lib" / "libz.so", "ELF");
  fs::path exports = dir.path() / "exports";
  REQUIRE(tbcov::save_disassembly_file((exports / "prog.bbs.json").string(), module_info(0x400000)).ok());
  REQUIRE(tbcov::save_disassembly_file((exports / "libz.so.bbs.json").string(), module_info(0x7f0000)).ok());

  tbcov::report_config config;
  config.project_dir = dir.str();
  config.output_dir = (dir.path() / "out").string();
  config.export_dir = exports.string();
  config.search_paths = {(dir.path() / "bin").string()};
  config.guest_roots = {"/guest=" + (dir.path() / "image").string()};

  tbcov::module_traces traces;
  traces["/usr/local/bin/prog"] = touch_first_block(0x400000);
  traces["/guest/lib/libz.so"] = touch_first_block(0x7f0000);
  tbcov::in_memory_trace_source source(traces);

  auto run = tbcov::report_generator::run(config, source);
  REQUIRE(run.ok());
  REQUIRE(run.value.modules.size() == 2);
  CHECK(run.value.reports_written() == 2);
  for (const auto& report : run.value.modules) {
    if (report.recorded_path == "/usr/local/bin/prog") {
      CHECK(report.module_path == (dir.path() / "bin" / "prog").string());
    } else {
      CHECK(report.module_path == (dir.path() / "image" / "lib" / "libz.so").string());
    }
  }
  CHECK(fs::exists(dir.path() / "out" / "prog_coverage.json"));
  CHECK(fs::exists(dir.path() / "out" / "libz.so_coverage.json"));
}

TEST_CASE("run rejects an invalid configuration before reading the trace") {
  tbcov::report_config config;
  config.guest_roots = {"missing-host-dir"};
  tbcov::in_memory_trace_source source(tbcov::module_traces{});

  CHECK(tbcov::report_generator::run(config, source).status.code == tbcov::error_code::invalid_argument);

  config.guest_roots.clear();
  config.disassembler = "ida";
  CHECK(tbcov::report_generator::run(config, source).status.code == tbcov::error_code::unsupported);
}

TEST_CASE_FIXTURE(generator_fixture, "empty trace is reported as missing coverage") {
  tbcov::report_generator generator(config, backend, resolver);
  tbcov::in_memory_trace_source source(tbcov::module_traces{});

  auto run = generator.generate(source);
  CHECK(run.status.code == tbcov::error_code::no_coverage_data);
  CHECK(backend.calls == 0);
}
