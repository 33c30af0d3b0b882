#include <doctest/doctest.h>

#include <filesystem>

#include <nlohmann/json.hpp>

#include "tbcov/report/json_report_writer.hpp"
#include "tbcov/test_helpers.hpp"

TEST_CASE("json report carries stats and flattened coverage") {
  tbcov::test::temp_dir dir("json_report");
  tbcov::json_report_writer writer((dir.path() / "s2e-last").string());

  tbcov::coverage_result coverage;
  coverage[0] = {tbcov::basic_block(0x401000, 0x40100f, "main"), tbcov::basic_block(0x401020, 0x401024, "main")};
  coverage[1] = {tbcov::basic_block(0x402000, 0x402008, "helper")};

  auto written = writer.write_json("prog", coverage, 10, 3);
  REQUIRE(written.ok());
  CHECK(written.value == (dir.path() / "s2e-last" / "prog_coverage.json").string());

  auto report = nlohmann::json::parse(tbcov::test::read_text(written.value));
  CHECK(report["stats"]["total_basic_blocks"] == 10);
  CHECK(report["stats"]["covered_basic_blocks"] == 3);
  REQUIRE(report["coverage"].size() == 3);

  const auto& first = report["coverage"][0];
  CHECK(first["start_addr"].is_number_integer());
  CHECK(first["start_addr"].get<uint64_t>() == 0x401000);
  CHECK(first["end_addr"].get<uint64_t>() == 0x40100f);
  CHECK(first["function"] == "main");
  CHECK(report["coverage"][2]["function"] == "helper");
}

TEST_CASE("json report repeats blocks shared between states") {
  tbcov::basic_block shared(0x10, 0x1f, "f");
  tbcov::coverage_result coverage;
  coverage[2] = {shared};
  coverage[5] = {shared, tbcov::basic_block(0x20, 0x2f, "f")};

  auto report = tbcov::json_report_writer::build_report(coverage, 4, 2);
  CHECK(report["stats"]["covered_basic_blocks"] == 2);
  CHECK(report["coverage"].size() == 3);
}

TEST_CASE("json report overwrites an earlier report for the module") {
  tbcov::test::temp_dir dir("json_overwrite");
  tbcov::json_report_writer writer(dir.str());

  tbcov::coverage_result coverage;
  coverage[0] = {tbcov::basic_block(0x10, 0x1f)};
  REQUIRE(writer.write_json("prog", coverage, 1, 1).ok());

  coverage[1] = {tbcov::basic_block(0x20, 0x2f)};
  auto second = writer.write_json("prog", coverage, 2, 2);
  REQUIRE(second.ok());

  auto report = nlohmann::json::parse(tbcov::test::read_text(second.value));
  CHECK(report["coverage"].size() == 2);
}
