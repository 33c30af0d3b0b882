#include <doctest/doctest.h>

#include <unordered_set>

#include "tbcov/model/basic_block.hpp"

TEST_CASE("basic_block equality covers all three fields") {
  tbcov::basic_block a(0x1000, 0x100f, "main");

  CHECK(a == tbcov::basic_block(0x1000, 0x100f, "main"));
  CHECK(a != tbcov::basic_block(0x1000, 0x100f, "other"));
  CHECK(a != tbcov::basic_block(0x1000, 0x1010, "main"));
  CHECK(a != tbcov::basic_block(0x1001, 0x100f, "main"));
}

TEST_CASE("basic_block orders by start address") {
  tbcov::basic_block low(0x1000, 0x1fff);
  tbcov::basic_block high(0x2000, 0x2001);

  CHECK(low < high);
  CHECK_FALSE(high < low);
  CHECK(tbcov::basic_block(0x1000, 0x1001) < tbcov::basic_block(0x1000, 0x1002));
}

TEST_CASE("basic_block hash set keeps one copy per block") {
  std::unordered_set<tbcov::basic_block> blocks;
  blocks.insert(tbcov::basic_block(0x10, 0x20, "f"));
  blocks.insert(tbcov::basic_block(0x10, 0x20, "f"));
  blocks.insert(tbcov::basic_block(0x10, 0x20, "g"));

  CHECK(blocks.size() == 2);
  CHECK(std::hash<tbcov::basic_block>{}(tbcov::basic_block(1, 2, "x")) ==
        std::hash<tbcov::basic_block>{}(tbcov::basic_block(1, 2, "x")));
}

TEST_CASE("basic_block formats for logs") {
  tbcov::basic_block block(0x401000, 0x40100a, "main");
  CHECK(block.to_string() == "BB(start=0x401000, end=0x40100a, function=main)");
  CHECK(tbcov::basic_block(0x10, 0x10).to_string() == "BB(start=0x10, end=0x10, function=)");
}

TEST_CASE("basic_block json uses integer addresses") {
  nlohmann::json j = tbcov::basic_block(4096, 4111, "main");
  CHECK(j["start_addr"].is_number_unsigned());
  CHECK(j["start_addr"].get<uint64_t>() == 4096);
  CHECK(j["end_addr"].get<uint64_t>() == 4111);
  CHECK(j["function"] == "main");

  auto parsed = nlohmann::json::parse(R"({"start_addr": 16, "end_addr": 31, "function": null})")
                    .get<tbcov::basic_block>();
  CHECK(parsed == tbcov::basic_block(16, 31, ""));
}
