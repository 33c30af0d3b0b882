#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <unordered_set>
#include <vector>

#include "tbcov/model/basic_block.hpp"

namespace tbcov {

using state_id = uint32_t;

// one executed translation block, as recorded by the tracer
struct execution_interval {
  uint64_t start_addr = 0;
  uint64_t end_addr = 0;

  bool operator==(const execution_interval& other) const {
    return start_addr == other.start_addr && end_addr == other.end_addr;
  }
};

using state_intervals = std::map<state_id, std::vector<execution_interval>>;

// keyed by the module path recorded in the trace
using module_traces = std::map<std::string, state_intervals>;

using covered_blocks = std::unordered_set<basic_block>;
using coverage_result = std::map<state_id, covered_blocks>;

} // namespace tbcov
