#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include <redlog.hpp>

#include "tbcov/model/basic_block.hpp"
#include "tbcov/model/trace_types.hpp"

namespace tbcov {

// how the scan start is located when an interval does not begin exactly on a block start
enum class scan_start_mode : uint8_t {
  // exact start matches only; interior non-exact starts produce an empty scan
  exact,
  // fall back to the last block starting below the interval start
  insertion,
};

inline constexpr const char* scan_start_mode_name(scan_start_mode mode) {
  switch (mode) {
  case scan_start_mode::exact:
    return "exact";
  case scan_start_mode::insertion:
    return "insertion";
  }
  return "unknown";
}

struct coverage_stats {
  size_t total_basic_blocks = 0;
  size_t covered_basic_blocks = 0;

  double covered_ratio() const {
    if (total_basic_blocks == 0) {
      return 0.0;
    }
    return static_cast<double>(covered_basic_blocks) / static_cast<double>(total_basic_blocks);
  }
};

bool is_sorted_by_start(const std::vector<basic_block>& bbs);

// reach[i] is the highest end address among sorted_bbs[0..i]; non-decreasing
std::vector<uint64_t> build_reach(const std::vector<basic_block>& sorted_bbs);

/**
 * @brief Index into sorted_bbs where the overlap scan for an interval starting at tb_start begins
 *
 * Returns sorted_bbs.size() when no block can overlap. In insertion mode the index also moves
 * back to the first block whose reach gets to tb_start, so enclosing blocks that start earlier
 * (nested or overlapping block lists) are part of the scan.
 */
size_t find_scan_start(
    uint64_t tb_start, const std::vector<basic_block>& sorted_bbs, const std::vector<uint64_t>& reach,
    scan_start_mode mode
);

// builds the reach on every call
size_t find_scan_start(uint64_t tb_start, const std::vector<basic_block>& sorted_bbs, scan_start_mode mode);

// true if the interval starts or ends inside the block
inline bool interval_touches_block(const execution_interval& interval, const basic_block& bb) {
  return bb.contains(interval.start_addr) || bb.contains(interval.end_addr);
}

/**
 * @brief Matches recorded translation blocks against the static basic block list
 *
 * The block list must be sorted by start address (see is_sorted_by_start). The engine borrows
 * it read-only and keeps no state between calls.
 */
class coverage_engine {
public:
  explicit coverage_engine(
      scan_start_mode mode = scan_start_mode::insertion, redlog::logger log = redlog::get_logger("tbcov.engine")
  );

  coverage_result compute_coverage(
      const state_intervals& intervals_by_state, const std::vector<basic_block>& sorted_bbs
  ) const;

  // reach must come from build_reach(sorted_bbs)
  void cover_interval(
      const execution_interval& interval, const std::vector<basic_block>& sorted_bbs,
      const std::vector<uint64_t>& reach, covered_blocks& out
  ) const;

  void cover_interval(
      const execution_interval& interval, const std::vector<basic_block>& sorted_bbs, covered_blocks& out
  ) const;

  scan_start_mode mode() const { return mode_; }

private:
  scan_start_mode mode_;
  redlog::logger log_;
};

// statistics across all states; covered blocks are counted once however many states hit them
coverage_stats summarize(const coverage_result& coverage, size_t total_basic_blocks);

} // namespace tbcov
