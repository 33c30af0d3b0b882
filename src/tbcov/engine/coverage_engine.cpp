#include "coverage_engine.hpp"

#include <algorithm>
#include <utility>

namespace tbcov {

bool is_sorted_by_start(const std::vector<basic_block>& bbs) {
  return std::is_sorted(bbs.begin(), bbs.end(), [](const basic_block& left, const basic_block& right) {
    return left.start_addr() < right.start_addr();
  });
}

std::vector<uint64_t> build_reach(const std::vector<basic_block>& sorted_bbs) {
  std::vector<uint64_t> reach;
  reach.reserve(sorted_bbs.size());
  uint64_t furthest = 0;
  for (const auto& bb : sorted_bbs) {
    furthest = std::max(furthest, bb.end_addr());
    reach.push_back(furthest);
  }
  return reach;
}

size_t find_scan_start(
    uint64_t tb_start, const std::vector<basic_block>& sorted_bbs, const std::vector<uint64_t>& reach,
    scan_start_mode mode
) {
  const size_t num_bbs = sorted_bbs.size();
  if (num_bbs == 0) {
    return 0;
  }

  if (tb_start <= sorted_bbs.front().end_addr()) {
    return 0;
  }

  // legacy bound ignores blocks that end past the last one
  uint64_t last_end = mode == scan_start_mode::exact ? sorted_bbs.back().end_addr() : reach.back();
  if (tb_start > last_end) {
    return num_bbs;
  }

  // signed bounds so hi can drop below lo
  ptrdiff_t lo = 0;
  ptrdiff_t hi = static_cast<ptrdiff_t>(num_bbs) - 1;
  ptrdiff_t found = -1;
  while (lo <= hi) {
    ptrdiff_t mid = lo + (hi - lo) / 2;
    uint64_t mid_start = sorted_bbs[static_cast<size_t>(mid)].start_addr();

    if (mid_start < tb_start) {
      lo = mid + 1;
    } else if (mid_start > tb_start) {
      hi = mid - 1;
    } else {
      found = mid;
      break;
    }
  }

  if (mode == scan_start_mode::exact) {
    return found >= 0 ? static_cast<size_t>(found) : num_bbs;
  }

  // lo is the insertion point; the block before it is the last one starting below tb_start
  // and the fast paths above guarantee lo >= 1 here
  size_t start = found >= 0 ? static_cast<size_t>(found) : static_cast<size_t>(lo - 1);

  // no block before the first one reaching tb_start can contain it
  auto reaching = std::lower_bound(reach.begin(), reach.end(), tb_start);
  return std::min(start, static_cast<size_t>(reaching - reach.begin()));
}

size_t find_scan_start(uint64_t tb_start, const std::vector<basic_block>& sorted_bbs, scan_start_mode mode) {
  return find_scan_start(tb_start, sorted_bbs, build_reach(sorted_bbs), mode);
}

coverage_engine::coverage_engine(scan_start_mode mode, redlog::logger log) : mode_(mode), log_(std::move(log)) {}

void coverage_engine::cover_interval(
    const execution_interval& interval, const std::vector<basic_block>& sorted_bbs, covered_blocks& out
) const {
  cover_interval(interval, sorted_bbs, build_reach(sorted_bbs), out);
}

void coverage_engine::cover_interval(
    const execution_interval& interval, const std::vector<basic_block>& sorted_bbs,
    const std::vector<uint64_t>& reach, covered_blocks& out
) const {
  const size_t num_bbs = sorted_bbs.size();
  for (size_t i = find_scan_start(interval.start_addr, sorted_bbs, reach, mode_); i < num_bbs; ++i) {
    const basic_block& bb = sorted_bbs[i];

    if (interval_touches_block(interval, bb)) {
      out.insert(bb);
    }

    // sorted, so nothing further can contain either boundary
    if (bb.start_addr() > interval.end_addr) {
      break;
    }
  }
}

coverage_result coverage_engine::compute_coverage(
    const state_intervals& intervals_by_state, const std::vector<basic_block>& sorted_bbs
) const {
  coverage_result covered;
  if (sorted_bbs.empty()) {
    log_.wrn("no basic blocks to match against");
    return covered;
  }

  const std::vector<uint64_t> reach = build_reach(sorted_bbs);

  for (const auto& [state, intervals] : intervals_by_state) {
    log_.inf("calculating basic block coverage", redlog::field("state", state));

    if (intervals.empty()) {
      log_.dbg("state has no execution intervals", redlog::field("state", state));
      continue;
    }

    covered_blocks blocks;
    for (const auto& interval : intervals) {
      cover_interval(interval, sorted_bbs, reach, blocks);
    }

    log_.dbg(
        "state coverage computed", redlog::field("state", state), redlog::field("intervals", intervals.size()),
        redlog::field("covered", blocks.size())
    );

    if (!blocks.empty()) {
      covered.emplace(state, std::move(blocks));
    }
  }

  return covered;
}

coverage_stats summarize(const coverage_result& coverage, size_t total_basic_blocks) {
  covered_blocks all_blocks;
  for (const auto& [state, blocks] : coverage) {
    all_blocks.insert(blocks.begin(), blocks.end());
  }

  coverage_stats stats;
  stats.total_basic_blocks = total_basic_blocks;
  stats.covered_basic_blocks = all_blocks.size();
  return stats;
}

} // namespace tbcov
