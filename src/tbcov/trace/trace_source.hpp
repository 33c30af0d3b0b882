#pragma once

#include <utility>

#include "tbcov/core/result.hpp"
#include "tbcov/model/trace_types.hpp"

namespace tbcov {

// per-module, per-state execution intervals recorded by the tracer
class trace_source {
public:
  virtual ~trace_source() = default;
  virtual result<module_traces> get_execution_intervals() = 0;
};

// already-collected traces handed in by the caller
class in_memory_trace_source final : public trace_source {
public:
  explicit in_memory_trace_source(module_traces traces) : traces_(std::move(traces)) {}

  result<module_traces> get_execution_intervals() override { return ok_result(traces_); }

private:
  module_traces traces_;
};

} // namespace tbcov
