#pragma once

#include <string>
#include <string_view>
#include <utility>

namespace tbcov {

// error codes for structured results
enum class error_code {
  ok,
  invalid_argument,
  io_error,
  invalid_format,
  unsupported,
  disassembly_unavailable,
  no_coverage_data,
  report_already_exists,
  module_resolution_failed
};

inline constexpr std::string_view error_code_name(error_code code) {
  switch (code) {
  case error_code::ok:
    return "ok";
  case error_code::invalid_argument:
    return "invalid_argument";
  case error_code::io_error:
    return "io_error";
  case error_code::invalid_format:
    return "invalid_format";
  case error_code::unsupported:
    return "unsupported";
  case error_code::disassembly_unavailable:
    return "disassembly_unavailable";
  case error_code::no_coverage_data:
    return "no_coverage_data";
  case error_code::report_already_exists:
    return "report_already_exists";
  case error_code::module_resolution_failed:
    return "module_resolution_failed";
  }
  return "unknown";
}

// status holds an error code and a human-readable message
struct status {
  error_code code = error_code::ok;
  std::string message;

  bool ok() const noexcept { return code == error_code::ok; }
};

inline status ok_status() { return {}; }

inline status make_status(error_code code, std::string message) { return status{code, std::move(message)}; }

// result carries a value and a status; value is default-initialized on errors
template <typename T> struct result {
  T value{};
  tbcov::status status{};

  bool ok() const noexcept { return status.ok(); }
};

template <typename T> inline result<T> ok_result(T value) { return result<T>{std::move(value), ok_status()}; }

template <typename T> inline result<T> error_result(error_code code, std::string message) {
  return result<T>{T{}, make_status(code, std::move(message))};
}

template <typename T> inline result<T> error_result(status error) { return result<T>{T{}, std::move(error)}; }

} // namespace tbcov
