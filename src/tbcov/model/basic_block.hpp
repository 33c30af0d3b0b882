#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <utility>

#include <nlohmann/json.hpp>

namespace tbcov {

/**
 * @brief A statically discovered basic block of a module
 *
 * Addresses are absolute and the end address is inclusive. Instances never change after
 * construction; coverage results hold them by value in hash sets.
 */
class basic_block {
public:
  basic_block() = default;
  basic_block(uint64_t start_addr, uint64_t end_addr, std::string function = {})
      : start_addr_(start_addr), end_addr_(end_addr), function_(std::move(function)) {}

  uint64_t start_addr() const noexcept { return start_addr_; }
  uint64_t end_addr() const noexcept { return end_addr_; }
  const std::string& function() const noexcept { return function_; }

  bool contains(uint64_t address) const noexcept { return address >= start_addr_ && address <= end_addr_; }

  std::string to_string() const;

  friend bool operator==(const basic_block& left, const basic_block& right) {
    return left.start_addr_ == right.start_addr_ && left.end_addr_ == right.end_addr_ &&
           left.function_ == right.function_;
  }
  friend bool operator!=(const basic_block& left, const basic_block& right) { return !(left == right); }

  // ordered by start address; end address and function only break ties
  friend bool operator<(const basic_block& left, const basic_block& right) {
    if (left.start_addr_ != right.start_addr_) {
      return left.start_addr_ < right.start_addr_;
    }
    if (left.end_addr_ != right.end_addr_) {
      return left.end_addr_ < right.end_addr_;
    }
    return left.function_ < right.function_;
  }

private:
  uint64_t start_addr_ = 0;
  uint64_t end_addr_ = 0;
  std::string function_;
};

void to_json(nlohmann::json& j, const basic_block& block);
void from_json(const nlohmann::json& j, basic_block& block);

} // namespace tbcov

namespace std {

template <> struct hash<tbcov::basic_block> {
  size_t operator()(const tbcov::basic_block& block) const noexcept {
    size_t seed = std::hash<uint64_t>{}(block.start_addr());
    seed ^= std::hash<uint64_t>{}(block.end_addr()) + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
    seed ^= std::hash<std::string>{}(block.function()) + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
    return seed;
  }
};

} // namespace std
