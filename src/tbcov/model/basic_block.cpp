#include "basic_block.hpp"

#include <sstream>

namespace tbcov {

std::string basic_block::to_string() const {
  std::ostringstream oss;
  oss << "BB(start=0x" << std::hex << start_addr_ << ", end=0x" << end_addr_ << ", function=" << function_ << ")";
  return oss.str();
}

void to_json(nlohmann::json& j, const basic_block& block) {
  j = nlohmann::json{
      {"start_addr", block.start_addr()},
      {"end_addr", block.end_addr()},
      {"function", block.function()},
  };
}

void from_json(const nlohmann::json& j, basic_block& block) {
  std::string function;
  auto it = j.find("function");
  if (it != j.end() && it->is_string()) {
    function = it->get<std::string>();
  }
  block = basic_block(j.at("start_addr").get<uint64_t>(), j.at("end_addr").get<uint64_t>(), std::move(function));
}

} // namespace tbcov
