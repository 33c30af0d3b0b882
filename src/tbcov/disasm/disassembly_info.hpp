#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "tbcov/core/result.hpp"
#include "tbcov/model/basic_block.hpp"

namespace tbcov {

struct disassembly_info {
  std::vector<basic_block> bbs;
  uint64_t base_addr = 0;
  uint64_t end_addr = 0;
  // binary the blocks were read from; empty when the producer did not record it
  std::string module_path;
};

// serialized as {"bbs": [...], "base_addr": int, "end_addr": int}, plus "module_path" when known
nlohmann::json disassembly_to_json(const disassembly_info& info);
result<disassembly_info> disassembly_from_json(const nlohmann::json& j);

result<disassembly_info> load_disassembly_file(const std::string& path);
status save_disassembly_file(const std::string& path, const disassembly_info& info);

void sort_by_start(std::vector<basic_block>& bbs);

} // namespace tbcov
