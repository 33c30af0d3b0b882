#include "disassembly_info.hpp"

#include <algorithm>
#include <fstream>

namespace tbcov {

nlohmann::json disassembly_to_json(const disassembly_info& info) {
  nlohmann::json j{
      {"bbs", info.bbs},
      {"base_addr", info.base_addr},
      {"end_addr", info.end_addr},
  };
  if (!info.module_path.empty()) {
    j["module_path"] = info.module_path;
  }
  return j;
}

result<disassembly_info> disassembly_from_json(const nlohmann::json& j) {
  if (!j.is_object()) {
    return error_result<disassembly_info>(error_code::invalid_format, "disassembly document is not an object");
  }

  try {
    disassembly_info info;
    info.bbs = j.at("bbs").get<std::vector<basic_block>>();
    info.base_addr = j.at("base_addr").get<uint64_t>();
    info.end_addr = j.at("end_addr").get<uint64_t>();
    if (j.contains("module_path") && !j.at("module_path").is_null()) {
      info.module_path = j.at("module_path").get<std::string>();
    }
    if (info.base_addr > info.end_addr) {
      return error_result<disassembly_info>(error_code::invalid_format, "module base is above module end");
    }
    return ok_result(std::move(info));
  } catch (const nlohmann::json::exception& e) {
    return error_result<disassembly_info>(error_code::invalid_format, e.what());
  }
}

result<disassembly_info> load_disassembly_file(const std::string& path) {
  std::ifstream input(path);
  if (!input) {
    return error_result<disassembly_info>(error_code::io_error, "cannot open " + path);
  }

  nlohmann::json j;
  try {
    input >> j;
  } catch (const nlohmann::json::exception& e) {
    return error_result<disassembly_info>(error_code::invalid_format, path + ": " + e.what());
  }
  return disassembly_from_json(j);
}

status save_disassembly_file(const std::string& path, const disassembly_info& info) {
  std::ofstream output(path, std::ios::trunc);
  if (!output) {
    return make_status(error_code::io_error, "cannot create " + path);
  }
  output << disassembly_to_json(info).dump();
  output.flush();
  if (!output) {
    return make_status(error_code::io_error, "failed writing " + path);
  }
  return ok_status();
}

void sort_by_start(std::vector<basic_block>& bbs) {
  std::stable_sort(bbs.begin(), bbs.end(), [](const basic_block& left, const basic_block& right) {
    return left.start_addr() < right.start_addr();
  });
}

} // namespace tbcov
