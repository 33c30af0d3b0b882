#include "env_config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <sstream>

namespace tbcov::util {

env_config::env_config(std::string prefix, redlog::logger log) : prefix_(std::move(prefix)), log_(std::move(log)) {
  if (!prefix_.empty() && prefix_.back() != '_') {
    prefix_ += "_";
  }
}

std::string env_config::get_env_value(const std::string& name) const {
  const char* value = std::getenv(env_name(name).c_str());
  return value ? std::string(value) : std::string();
}

std::string env_config::to_lower(const std::string& value) {
  std::string result = value;
  std::transform(result.begin(), result.end(), result.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return result;
}

std::string env_config::trim(const std::string& value) {
  size_t first = value.find_first_not_of(" \t");
  if (first == std::string::npos) {
    return {};
  }
  size_t last = value.find_last_not_of(" \t");
  return value.substr(first, last - first + 1);
}

template <> std::string env_config::get<std::string>(const std::string& name, std::string default_value) const {
  std::string value = get_env_value(name);
  return value.empty() ? default_value : value;
}

template <> bool env_config::get<bool>(const std::string& name, bool default_value) const {
  std::string value = trim(get_env_value(name));
  if (value.empty()) {
    return default_value;
  }

  std::string lower_value = to_lower(value);
  return lower_value == "1" || lower_value == "true" || lower_value == "yes" || lower_value == "on";
}

template <> int env_config::get<int>(const std::string& name, int default_value) const {
  std::string value = trim(get_env_value(name));
  if (value.empty()) {
    return default_value;
  }

  try {
    return std::stoi(value);
  } catch (const std::exception& e) {
    log_.wrn(
        "failed to parse as int, using default", redlog::field("name", env_name(name)), redlog::field("error", e.what())
    );
    return default_value;
  }
}

template <> uint64_t env_config::get<uint64_t>(const std::string& name, uint64_t default_value) const {
  std::string value = trim(get_env_value(name));
  if (value.empty()) {
    return default_value;
  }

  try {
    return std::stoull(value, nullptr, 0);
  } catch (const std::exception& e) {
    log_.wrn(
        "failed to parse as uint64_t, using default", redlog::field("name", env_name(name)),
        redlog::field("error", e.what())
    );
    return default_value;
  }
}

std::vector<std::string> env_config::get_list(const std::string& name, char delimiter) const {
  std::vector<std::string> result;
  std::string value = get_env_value(name);
  if (value.empty()) {
    return result;
  }

  std::stringstream ss(value);
  std::string item;
  while (std::getline(ss, item, delimiter)) {
    item = trim(item);
    if (!item.empty()) {
      result.push_back(item);
    }
  }
  return result;
}

} // namespace tbcov::util
