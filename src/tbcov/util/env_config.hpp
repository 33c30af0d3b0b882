#pragma once

#include <cstdint>
#include <initializer_list>
#include <string>
#include <utility>
#include <vector>

#include <redlog.hpp>

namespace tbcov::util {

/**
 * @brief Reads PREFIX_NAME environment variables with typed defaults
 *
 * Unparseable values fall back to the default and are reported through the logger.
 */
class env_config {
public:
  explicit env_config(std::string prefix = "", redlog::logger log = redlog::get_logger("tbcov.env"));

  template <typename T> T get(const std::string& name, T default_value) const;

  std::vector<std::string> get_list(const std::string& name, char delimiter = ',') const;

  template <typename enum_type>
  enum_type get_enum(
      const std::initializer_list<std::pair<const char*, enum_type>>& mapping, const std::string& name,
      enum_type default_value
  ) const;

  std::string env_name(const std::string& name) const { return prefix_ + name; }

private:
  std::string prefix_;
  redlog::logger log_;

  std::string get_env_value(const std::string& name) const;
  static std::string to_lower(const std::string& value);
  static std::string trim(const std::string& value);
};

template <typename enum_type>
enum_type env_config::get_enum(
    const std::initializer_list<std::pair<const char*, enum_type>>& mapping, const std::string& name,
    enum_type default_value
) const {
  std::string value = trim(get_env_value(name));
  if (value.empty()) {
    return default_value;
  }

  std::string lower_value = to_lower(value);
  for (const auto& pair : mapping) {
    if (to_lower(pair.first) == lower_value) {
      return pair.second;
    }
  }

  log_.wrn("unknown value, using default", redlog::field("name", env_name(name)), redlog::field("value", value));
  return default_value;
}

template <> std::string env_config::get<std::string>(const std::string& name, std::string default_value) const;
template <> bool env_config::get<bool>(const std::string& name, bool default_value) const;
template <> int env_config::get<int>(const std::string& name, int default_value) const;
template <> uint64_t env_config::get<uint64_t>(const std::string& name, uint64_t default_value) const;

} // namespace tbcov::util
