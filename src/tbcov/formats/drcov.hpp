/**
 * @file drcov.hpp
 * @brief Header-only writer for drcov version 2 coverage files
 *
 * Covers the subset of the DynamoRIO drcov container that coverage viewers such as Lighthouse
 * consume: a version 2 header, a version 2 module table with the
 * "id, base, end, entry, checksum, timestamp, path" columns and the packed 8-byte BB table.
 * Module rows are written with the same field widths the S2E tooling has always emitted:
 *
 * @code
 *   0, 0x00000000400000, 0x00000000450000, 0x00000000000000, 0x000000, 0x000000, /bin/prog
 * @endcode
 *
 * References:
 * - DrCov format analysis: https://www.ayrx.me/drcov-file-format/
 * - Lighthouse plugin: https://github.com/gaasedelen/lighthouse
 */

#pragma once

#include <cstdint>
#include <cstring>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#if defined(__BYTE_ORDER__) && __BYTE_ORDER__ == __ORDER_LITTLE_ENDIAN__
#define TBCOV_DRCOV_LITTLE_ENDIAN 1
#elif defined(_WIN32)
#define TBCOV_DRCOV_LITTLE_ENDIAN 1
#elif defined(__BYTE_ORDER__) && __BYTE_ORDER__ == __ORDER_BIG_ENDIAN__
#define TBCOV_DRCOV_LITTLE_ENDIAN 0
#else
#warning "Could not determine endianness. Assuming little-endian."
#define TBCOV_DRCOV_LITTLE_ENDIAN 1
#endif

namespace tbcov::drcov {

namespace constants {
constexpr uint32_t file_version = 2;
constexpr uint32_t module_table_version = 2;
constexpr size_t bb_entry_size = 8;
constexpr std::string_view default_flavor = "S2E";
constexpr std::string_view version_prefix = "DRCOV VERSION: ";
constexpr std::string_view flavor_prefix = "DRCOV FLAVOR: ";
constexpr std::string_view module_table_prefix = "Module Table: ";
constexpr std::string_view columns_prefix = "Columns: ";
constexpr std::string_view bb_table_prefix = "BB Table: ";
constexpr std::string_view module_columns = "id, base, end, entry, checksum, timestamp, path";
} // namespace constants

enum class error_code { success = 0, io_error, validation_error };

/**
 * @brief Exception thrown when coverage data is inconsistent or cannot be written
 */
class format_error : public std::runtime_error {
public:
  explicit format_error(error_code code, const std::string& message) : std::runtime_error(message), code_(code) {}

  error_code code() const noexcept { return code_; }

private:
  error_code code_;
};

namespace detail {

template <typename T> inline void write_le(uint8_t* data, T value) {
#if TBCOV_DRCOV_LITTLE_ENDIAN
  std::memcpy(data, &value, sizeof(T));
#else
  for (size_t i = 0; i < sizeof(T); ++i) {
    data[i] = static_cast<uint8_t>((value >> (i * 8)) & 0xFF);
  }
#endif
}

// "0x"-prefixed lowercase hex zero-padded so the whole field, prefix included, is at least width wide
inline std::string prefixed_hex(uint64_t value, size_t width) {
  std::ostringstream digits;
  digits << std::hex << value;
  std::string text = digits.str();
  if (text.size() + 2 < width) {
    text.insert(0, width - 2 - text.size(), '0');
  }
  return "0x" + text;
}

} // namespace detail

/**
 * @brief One row of the module table
 */
struct module_entry {
  uint32_t id{0};
  uint64_t base{0};
  uint64_t end{0};
  uint64_t entry{0};
  uint32_t checksum{0};
  uint32_t timestamp{0};
  std::string path;

  module_entry() = default;

  module_entry(uint32_t id, std::string path, uint64_t base, uint64_t end)
      : id(id), base(base), end(end), path(std::move(path)) {}
};

/**
 * @brief Packed BB table record, offsets are relative to the owning module's base
 */
struct bb_entry {
  uint32_t start{0};
  uint16_t size{0};
  uint16_t module_id{0};

  bb_entry() = default;

  bb_entry(uint32_t start, uint16_t size, uint16_t module_id) : start(start), size(size), module_id(module_id) {}

  bool operator==(const bb_entry& other) const {
    return start == other.start && size == other.size && module_id == other.module_id;
  }
};

struct coverage_data {
  uint32_t version{constants::file_version};
  std::string flavor{constants::default_flavor};
  std::vector<module_entry> modules;
  std::vector<bb_entry> basic_blocks;

  void validate() const {
    for (size_t i = 0; i < modules.size(); ++i) {
      if (modules[i].id != i) {
        throw format_error(
            error_code::validation_error,
            "Non-sequential module ID " + std::to_string(modules[i].id) + " at index " + std::to_string(i)
        );
      }
    }

    for (const auto& bb : basic_blocks) {
      if (bb.module_id >= modules.size()) {
        throw format_error(
            error_code::validation_error, "Basic block references invalid module ID: " + std::to_string(bb.module_id)
        );
      }
    }
  }
};

class writer {
public:
  static void write_file(const coverage_data& data, const std::string& filepath) {
    std::ofstream file(filepath, std::ios::binary | std::ios::trunc);
    if (!file) {
      throw format_error(error_code::io_error, "Cannot create file: " + filepath);
    }
    write_stream(data, file);
  }

  static void write_stream(const coverage_data& data, std::ostream& stream) {
    data.validate();
    stream << constants::version_prefix << data.version << "\n";
    stream << constants::flavor_prefix << data.flavor << "\n";
    stream << constants::module_table_prefix << "version " << constants::module_table_version << ", count "
           << data.modules.size() << "\n";
    stream << constants::columns_prefix << constants::module_columns << "\n";
    for (const auto& module : data.modules) {
      stream << format_module_row(module) << "\n";
    }
    write_bb_table(data.basic_blocks, stream);
    if (!stream) {
      throw format_error(error_code::io_error, "Error writing to stream");
    }
  }

  static std::string format_module_row(const module_entry& module) {
    std::ostringstream row;
    row << std::setw(3) << std::setfill(' ') << std::dec << module.id;
    row << ", " << detail::prefixed_hex(module.base, 16);
    row << ", " << detail::prefixed_hex(module.end, 16);
    row << ", " << detail::prefixed_hex(module.entry, 16);
    row << ", " << detail::prefixed_hex(module.checksum, 8);
    row << ", " << detail::prefixed_hex(module.timestamp, 8);
    row << ", " << module.path;
    return row.str();
  }

private:
  static void write_bb_table(const std::vector<bb_entry>& blocks, std::ostream& stream) {
    stream << constants::bb_table_prefix << blocks.size() << " bbs\n";
    if (blocks.empty()) {
      return;
    }
    std::vector<uint8_t> binary_data(blocks.size() * constants::bb_entry_size);
    for (size_t i = 0; i < blocks.size(); ++i) {
      uint8_t* entry_data = binary_data.data() + (i * constants::bb_entry_size);
      detail::write_le<uint32_t>(entry_data, blocks[i].start);
      detail::write_le<uint16_t>(entry_data + 4, blocks[i].size);
      detail::write_le<uint16_t>(entry_data + 6, blocks[i].module_id);
    }
    stream.write(reinterpret_cast<const char*>(binary_data.data()), static_cast<std::streamsize>(binary_data.size()));
  }
};

inline void write(const std::string& filepath, const coverage_data& data) { writer::write_file(data, filepath); }
inline void write(std::ostream& stream, const coverage_data& data) { writer::write_stream(data, stream); }

} // namespace tbcov::drcov

#undef TBCOV_DRCOV_LITTLE_ENDIAN
