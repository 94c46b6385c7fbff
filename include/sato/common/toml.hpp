#pragma once

#include "sato/common/result.hpp"

#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace sato::common {

struct TomlDocument {
  std::unordered_map<std::string, std::string> values;
  /// Table headers in the order they appear in the file.
  std::vector<std::string> sections;

  [[nodiscard]] bool has(const std::string &key) const;
  [[nodiscard]] std::string get_string(const std::string &key,
                                       const std::string &fallback = "") const;
  [[nodiscard]] bool get_bool(const std::string &key, bool fallback) const;
  [[nodiscard]] std::uint64_t get_u64(const std::string &key, std::uint64_t fallback) const;
  [[nodiscard]] std::vector<std::string>
  get_string_array(const std::string &key, const std::vector<std::string> &fallback = {}) const;
  [[nodiscard]] std::vector<std::uint64_t>
  get_u64_array(const std::string &key, const std::vector<std::uint64_t> &fallback = {}) const;

  /// Names of the direct child tables of `prefix`, e.g. "services" yields
  /// every `[services.<id>]` id in file order.
  [[nodiscard]] std::vector<std::string> child_tables(const std::string &prefix) const;
};

[[nodiscard]] Result<TomlDocument> parse_toml(const std::string &content);

} // namespace sato::common
