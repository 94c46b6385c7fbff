#pragma once

#include "sato/common/result.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace sato::common {

[[nodiscard]] std::string trim(const std::string &input);
[[nodiscard]] bool starts_with(const std::string &value, const std::string &prefix);
[[nodiscard]] std::string to_lower(std::string value);
[[nodiscard]] std::vector<std::string> split(const std::string &value, char separator);
[[nodiscard]] std::string join(const std::vector<std::string> &values, const std::string &separator);
[[nodiscard]] Result<std::filesystem::path> home_dir();
[[nodiscard]] Result<std::filesystem::path> ensure_dir(const std::filesystem::path &path);
[[nodiscard]] std::string expand_path(std::string value);

/// Creates the parent directory if needed and probes it with a scratch file.
[[nodiscard]] Status check_writable_dir(const std::filesystem::path &dir);

} // namespace sato::common
