#pragma once

#include "sato/common/result.hpp"
#include "sato/config/schema.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace sato::config {

[[nodiscard]] common::Result<std::filesystem::path> config_dir();
[[nodiscard]] common::Result<std::filesystem::path> config_path();
[[nodiscard]] bool config_exists();
void set_config_path_override(std::optional<std::filesystem::path> path);
void clear_config_path_override();

/// Parses TOML text into a Config; does not validate or apply the environment.
[[nodiscard]] common::Result<Config> parse_config(const std::string &content);

/// Loads the active config file (defaults when absent) and applies
/// environment overrides.
[[nodiscard]] common::Result<Config> load_config();

/// Hard errors fail the result; soft problems are returned as warnings.
[[nodiscard]] common::Result<std::vector<std::string>> validate_config(const Config &config);

void apply_env_overrides(Config &config);

/// Expanded state store paths in the order they should be tried.
[[nodiscard]] std::vector<std::filesystem::path> state_path_candidates(const Config &config);

} // namespace sato::config
