#pragma once

#include <string>

namespace sato::common {

/// Escape a string for embedding inside a JSON string literal.
[[nodiscard]] std::string json_escape(const std::string &value);

} // namespace sato::common
