#include "sato/common/toml.hpp"

#include "sato/common/fs.hpp"

#include <algorithm>
#include <charconv>
#include <sstream>

namespace sato::common {

namespace {

std::string strip_comment(const std::string &line) {
  bool in_quotes = false;
  std::string output;
  output.reserve(line.size());

  for (std::size_t i = 0; i < line.size(); ++i) {
    const char ch = line[i];
    if (ch == '"' && (i == 0 || line[i - 1] != '\\')) {
      in_quotes = !in_quotes;
    }
    if (!in_quotes && ch == '#') {
      break;
    }
    output.push_back(ch);
  }

  return output;
}

std::vector<std::string> split_array_elements(const std::string &array_value) {
  std::vector<std::string> result;
  std::string current;
  bool in_quotes = false;

  for (std::size_t i = 0; i < array_value.size(); ++i) {
    const char ch = array_value[i];
    if (ch == '"' && (i == 0 || array_value[i - 1] != '\\')) {
      in_quotes = !in_quotes;
      current.push_back(ch);
      continue;
    }

    if (!in_quotes && ch == ',') {
      result.push_back(trim(current));
      current.clear();
      continue;
    }

    current.push_back(ch);
  }

  if (!trim(current).empty()) {
    result.push_back(trim(current));
  }

  return result;
}

std::string unquote(std::string value) {
  value = trim(value);
  if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
    std::string out;
    out.reserve(value.size() - 2);
    bool escaped = false;
    for (std::size_t i = 1; i + 1 < value.size(); ++i) {
      const char ch = value[i];
      if (!escaped && ch == '\\') {
        escaped = true;
        continue;
      }
      out.push_back(ch);
      escaped = false;
    }
    return out;
  }
  return value;
}

template <typename T> bool parse_number(const std::string &raw, T &out) {
  const std::string normalized = trim(raw);
  const auto *first = normalized.data();
  const auto *last = first + normalized.size();
  auto [ptr, ec] = std::from_chars(first, last, out);
  return ec == std::errc() && ptr == last && first != last;
}

int bracket_balance(const std::string &text) {
  int balance = 0;
  bool in_quotes = false;
  for (std::size_t i = 0; i < text.size(); ++i) {
    const char ch = text[i];
    if (ch == '"' && (i == 0 || text[i - 1] != '\\')) {
      in_quotes = !in_quotes;
    } else if (!in_quotes && ch == '[') {
      ++balance;
    } else if (!in_quotes && ch == ']') {
      --balance;
    }
  }
  return balance;
}

} // namespace

bool TomlDocument::has(const std::string &key) const { return values.contains(key); }

std::string TomlDocument::get_string(const std::string &key, const std::string &fallback) const {
  const auto it = values.find(key);
  if (it == values.end()) {
    return fallback;
  }
  return unquote(it->second);
}

bool TomlDocument::get_bool(const std::string &key, bool fallback) const {
  const auto it = values.find(key);
  if (it == values.end()) {
    return fallback;
  }
  const std::string normalized = to_lower(trim(it->second));
  if (normalized == "true") {
    return true;
  }
  if (normalized == "false") {
    return false;
  }
  return fallback;
}

std::uint64_t TomlDocument::get_u64(const std::string &key, std::uint64_t fallback) const {
  const auto it = values.find(key);
  std::uint64_t parsed = 0;
  if (it == values.end() || !parse_number(it->second, parsed)) {
    return fallback;
  }
  return parsed;
}

std::vector<std::string>
TomlDocument::get_string_array(const std::string &key,
                               const std::vector<std::string> &fallback) const {
  const auto it = values.find(key);
  if (it == values.end()) {
    return fallback;
  }

  const std::string raw = trim(it->second);
  if (raw.size() < 2 || raw.front() != '[' || raw.back() != ']') {
    return fallback;
  }

  const std::string body = raw.substr(1, raw.size() - 2);
  std::vector<std::string> values_out;
  for (const auto &element : split_array_elements(body)) {
    if (!element.empty()) {
      values_out.push_back(unquote(element));
    }
  }

  return values_out;
}

std::vector<std::uint64_t>
TomlDocument::get_u64_array(const std::string &key,
                            const std::vector<std::uint64_t> &fallback) const {
  if (!has(key)) {
    return fallback;
  }
  std::vector<std::uint64_t> out;
  for (const auto &element : get_string_array(key)) {
    std::uint64_t parsed = 0;
    if (!parse_number(element, parsed)) {
      return fallback;
    }
    out.push_back(parsed);
  }
  return out;
}

std::vector<std::string> TomlDocument::child_tables(const std::string &prefix) const {
  const std::string head = prefix + ".";
  std::vector<std::string> names;
  for (const auto &section : sections) {
    if (!starts_with(section, head)) {
      continue;
    }
    const std::string rest = section.substr(head.size());
    if (rest.empty() || rest.find('.') != std::string::npos) {
      continue;
    }
    if (std::find(names.begin(), names.end(), rest) == names.end()) {
      names.push_back(rest);
    }
  }
  return names;
}

Result<TomlDocument> parse_toml(const std::string &content) {
  TomlDocument document;
  std::istringstream stream(content);
  std::string line;
  std::string current_section;
  std::size_t line_number = 0;

  while (std::getline(stream, line)) {
    ++line_number;
    const std::string clean_line = trim(strip_comment(line));
    if (clean_line.empty()) {
      continue;
    }

    if (clean_line.front() == '[' && clean_line.back() == ']') {
      current_section = trim(clean_line.substr(1, clean_line.size() - 2));
      if (current_section.empty()) {
        return Result<TomlDocument>::failure("Invalid empty section at line " +
                                             std::to_string(line_number));
      }
      document.sections.push_back(current_section);
      continue;
    }

    const std::size_t equals_index = clean_line.find('=');
    if (equals_index == std::string::npos) {
      return Result<TomlDocument>::failure("Invalid key/value at line " +
                                           std::to_string(line_number));
    }

    const std::string key = trim(clean_line.substr(0, equals_index));
    std::string value = trim(clean_line.substr(equals_index + 1));
    if (key.empty()) {
      return Result<TomlDocument>::failure("Missing key at line " +
                                           std::to_string(line_number));
    }

    // Arrays may span several lines.
    const std::size_t start_line = line_number;
    while (bracket_balance(value) > 0 && std::getline(stream, line)) {
      ++line_number;
      value += " " + trim(strip_comment(line));
    }
    if (bracket_balance(value) != 0) {
      return Result<TomlDocument>::failure("Unterminated array at line " +
                                           std::to_string(start_line));
    }

    const std::string full_key = current_section.empty() ? key : current_section + "." + key;
    document.values[full_key] = value;
  }

  return Result<TomlDocument>::success(std::move(document));
}

} // namespace sato::common
