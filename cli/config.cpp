#include "config.h"

#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace navsql::cli {

namespace {

std::string get_env(const char* name) {
  if (const char* value = std::getenv(name)) {
    if (*value) return value;
  }
  return {};
}

std::string trim_copy(const std::string& value) {
  size_t start = 0;
  while (start < value.size() && std::isspace(static_cast<unsigned char>(value[start]))) {
    ++start;
  }
  size_t end = value.size();
  while (end > start && std::isspace(static_cast<unsigned char>(value[end - 1]))) {
    --end;
  }
  return value.substr(start, end - start);
}

std::string to_lower(const std::string& value) {
  std::string lower;
  lower.reserve(value.size());
  for (unsigned char c : value) lower.push_back(static_cast<char>(std::tolower(c)));
  return lower;
}

bool parse_bool(const std::string& raw, bool& out) {
  std::string lower = to_lower(raw);
  if (lower == "true") {
    out = true;
    return true;
  }
  if (lower == "false") {
    out = false;
    return true;
  }
  return false;
}

bool parse_limit(const std::string& raw, int64_t& out) {
  try {
    size_t pos = 0;
    long long value = std::stoll(raw, &pos);
    if (pos != raw.size() || value < 0) return false;
    out = static_cast<int64_t>(value);
    return true;
  } catch (const std::invalid_argument&) {
    return false;
  } catch (const std::out_of_range&) {
    return false;
  }
}

std::string parse_string_value(const std::string& raw, bool& ok) {
  std::string trimmed = trim_copy(raw);
  if (trimmed.empty()) {
    ok = false;
    return {};
  }
  if ((trimmed.front() == '"' && trimmed.back() == '"') ||
      (trimmed.front() == '\'' && trimmed.back() == '\'')) {
    if (trimmed.size() < 2) {
      ok = false;
      return {};
    }
    ok = true;
    return trimmed.substr(1, trimmed.size() - 2);
  }
  ok = true;
  return trimmed;
}

}  // namespace

std::string resolve_config_path() {
  std::string override = get_env("NAVSQL_CONFIG");
  if (!override.empty()) {
    return override;
  }
  std::string xdg_config = get_env("XDG_CONFIG_HOME");
  if (!xdg_config.empty()) {
    return (std::filesystem::path(xdg_config) / "navsql" / "config.toml").string();
  }
  std::string home = get_env("HOME");
  if (!home.empty()) {
    return (std::filesystem::path(home) / ".config" / "navsql" / "config.toml").string();
  }
  return "navsql.config.toml";
}

bool load_config(const std::string& path, CliSettings& out, std::string& error) {
  out = CliSettings{};
  if (path.empty()) return false;
  if (!std::filesystem::exists(path)) {
    return false;
  }
  std::ifstream in(path);
  if (!in) {
    error = "Failed to open config: " + path;
    return false;
  }
  std::string section;
  std::string line;
  size_t line_no = 0;
  while (std::getline(in, line)) {
    ++line_no;
    std::string trimmed = trim_copy(line);
    if (trimmed.empty() || trimmed[0] == '#') continue;
    if (trimmed.front() == '[' && trimmed.back() == ']') {
      section = trim_copy(trimmed.substr(1, trimmed.size() - 2));
      continue;
    }
    size_t eq = trimmed.find('=');
    if (eq == std::string::npos) continue;
    std::string key = trim_copy(trimmed.substr(0, eq));
    std::string value = trim_copy(trimmed.substr(eq + 1));
    if (key.empty()) continue;
    std::string full_key = section.empty() ? key : section + "." + key;
    std::string at_line = " at line " + std::to_string(line_no);
    bool ok = false;
    if (full_key == "translate.limit") {
      int64_t parsed = 0;
      if (!parse_limit(value, parsed)) {
        error = "Invalid translate.limit" + at_line;
        return false;
      }
      out.limit = parsed;
    } else if (full_key == "translate.dialect") {
      std::string parsed = to_lower(parse_string_value(value, ok));
      if (!ok || (parsed != "ansi" && parsed != "pgsql" && parsed != "sqlite")) {
        error = "Invalid translate.dialect" + at_line;
        return false;
      }
      out.dialect = parsed;
    } else if (full_key == "output.mode") {
      std::string parsed = to_lower(parse_string_value(value, ok));
      if (!ok || (parsed != "sql" && parsed != "json" && parsed != "plan")) {
        error = "Invalid output.mode" + at_line;
        return false;
      }
      out.output_mode = parsed;
    } else if (full_key == "output.color") {
      bool parsed = false;
      if (!parse_bool(value, parsed)) {
        error = "Invalid output.color" + at_line;
        return false;
      }
      out.color = parsed;
    }
  }
  return true;
}

}  // namespace navsql::cli
