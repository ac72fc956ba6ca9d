#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace navsql::cli {

/// Values read from the config file; unset keys leave CLI defaults untouched.
struct CliSettings {
  std::optional<int64_t> limit;
  std::optional<std::string> dialect;
  std::optional<std::string> output_mode;
  std::optional<bool> color;
};

/// Finds the config file: NAVSQL_CONFIG, then XDG_CONFIG_HOME, then HOME.
/// MUST return a path even when the file does not exist.
/// Inputs are environment variables; side effects are none.
std::string resolve_config_path();
/// Reads `[translate]` and `[output]` keys from a TOML-like file.
/// MUST return false without an error when the file is missing and MUST
/// report the line of the first invalid value.
/// Inputs are a path; outputs are settings and an error message.
bool load_config(const std::string& path, CliSettings& out, std::string& error);

}  // namespace navsql::cli
