#pragma once

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

namespace navsql::cli {

/// Captures CLI arguments so main can dispatch without re-parsing raw argv.
/// MUST keep defaults consistent with CLI behavior and MUST validate after parsing.
/// Inputs are argv; outputs are populated fields with no side effects by itself.
struct CliOptions {
  std::string catalog;
  std::string query;
  std::string query_file;
  std::vector<std::pair<std::string, std::string>> params;
  std::optional<int64_t> limit;
  std::optional<std::string> dialect;
  std::optional<std::string> output_mode;
  bool explain = false;
  std::optional<bool> color;
  bool show_help = false;
};

/// Prints the brief startup help shown when no arguments are provided.
/// MUST remain user-facing and MUST not throw on stream failures.
/// Inputs are the output stream; side effects are writing help text.
void print_startup_help(std::ostream& os);
/// Prints the full help text for explicit --help.
void print_help(std::ostream& os);
/// Parses CLI flags into options and reports a user-facing error string.
/// MUST return false on unknown flags, missing values and malformed numbers.
/// Inputs are argc/argv; outputs are options/error with no external side effects.
bool parse_cli_args(int argc, char** argv, CliOptions& options, std::string& error);

}  // namespace navsql::cli
