#include "cli_args.h"

#include <stdexcept>
#include <string>

namespace navsql::cli {

/// Prints the startup help so users see baseline usage without flags.
/// MUST keep examples aligned with current CLI and MUST not throw on stream errors.
/// Inputs are the output stream; side effects are writing text to stdout/stderr.
void print_startup_help(std::ostream& os) {
  os << "navsql - navigational query to SQL translator\n\n";
  os << "Usage:\n";
  os << "  navsql --catalog <file.json> --query <query>\n";
  os << "  navsql --catalog <file.json> --query-file <file>\n";
  os << "  navsql --param name=value --limit <n>\n";
  os << "  navsql --dialect ansi|pgsql|sqlite\n";
  os << "  navsql --mode sql|json|plan\n";
  os << "  navsql --explain\n";
  os << "  navsql --color=disabled\n\n";
  os << "Notes:\n";
  os << "  - If --query and --query-file are omitted, the query is read from stdin.\n";
  os << "  - Defaults come from $NAVSQL_CONFIG or ~/.config/navsql/config.toml.\n\n";
  os << "Examples:\n";
  os << "  navsql --catalog school.json --query \"/school{name, count(department)}\"\n";
  os << "  navsql --catalog school.json --query \"/course?credits>\\$n\" --param n=3 --mode json\n";
}

void print_help(std::ostream& os) {
  os << "Usage: navsql --catalog <file.json> --query <query>\n";
  os << "       navsql --catalog <file.json> --query-file <file>\n";
  os << "       navsql --param name=value   (repeatable)\n";
  os << "       navsql --limit <n>\n";
  os << "       navsql --dialect ansi|pgsql|sqlite\n";
  os << "       navsql --mode sql|json|plan\n";
  os << "       navsql --explain\n";
  os << "       navsql --color=disabled\n";
  os << "If no query is given, it is read from stdin.\n";
}

/// Parses argv into typed options so main can dispatch consistently.
/// MUST return false for invalid flags and MUST not throw on malformed numbers.
/// Inputs are argc/argv; outputs are options/error and no external side effects.
bool parse_cli_args(int argc, char** argv, CliOptions& options, std::string& error) {
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    bool has_value = i + 1 < argc;
    if (arg == "--catalog" && has_value) {
      options.catalog = argv[++i];
    } else if (arg == "--query" && has_value) {
      options.query = argv[++i];
    } else if (arg == "--query-file" && has_value) {
      options.query_file = argv[++i];
    } else if (arg == "--param" && has_value) {
      std::string value = argv[++i];
      size_t eq = value.find('=');
      if (eq == std::string::npos || eq == 0) {
        error = "Invalid --param value (use name=value)";
        return false;
      }
      options.params.emplace_back(value.substr(0, eq), value.substr(eq + 1));
    } else if (arg == "--limit" && has_value) {
      std::string value = argv[++i];
      try {
        size_t pos = 0;
        long long parsed = std::stoll(value, &pos);
        if (pos != value.size() || parsed < 0) {
          error = "Invalid --limit value (use a non-negative integer)";
          return false;
        }
        options.limit = static_cast<int64_t>(parsed);
      } catch (const std::logic_error&) {
        // WHY: stoll reports both bad text and overflow through logic_error subclasses.
        error = "Invalid --limit value (use a non-negative integer)";
        return false;
      }
    } else if (arg == "--dialect" && has_value) {
      std::string value = argv[++i];
      if (value != "ansi" && value != "pgsql" && value != "sqlite") {
        error = "Invalid --dialect value (use ansi|pgsql|sqlite)";
        return false;
      }
      options.dialect = value;
    } else if (arg == "--mode" && has_value) {
      std::string value = argv[++i];
      if (value != "sql" && value != "json" && value != "plan") {
        error = "Invalid --mode value (use sql|json|plan)";
        return false;
      }
      options.output_mode = value;
    } else if (arg == "--explain") {
      options.explain = true;
    } else if (arg == "--color=disabled") {
      options.color = false;
    } else if (arg == "--help") {
      options.show_help = true;
    } else {
      error = "Unknown or incomplete argument: " + arg;
      return false;
    }
  }
  return true;
}

}  // namespace navsql::cli
