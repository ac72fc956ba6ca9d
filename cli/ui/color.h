#pragma once

namespace navsql::cli {

/// Defines ANSI color codes for CLI output styling and diagnostics.
/// MUST remain valid ANSI sequences and MUST stay ASCII-only for terminal compatibility.
/// Inputs are the constant strings; side effects occur when printed to terminals.
struct Color {
  const char* reset = "\033[0m";
  const char* red = "\033[31m";
  const char* green = "\033[32m";
  const char* yellow = "\033[33m";
  const char* blue = "\033[34m";
  const char* cyan = "\033[36m";
  const char* dim = "\033[2m";
  const char* bold = "\033[1m";
};

/// Shared palette; the CLI blanks it out when color is disabled.
extern Color kColor;

/// Replaces every code of the palette with an empty string.
void disable_color();

}  // namespace navsql::cli
