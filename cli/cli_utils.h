#pragma once

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "navsql/navsql.h"

namespace navsql::cli {

/// Reads a file into memory for the catalog and query files.
/// MUST throw on missing/unreadable files.
/// Inputs are a path; outputs are contents; side effects are file reads.
std::string read_file(const std::string& path);
/// Reads all stdin content when no query flag is given.
std::string read_stdin();
/// Applies ANSI coloring to JSON for readability when enabled.
/// MUST NOT alter JSON semantics and MUST be disabled for non-TTY output.
/// Inputs are JSON text and a flag; outputs are colored text with no side effects.
std::string colorize_json(const std::string& input, bool enable);

/// Builds a catalog from its JSON description.
/// MUST throw std::runtime_error naming the offending schema, table or key when the
/// document is malformed or refers to unknown tables or columns.
/// Inputs are JSON text; outputs are a frozen catalog.
std::unique_ptr<Catalog> load_catalog(const std::string& json_text);
/// Maps a catalog type name (`integer`, `text`, ...) onto a domain; unknown names are opaque.
DomainPtr domain_from_name(const std::string& name);

/// Turns `--param name=value` pairs into untyped environment entries.
Environment build_environment(const std::vector<std::pair<std::string, std::string>>& params);
/// Parses `ansi`, `pgsql` or `sqlite`; throws std::invalid_argument otherwise.
Dialect parse_dialect(const std::string& name);

/// Serializes the plan (SQL, select domains, placeholders and profile) as JSON.
/// MUST keep select and placeholder ordering.
std::string build_plan_json(const Plan& plan);
/// Renders the profile and placeholders of a plan as a duckbox table.
std::string render_plan_duckbox(const Plan& plan, bool highlight, bool is_tty);

}  // namespace navsql::cli
