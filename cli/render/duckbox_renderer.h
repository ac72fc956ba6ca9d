#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "navsql/domain.h"

namespace navsql::render {

/// Controls the box table layout; zero widths and row counts mean "auto" and "all".
struct DuckboxOptions {
  size_t max_width = 0;
  size_t max_rows = 0;
  bool highlight = true;
  bool is_tty = false;
};

/// One table column; the domain supplies the type line and the cell alignment.
struct DuckboxColumn {
  std::string title;
  DomainPtr domain;
};

using DuckboxRow = std::vector<std::optional<std::string>>;

/// Renders rows as a box-drawn table under a title line and a type line.
/// MUST keep every line within max_width, MUST right-align columns of numeric
/// domains and MUST print missing cells as NULL.
/// Inputs are columns, rows and options; outputs are text with no side effects.
std::string render_duckbox(const std::vector<DuckboxColumn>& columns,
                           const std::vector<DuckboxRow>& rows, const DuckboxOptions& options);

}  // namespace navsql::render
