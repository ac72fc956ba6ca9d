#include "render/duckbox_renderer.h"

#include <algorithm>
#include <clocale>
#include <cstdlib>
#include <cwchar>
#include <sstream>
#include <string>
#include <vector>

#ifndef _WIN32
#include <sys/ioctl.h>
#include <unistd.h>
#endif

namespace navsql::render {

namespace {

constexpr size_t kNarrowest = 4;
constexpr size_t kFallbackWidth = 120;
const char* const kEllipsis = "…";

size_t terminal_width() {
#ifndef _WIN32
  struct winsize size {};
  if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &size) == 0 && size.ws_col > 0) return size.ws_col;
#endif
  if (const char* columns = std::getenv("COLUMNS")) {
    long parsed = std::strtol(columns, nullptr, 10);
    if (parsed > 0) return static_cast<size_t>(parsed);
  }
  return kFallbackWidth;
}

/// Walks UTF-8 text one character at a time, reporting byte length and display width.
/// Invalid bytes count as one column each so that binary data still lines up.
class Utf8Walker {
 public:
  explicit Utf8Walker(const std::string& text) : text_(text) {
    static const bool locale_ready = std::setlocale(LC_CTYPE, "") != nullptr;
    (void)locale_ready;
  }

  bool next(size_t& bytes, size_t& width) {
    if (offset_ >= text_.size()) return false;
    wchar_t wc = 0;
    size_t length = std::mbrtowc(&wc, text_.data() + offset_, text_.size() - offset_, &state_);
    if (length == 0 || length == static_cast<size_t>(-1) || length == static_cast<size_t>(-2)) {
      state_ = std::mbstate_t{};
      bytes = 1;
      width = 1;
    } else {
      int columns = ::wcwidth(wc);
      bytes = length;
      width = columns < 0 ? 1 : static_cast<size_t>(columns);
    }
    offset_ += bytes;
    return true;
  }

  size_t offset() const { return offset_; }

 private:
  const std::string& text_;
  size_t offset_ = 0;
  std::mbstate_t state_{};
};

size_t display_width(const std::string& text) {
  Utf8Walker walker(text);
  size_t total = 0;
  size_t bytes = 0;
  size_t width = 0;
  while (walker.next(bytes, width)) total += width;
  return total;
}

std::string fit(const std::string& text, size_t width) {
  if (display_width(text) <= width) return text;
  if (width == 0) return {};
  Utf8Walker walker(text);
  size_t used = 0;
  size_t cut = 0;
  size_t bytes = 0;
  size_t step = 0;
  // One column is reserved for the ellipsis.
  while (walker.next(bytes, step) && used + step < width) {
    used += step;
    cut = walker.offset();
  }
  return text.substr(0, cut) + kEllipsis;
}

std::string pad(const std::string& text, size_t width, bool right) {
  size_t used = display_width(text);
  if (used >= width) return text;
  std::string fill(width - used, ' ');
  return right ? fill + text : text + fill;
}

std::string flatten(std::string text) {
  std::replace_if(text.begin(), text.end(),
                  [](char c) { return c == '\n' || c == '\r' || c == '\t'; }, ' ');
  return text;
}

bool is_numeric(const DomainPtr& domain) {
  if (!domain) return false;
  switch (domain->kind()) {
    case DomainKind::Integer:
    case DomainKind::Float:
    case DomainKind::Decimal:
      return true;
    default:
      return false;
  }
}

std::string rule(const std::vector<size_t>& widths, const char* left, const char* middle,
                 const char* right) {
  std::string line = left;
  for (size_t i = 0; i < widths.size(); ++i) {
    for (size_t j = 0; j < widths[i] + 2; ++j) line += "─";
    line += i + 1 < widths.size() ? middle : right;
  }
  return line;
}

/// Shrinks the widest column until the table fits, never below kNarrowest.
void squeeze(std::vector<size_t>& widths, size_t limit) {
  auto total = [&widths] {
    size_t sum = 1;
    for (size_t width : widths) sum += width + 3;
    return sum;
  };
  while (total() > limit) {
    auto widest = std::max_element(widths.begin(), widths.end());
    if (widest == widths.end() || *widest <= kNarrowest) return;
    --*widest;
  }
}

}  // namespace

std::string render_duckbox(const std::vector<DuckboxColumn>& columns,
                           const std::vector<DuckboxRow>& rows, const DuckboxOptions& options) {
  const bool styled = options.highlight && options.is_tty;
  size_t shown = options.max_rows == 0 ? rows.size() : std::min(rows.size(), options.max_rows);
  size_t limit = std::max<size_t>(options.max_width == 0 ? terminal_width() : options.max_width, 20);

  std::vector<std::string> types;
  std::vector<size_t> widths;
  for (const auto& column : columns) {
    types.push_back(column.domain ? column.domain->to_string() : std::string());
    widths.push_back(std::max({kNarrowest, display_width(column.title), display_width(types.back())}));
  }

  std::vector<std::vector<std::optional<std::string>>> cells(shown);
  for (size_t r = 0; r < shown; ++r) {
    for (size_t c = 0; c < columns.size(); ++c) {
      std::optional<std::string> cell;
      if (c < rows[r].size() && rows[r][c]) cell = flatten(*rows[r][c]);
      widths[c] = std::max(widths[c], cell ? display_width(*cell) : display_width("NULL"));
      cells[r].push_back(std::move(cell));
    }
  }
  squeeze(widths, limit);

  std::ostringstream out;
  out << rule(widths, "┌", "┬", "┐") << "\n│";
  for (size_t c = 0; c < columns.size(); ++c) {
    std::string title = pad(fit(columns[c].title, widths[c]), widths[c], false);
    out << " " << (styled ? "\033[1m" + title + "\033[0m" : title) << " │";
  }
  out << "\n│";
  for (size_t c = 0; c < columns.size(); ++c) {
    std::string type = pad(fit(types[c], widths[c]), widths[c], false);
    out << " " << (styled ? "\033[2m" + type + "\033[0m" : type) << " │";
  }
  out << "\n" << rule(widths, "├", "┼", "┤") << "\n";

  for (const auto& row : cells) {
    out << "│";
    for (size_t c = 0; c < columns.size(); ++c) {
      if (!row[c]) {
        std::string null = pad(fit("NULL", widths[c]), widths[c], is_numeric(columns[c].domain));
        out << " " << (styled ? "\033[2m" + null + "\033[0m" : null) << " │";
        continue;
      }
      out << " " << pad(fit(*row[c], widths[c]), widths[c], is_numeric(columns[c].domain)) << " │";
    }
    out << "\n";
  }

  if (shown < rows.size()) {
    size_t inner = 0;
    for (size_t width : widths) inner += width + 3;
    inner = inner > 3 ? inner - 3 : 0;
    std::string note = std::to_string(rows.size() - shown) + " more rows not shown";
    out << "│ " << pad(fit(note, inner), inner, false) << " │\n";
  }
  out << rule(widths, "└", "┴", "┘");
  return out.str();
}

}  // namespace navsql::render
