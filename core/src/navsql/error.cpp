#include "navsql/error.h"

#include <algorithm>
#include <sstream>

namespace navsql {

Mark::Mark(std::shared_ptr<const std::string> text, size_t start, size_t end)
    : text(std::move(text)), start(start), end(end) {}

std::string Mark::fragment() const {
  if (!text) return {};
  size_t s = std::min(start, text->size());
  size_t e = std::min(std::max(end, s), text->size());
  return text->substr(s, e - s);
}

std::string Mark::excerpt() const {
  if (!text) return {};
  const std::string& input = *text;
  size_t s = std::min(start, input.size());
  size_t e = std::min(std::max(end, s), input.size());
  size_t line_start = s;
  while (line_start > 0 && input[line_start - 1] != '\n') {
    --line_start;
  }
  size_t line_end = input.find('\n', s);
  if (line_end == std::string::npos) line_end = input.size();
  // WHY: a fragment spanning lines is underlined up to the end of its first line.
  size_t underline_end = std::min(e, line_end);
  size_t width = underline_end > s ? underline_end - s : 1;
  std::ostringstream oss;
  oss << "    " << input.substr(line_start, line_end - line_start) << "\n";
  oss << "    " << std::string(s - line_start, ' ') << std::string(width, '^');
  return oss.str();
}

Mark Mark::unite(const Mark& left, const Mark& right) {
  if (left.empty()) return right;
  if (right.empty() || left.text != right.text) return left;
  return Mark(left.text, std::min(left.start, right.start), std::max(left.end, right.end));
}

Error::Error(const std::string& message, Mark mark, std::string hint)
    : std::runtime_error(message), mark_(std::move(mark)), hint_(std::move(hint)) {}

std::string Error::describe() const {
  std::ostringstream oss;
  oss << what();
  if (!hint_.empty()) {
    oss << ": " << hint_;
  }
  std::string excerpt = mark_.excerpt();
  if (!excerpt.empty()) {
    oss << "\nWhile translating:\n" << excerpt;
  }
  return oss.str();
}

void internal_check(bool condition, const char* message) {
  if (!condition) {
    throw std::logic_error(std::string("internal invariant violated: ") + message);
  }
}

}  // namespace navsql
