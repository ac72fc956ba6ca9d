#pragma once

#include <cstddef>
#include <memory>
#include <stdexcept>
#include <string>

namespace navsql {

/// Points at a fragment of the query text so errors can quote the offending input.
/// MUST keep start <= end <= text length and MUST share the text instead of copying it.
/// Inputs are the query text and a half-open range; side effects are none.
struct Mark {
  std::shared_ptr<const std::string> text;
  size_t start = 0;
  size_t end = 0;

  Mark() = default;
  Mark(std::shared_ptr<const std::string> text, size_t start, size_t end);

  bool empty() const { return !text; }
  std::string fragment() const;
  /// Renders the line holding the fragment with a caret underline.
  /// MUST return an empty string for an empty mark.
  /// Inputs are the stored range; outputs are multi-line text.
  std::string excerpt() const;

  /// Returns the smallest mark covering both arguments; an empty side is ignored.
  static Mark unite(const Mark& left, const Mark& right);
};

/// Reports a translation failure caused by the query itself.
/// MUST carry the mark of the fragment at fault when one is known.
/// Inputs are message/mark/hint; side effects are none.
class Error : public std::runtime_error {
 public:
  explicit Error(const std::string& message, Mark mark = {}, std::string hint = {});

  const Mark& mark() const { return mark_; }
  const std::string& hint() const { return hint_; }
  /// Formats message, hint and excerpt for display.
  std::string describe() const;

 private:
  Mark mark_;
  std::string hint_;
};

/// Reports a failure of the database engine or the connection to it.
/// MUST wrap the driver message verbatim and MUST NOT be retried by the core.
class EngineError : public std::runtime_error {
 public:
  explicit EngineError(const std::string& message)
      : std::runtime_error(message) {}
};

/// Reports a capability check that failed before any query was issued.
class PermissionError : public std::runtime_error {
 public:
  explicit PermissionError(const std::string& message)
      : std::runtime_error(message) {}
};

/// Throws std::logic_error when an internal invariant does not hold.
/// MUST only guard conditions that well-formed input can never violate.
/// Inputs are the condition and a message; side effects are the throw.
void internal_check(bool condition, const char* message);

}  // namespace navsql
