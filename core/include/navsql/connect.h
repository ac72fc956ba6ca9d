#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace navsql {

/// One cell of a result row in its text form; std::nullopt stands for NULL.
using Cell = std::optional<std::string>;

/// Streams the rows of one executed statement.
/// MUST release driver resources in its destructor so every exit path cleans up.
/// Inputs are driver rows; fetch() returns false once the rows are exhausted.
class Cursor {
 public:
  virtual ~Cursor() = default;
  virtual bool fetch(std::vector<Cell>& row) = 0;
};

/// Executes literal SQL text with positional parameters.
/// MUST report driver failures by throwing; the pipe wraps them into EngineError.
/// Inputs are SQL text and parameter cells in placeholder order.
class Connection {
 public:
  virtual ~Connection() = default;

  virtual bool can_read() const { return true; }
  virtual std::unique_ptr<Cursor> execute(const std::string& sql,
                                          const std::vector<Cell>& parameters) = 0;
};

}  // namespace navsql
