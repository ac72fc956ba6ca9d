#pragma once

#include <string>
#include <unordered_map>
#include <vector>

#include "frame.h"
#include "navsql/navsql.h"

namespace navsql {

struct SqlStatement {
  std::string sql;
  std::vector<Placeholder> placeholders;
};

/// Writes a reduced frame tree as SQL text for one dialect.
/// MUST emit parameters as placeholders only and MUST list them in text order.
/// Inputs are reduced segment frames; throws Error on literals the dialect cannot express.
class Serializer {
 public:
  explicit Serializer(Dialect dialect) : dialect_(dialect) {}

  SqlStatement serialize(const FramePtr& frame);

 private:
  void prepare(const FramePtr& frame, bool is_embedded);
  std::string unique_alias(const std::string& name);
  std::string base_name(const FramePtr& frame) const;
  std::string phrase_name(const PhrasePtr& phrase) const;

  std::string write_select(const Frame& frame, bool is_aliased, int depth);
  std::string write_anchor_frame(const FramePtr& frame, int depth);
  std::string write_phrase(const PhrasePtr& phrase, bool is_nested, int depth);
  std::string write_formula(const Phrase& phrase, bool is_nested, int depth);
  std::string write_literal(const Phrase& phrase);
  std::string write_placeholder(const Phrase& phrase);
  std::string write_type(const DomainPtr& domain) const;

  Dialect dialect_;
  std::unordered_map<std::string, int> alias_counts_;
  std::unordered_map<int, std::string> frame_aliases_;
  std::unordered_map<int, std::vector<std::string>> select_aliases_;
  std::unordered_map<int, FramePtr> embedded_;
  std::unordered_map<std::string, size_t> placeholder_by_name_;
  std::vector<Placeholder> placeholders_;
};

/// Quotes an SQL identifier, doubling embedded quotes.
std::string quote_name(const std::string& name);
/// Quotes an SQL string literal, doubling embedded single quotes.
std::string quote_text(const std::string& text);

}  // namespace navsql
