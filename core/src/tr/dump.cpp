#include "dump.h"

#include <cmath>
#include <cstdint>
#include <limits>
#include <sstream>

namespace navsql {

namespace {

std::string indent(int depth) { return std::string(static_cast<size_t>(depth) * 4, ' '); }

std::string join(const std::vector<std::string>& items, const std::string& separator) {
  std::string out;
  for (size_t i = 0; i < items.size(); ++i) {
    if (i) out += separator;
    out += items[i];
  }
  return out;
}

bool is_formula(const PhrasePtr& phrase, SignatureKind kind) {
  return phrase->kind == PhraseKind::Formula && phrase->signature.kind == kind;
}

}  // namespace

std::string quote_name(const std::string& name) {
  std::string out = "\"";
  for (char ch : name) {
    if (ch == '"') out += '"';
    out += ch;
  }
  out += '"';
  return out;
}

std::string quote_text(const std::string& text) {
  std::string out = "'";
  for (char ch : text) {
    if (ch == '\'') out += '\'';
    out += ch;
  }
  out += '\'';
  return out;
}

SqlStatement Serializer::serialize(const FramePtr& frame) {
  internal_check(frame->kind == FrameKind::Segment, "serialization starts from a segment frame");
  prepare(frame, false);
  SqlStatement statement;
  statement.sql = write_select(*frame, false, 0);
  statement.placeholders = placeholders_;
  return statement;
}

/// Assigns FROM aliases and nested select aliases, children first.
void Serializer::prepare(const FramePtr& frame, bool is_embedded) {
  if (frame->kind == FrameKind::Table) {
    frame_aliases_[frame->tag] = unique_alias(frame->table->name());
    return;
  }
  for (const auto& anchor : frame->include) prepare(anchor.frame, false);
  for (const auto& embedded : frame->embed) {
    embedded_[embedded->tag] = embedded;
    prepare(embedded, true);
  }
  if (frame->kind == FrameKind::Segment || is_embedded) return;
  frame_aliases_[frame->tag] = unique_alias(base_name(frame));

  std::unordered_map<std::string, int> counts;
  std::vector<std::string> aliases;
  for (const auto& phrase : frame->select) {
    std::string name = phrase_name(phrase);
    int count = ++counts[name];
    aliases.push_back(count == 1 ? name : name + "_" + std::to_string(count));
  }
  select_aliases_[frame->tag] = std::move(aliases);
}

std::string Serializer::unique_alias(const std::string& name) {
  int count = ++alias_counts_[name];
  return count == 1 ? name : name + "_" + std::to_string(count);
}

std::string Serializer::base_name(const FramePtr& frame) const {
  if (frame->kind == FrameKind::Table) return frame->table->name();
  if (frame->include.empty()) return "_";
  return base_name(frame->include.front().frame);
}

std::string Serializer::phrase_name(const PhrasePtr& phrase) const {
  switch (phrase->kind) {
    case PhraseKind::Column:
      return phrase->column->name;
    case PhraseKind::Reference: {
      auto found = select_aliases_.find(phrase->tag);
      if (found == select_aliases_.end()) return "_";
      return found->second.at(phrase->index);
    }
    case PhraseKind::Cast:
      return phrase_name(phrase->args[0]);
    case PhraseKind::Formula:
      if (phrase->signature.is_aggregate()) return phrase->signature.to_string();
      switch (phrase->signature.kind) {
        case SignatureKind::ToPredicate:
        case SignatureKind::FromPredicate:
        case SignatureKind::IfNull:
        case SignatureKind::NullIf:
          return phrase_name(phrase->args[0]);
        default:
          return "_";
      }
    default:
      return "_";
  }
}

/// Writes one SELECT statement; nested statements are indented one level deeper.
std::string Serializer::write_select(const Frame& frame, bool is_aliased, int depth) {
  std::string separator = "\n" + indent(depth);
  std::vector<std::string> items;
  for (size_t i = 0; i < frame.select.size(); ++i) {
    std::string item = write_phrase(frame.select[i], false, depth);
    if (is_aliased) item += " AS " + quote_name(select_aliases_.at(frame.tag).at(i));
    items.push_back(std::move(item));
  }
  std::string sql = "SELECT " + join(items, ", ");

  for (size_t i = 0; i < frame.include.size(); ++i) {
    const Anchor& anchor = frame.include[i];
    std::string target = write_anchor_frame(anchor.frame, depth);
    if (i == 0) {
      sql += separator + "FROM " + target;
      continue;
    }
    if (anchor.is_cross()) {
      sql += separator + "CROSS JOIN " + target;
      continue;
    }
    std::string kind = "JOIN ";
    if (anchor.is_left && anchor.is_right) {
      kind = "FULL OUTER JOIN ";
    } else if (anchor.is_left) {
      kind = "LEFT OUTER JOIN ";
    } else if (anchor.is_right) {
      kind = "RIGHT OUTER JOIN ";
    }
    std::string condition = anchor.condition ? write_phrase(anchor.condition, false, depth)
                                             : write_literal(*make_true_phrase());
    sql += separator + kind + target + " ON " + condition;
  }

  if (frame.where) sql += separator + "WHERE " + write_phrase(frame.where, false, depth);
  if (!frame.group.empty()) {
    std::vector<std::string> group;
    for (const auto& phrase : frame.group) group.push_back(write_phrase(phrase, false, depth));
    sql += separator + "GROUP BY " + join(group, ", ");
  }
  if (frame.having) sql += separator + "HAVING " + write_phrase(frame.having, false, depth);
  if (!frame.order.empty()) {
    std::vector<std::string> order;
    for (const auto& item : frame.order) {
      order.push_back(write_phrase(item.first, false, depth) +
                      (item.second < 0 ? " DESC" : " ASC"));
    }
    sql += separator + "ORDER BY " + join(order, ", ");
  }

  if (dialect_ == Dialect::Ansi) {
    if (frame.offset) sql += separator + "OFFSET " + std::to_string(*frame.offset) + " ROWS";
    if (frame.limit) {
      sql += separator + "FETCH FIRST " + std::to_string(*frame.limit) + " ROWS ONLY";
    }
  } else {
    if (frame.limit) {
      sql += separator + "LIMIT " + std::to_string(*frame.limit);
    } else if (frame.offset && dialect_ == Dialect::Sqlite) {
      // WHY: SQLite accepts OFFSET only after a LIMIT clause.
      sql += separator + "LIMIT -1";
    }
    if (frame.offset) sql += separator + "OFFSET " + std::to_string(*frame.offset);
  }
  return sql;
}

std::string Serializer::write_anchor_frame(const FramePtr& frame, int depth) {
  switch (frame->kind) {
    case FrameKind::Table:
      return quote_name(frame->table->schema().name()) + "." + quote_name(frame->table->name()) +
             " AS " + quote_name(frame_aliases_.at(frame->tag));
    case FrameKind::Scalar:
      return "(SELECT " + write_literal(*make_true_phrase()) + ") AS " +
             quote_name(unique_alias("_"));
    default:
      return "(" + write_select(*frame, true, depth + 1) + ") AS " +
             quote_name(frame_aliases_.at(frame->tag));
  }
}

std::string Serializer::write_phrase(const PhrasePtr& phrase, bool is_nested, int depth) {
  switch (phrase->kind) {
    case PhraseKind::Literal:
      return write_literal(*phrase);
    case PhraseKind::Parameter:
      return write_placeholder(*phrase);
    case PhraseKind::Cast:
      return "CAST(" + write_phrase(phrase->args[0], false, depth) + " AS " +
             write_type(phrase->domain) + ")";
    case PhraseKind::Formula:
      return write_formula(*phrase, is_nested, depth);
    case PhraseKind::Column:
      return quote_name(frame_aliases_.at(phrase->tag)) + "." + quote_name(phrase->column->name);
    case PhraseKind::Reference:
      return quote_name(frame_aliases_.at(phrase->tag)) + "." +
             quote_name(select_aliases_.at(phrase->tag).at(phrase->index));
    case PhraseKind::Embedding: {
      auto found = embedded_.find(phrase->tag);
      internal_check(found != embedded_.end(), "an embedding phrase refers to an embedded frame");
      return "(" + write_select(*found->second, false, depth + 1) + ")";
    }
  }
  return {};
}

std::string Serializer::write_formula(const Phrase& phrase, bool is_nested, int depth) {
  const Signature& signature = phrase.signature;
  const auto& args = phrase.args;
  auto arg = [&](size_t index) { return write_phrase(args[index], true, depth); };
  auto wrap = [is_nested](const std::string& text) {
    return is_nested ? "(" + text + ")" : text;
  };
  auto call = [&](const std::string& name) {
    std::vector<std::string> items;
    for (const auto& item : args) items.push_back(write_phrase(item, false, depth));
    return name + "(" + join(items, ", ") + ")";
  };
  bool positive = signature.polarity >= 0;

  switch (signature.kind) {
    case SignatureKind::ToPredicate:
    case SignatureKind::FromPredicate:
      return write_phrase(args[0], is_nested, depth);
    case SignatureKind::IsEqual:
      return wrap(arg(0) + (positive ? " = " : " <> ") + arg(1));
    case SignatureKind::IsTotallyEqual:
      if (dialect_ == Dialect::Sqlite) return wrap(arg(0) + (positive ? " IS " : " IS NOT ") + arg(1));
      return wrap(arg(0) + (positive ? " IS NOT DISTINCT FROM " : " IS DISTINCT FROM ") + arg(1));
    case SignatureKind::IsIn: {
      std::vector<std::string> items;
      for (size_t i = 1; i < args.size(); ++i) items.push_back(write_phrase(args[i], false, depth));
      return wrap(arg(0) + (positive ? " IN (" : " NOT IN (") + join(items, ", ") + ")");
    }
    case SignatureKind::IsNull:
      return wrap(arg(0) + (positive ? " IS NULL" : " IS NOT NULL"));
    case SignatureKind::Compare:
      return wrap(arg(0) + " " + signature.op + " " + arg(1));
    case SignatureKind::And:
    case SignatureKind::Or: {
      std::vector<std::string> items;
      for (size_t i = 0; i < args.size(); ++i) items.push_back(arg(i));
      return wrap(join(items, signature.kind == SignatureKind::And ? " AND " : " OR "));
    }
    case SignatureKind::Not:
      return wrap("NOT " + arg(0));
    case SignatureKind::NullIf:
      return call("NULLIF");
    case SignatureKind::IfNull:
      return call("COALESCE");
    case SignatureKind::Add:
      return wrap(arg(0) + " + " + arg(1));
    case SignatureKind::Subtract:
      return wrap(arg(0) + " - " + arg(1));
    case SignatureKind::Multiply:
      return wrap(arg(0) + " * " + arg(1));
    case SignatureKind::Divide:
      return wrap(arg(0) + " / " + arg(1));
    case SignatureKind::Negate:
      return wrap("- " + arg(0));
    case SignatureKind::Like: {
      std::string escape = " ESCAPE " + quote_text("\\");
      if (dialect_ == Dialect::PgSql) {
        return wrap(arg(0) + (positive ? " ILIKE " : " NOT ILIKE ") + arg(1) + escape);
      }
      if (dialect_ == Dialect::Sqlite) {
        return wrap(arg(0) + (positive ? " LIKE " : " NOT LIKE ") + arg(1) + escape);
      }
      return wrap("LOWER(" + write_phrase(args[0], false, depth) + ")" +
                  (positive ? " LIKE " : " NOT LIKE ") + "LOWER(" +
                  write_phrase(args[1], false, depth) + ")" + escape);
    }
    case SignatureKind::Concat:
      return wrap(arg(0) + " || " + arg(1));
    case SignatureKind::Replace:
      return call("REPLACE");
    case SignatureKind::Count:
      return call("COUNT");
    case SignatureKind::Sum:
      return call("SUM");
    case SignatureKind::Min:
      return call("MIN");
    case SignatureKind::Max:
      return call("MAX");
    case SignatureKind::Avg:
      return call("AVG");
    case SignatureKind::Exists:
      internal_check(args[0]->kind == PhraseKind::Embedding, "EXISTS takes a subquery");
      return (positive ? "EXISTS " : "NOT EXISTS ") + write_phrase(args[0], false, depth);
  }
  return {};
}

std::string Serializer::write_literal(const Phrase& phrase) {
  const Value& value = phrase.value;
  if (value.is_null()) return "NULL";
  bool is_sqlite = dialect_ == Dialect::Sqlite;
  switch (value.kind()) {
    case Value::Kind::Boolean:
      if (is_sqlite) return value.as_bool() ? "1" : "0";
      return value.as_bool() ? "TRUE" : "FALSE";
    case Value::Kind::Integer: {
      const Integer& number = value.as_integer();
      if (number < std::numeric_limits<int64_t>::min() ||
          number > std::numeric_limits<int64_t>::max()) {
        throw Error("invalid integer value");
      }
      return number.str();
    }
    case Value::Kind::Float: {
      double number = value.as_float();
      if (!std::isfinite(number)) throw Error("invalid float value");
      std::ostringstream oss;
      oss.precision(17);
      oss << number;
      std::string text = oss.str();
      if (text.find_first_of(".eE") == std::string::npos) text += "e0";
      return text;
    }
    case Value::Kind::Decimal:
      return phrase.domain->dump(value);
    case Value::Kind::Text:
      return quote_text(value.as_text());
    case Value::Kind::Date:
      return is_sqlite ? quote_text(phrase.domain->dump(value))
                       : "DATE " + quote_text(phrase.domain->dump(value));
    case Value::Kind::Time:
      return is_sqlite ? quote_text(phrase.domain->dump(value))
                       : "TIME " + quote_text(phrase.domain->dump(value));
    case Value::Kind::DateTime:
      return is_sqlite ? quote_text(phrase.domain->dump(value))
                       : "TIMESTAMP " + quote_text(phrase.domain->dump(value));
    default:
      throw Error("unable to serialize a value of type " + phrase.domain->to_string());
  }
}

/// Emits a placeholder; PostgreSQL reuses one numbered slot per parameter name.
std::string Serializer::write_placeholder(const Phrase& phrase) {
  if (dialect_ == Dialect::PgSql) {
    auto found = placeholder_by_name_.find(phrase.name);
    if (found == placeholder_by_name_.end()) {
      size_t index = placeholders_.size();
      placeholders_.push_back(Placeholder{index, phrase.name, phrase.domain});
      found = placeholder_by_name_.emplace(phrase.name, index).first;
    }
    return "$" + std::to_string(found->second + 1);
  }
  placeholders_.push_back(Placeholder{placeholders_.size(), phrase.name, phrase.domain});
  return "?";
}

std::string Serializer::write_type(const DomainPtr& domain) const {
  bool is_sqlite = dialect_ == Dialect::Sqlite;
  switch (domain->kind()) {
    case DomainKind::Boolean:
      return is_sqlite ? "INTEGER" : "BOOLEAN";
    case DomainKind::Integer:
      return "INTEGER";
    case DomainKind::Float:
      return is_sqlite ? "REAL" : "DOUBLE PRECISION";
    case DomainKind::Decimal:
      return is_sqlite ? "NUMERIC" : "DECIMAL";
    case DomainKind::Text:
    case DomainKind::Enum:
      return dialect_ == Dialect::Ansi ? "VARCHAR" : "TEXT";
    case DomainKind::Date:
      return is_sqlite ? "TEXT" : "DATE";
    case DomainKind::Time:
      return is_sqlite ? "TEXT" : "TIME";
    case DomainKind::DateTime:
      return is_sqlite ? "TEXT" : "TIMESTAMP";
    default:
      throw Error("unable to cast to type " + domain->to_string());
  }
}

}  // namespace navsql
