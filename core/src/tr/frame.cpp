#include "frame.h"

#include <functional>
#include <sstream>

namespace navsql {

namespace {

size_t mix(size_t seed, size_t value) {
  return seed ^ (value + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2));
}

PhrasePtr finish(Phrase phrase) {
  size_t seed = static_cast<size_t>(phrase.kind) + 1;
  seed = mix(seed, phrase.domain ? phrase.domain->hash() : 0);
  switch (phrase.kind) {
    case PhraseKind::Literal:
      seed = mix(seed, phrase.value.hash());
      break;
    case PhraseKind::Parameter:
      seed = mix(seed, std::hash<std::string>()(phrase.name));
      break;
    case PhraseKind::Cast:
    case PhraseKind::Formula:
      seed = mix(seed, phrase.signature.hash());
      for (const auto& arg : phrase.args) seed = mix(seed, arg->hash_value);
      break;
    case PhraseKind::Column:
      seed = mix(seed, static_cast<size_t>(phrase.tag));
      seed = mix(seed, std::hash<const void*>()(phrase.column));
      break;
    case PhraseKind::Reference:
      seed = mix(seed, static_cast<size_t>(phrase.tag));
      seed = mix(seed, phrase.index);
      break;
    case PhraseKind::Embedding:
      seed = mix(seed, static_cast<size_t>(phrase.tag));
      break;
  }
  phrase.hash_value = seed;
  return std::make_shared<const Phrase>(std::move(phrase));
}

void write_frame(std::ostream& os, const FramePtr& frame, int depth);

std::string indent(int depth) { return std::string(static_cast<size_t>(depth) * 2, ' '); }

void write_frame(std::ostream& os, const FramePtr& frame, int depth) {
  switch (frame->kind) {
    case FrameKind::Scalar:
      os << indent(depth) << "scalar #" << frame->tag << "\n";
      return;
    case FrameKind::Table:
      os << indent(depth) << "table #" << frame->tag << " " << frame->table->name() << "\n";
      return;
    case FrameKind::Nested:
      os << indent(depth) << (frame->is_permanent ? "permanent #" : "nested #") << frame->tag;
      break;
    case FrameKind::Segment:
      os << indent(depth) << "segment #" << frame->tag;
      break;
  }
  os << "\n" << indent(depth + 1) << "select:";
  for (const auto& phrase : frame->select) os << " " << phrase_to_string(phrase);
  os << "\n";
  for (const auto& anchor : frame->include) {
    os << indent(depth + 1);
    if (anchor.is_left && anchor.is_right) {
      os << "full";
    } else if (anchor.is_left) {
      os << "left";
    } else if (anchor.is_right) {
      os << "right";
    } else {
      os << "inner";
    }
    if (anchor.condition) os << " on " << phrase_to_string(anchor.condition);
    os << ":\n";
    write_frame(os, anchor.frame, depth + 2);
  }
  for (const auto& embedded : frame->embed) {
    os << indent(depth + 1) << "embed:\n";
    write_frame(os, embedded, depth + 2);
  }
  if (frame->where) os << indent(depth + 1) << "where: " << phrase_to_string(frame->where) << "\n";
  if (!frame->group.empty()) {
    os << indent(depth + 1) << "group:";
    for (const auto& phrase : frame->group) os << " " << phrase_to_string(phrase);
    os << "\n";
  }
  if (frame->having) {
    os << indent(depth + 1) << "having: " << phrase_to_string(frame->having) << "\n";
  }
  if (!frame->order.empty()) {
    os << indent(depth + 1) << "order:";
    for (const auto& item : frame->order) {
      os << " " << phrase_to_string(item.first) << (item.second < 0 ? "-" : "+");
    }
    os << "\n";
  }
  if (frame->limit) os << indent(depth + 1) << "limit: " << *frame->limit << "\n";
  if (frame->offset) os << indent(depth + 1) << "offset: " << *frame->offset << "\n";
}

}  // namespace

PhrasePtr make_literal_phrase(Value value, DomainPtr domain) {
  Phrase phrase;
  phrase.kind = PhraseKind::Literal;
  phrase.is_nullable = value.is_null();
  phrase.value = std::move(value);
  phrase.domain = std::move(domain);
  return finish(std::move(phrase));
}

PhrasePtr make_true_phrase() { return make_literal_phrase(Value::boolean(true), Domain::boolean()); }

PhrasePtr make_parameter_phrase(std::string name, DomainPtr domain) {
  Phrase phrase;
  phrase.kind = PhraseKind::Parameter;
  phrase.name = std::move(name);
  phrase.domain = std::move(domain);
  return finish(std::move(phrase));
}

PhrasePtr make_cast_phrase(PhrasePtr base, DomainPtr domain) {
  Phrase phrase;
  phrase.kind = PhraseKind::Cast;
  phrase.is_nullable = base->is_nullable;
  phrase.domain = std::move(domain);
  phrase.args.push_back(std::move(base));
  return finish(std::move(phrase));
}

PhrasePtr make_formula_phrase(Signature signature, DomainPtr domain, bool is_nullable,
                              std::vector<PhrasePtr> args) {
  Phrase phrase;
  phrase.kind = PhraseKind::Formula;
  phrase.signature = std::move(signature);
  phrase.domain = std::move(domain);
  phrase.is_nullable = is_nullable;
  phrase.args = std::move(args);
  return finish(std::move(phrase));
}

PhrasePtr make_column_phrase(int tag, const Column& column, bool is_nullable) {
  Phrase phrase;
  phrase.kind = PhraseKind::Column;
  phrase.tag = tag;
  phrase.column = &column;
  phrase.domain = column.domain;
  phrase.is_nullable = is_nullable;
  return finish(std::move(phrase));
}

PhrasePtr make_reference_phrase(int tag, size_t index, DomainPtr domain, bool is_nullable) {
  Phrase phrase;
  phrase.kind = PhraseKind::Reference;
  phrase.tag = tag;
  phrase.index = index;
  phrase.domain = std::move(domain);
  phrase.is_nullable = is_nullable;
  return finish(std::move(phrase));
}

PhrasePtr make_embedding_phrase(int tag, DomainPtr domain) {
  Phrase phrase;
  phrase.kind = PhraseKind::Embedding;
  phrase.tag = tag;
  phrase.domain = std::move(domain);
  phrase.is_nullable = true;
  return finish(std::move(phrase));
}

bool same_phrase(const PhrasePtr& left, const PhrasePtr& right) {
  if (left == right) return true;
  if (!left || !right) return false;
  if (left->hash_value != right->hash_value || left->kind != right->kind) return false;
  if (!same_domain(left->domain, right->domain)) return false;
  switch (left->kind) {
    case PhraseKind::Literal:
      return left->value == right->value;
    case PhraseKind::Parameter:
      return left->name == right->name;
    case PhraseKind::Cast:
    case PhraseKind::Formula:
      if (left->signature != right->signature || left->args.size() != right->args.size()) {
        return false;
      }
      for (size_t i = 0; i < left->args.size(); ++i) {
        if (!same_phrase(left->args[i], right->args[i])) return false;
      }
      return true;
    case PhraseKind::Column:
      return left->tag == right->tag && left->column == right->column;
    case PhraseKind::Reference:
      return left->tag == right->tag && left->index == right->index;
    case PhraseKind::Embedding:
      return left->tag == right->tag;
  }
  return false;
}

bool is_literal(const PhrasePtr& phrase) { return phrase->kind == PhraseKind::Literal; }

bool is_boolean_literal(const PhrasePtr& phrase, bool value) {
  return phrase->kind == PhraseKind::Literal && phrase->value.kind() == Value::Kind::Boolean &&
         phrase->value.as_bool() == value;
}

std::string phrase_to_string(const PhrasePtr& phrase) {
  std::ostringstream oss;
  switch (phrase->kind) {
    case PhraseKind::Literal:
      if (phrase->value.is_null()) return "null";
      if (phrase->value.kind() == Value::Kind::Text) return "'" + phrase->value.as_text() + "'";
      if (phrase->value.kind() == Value::Kind::Boolean) {
        return phrase->value.as_bool() ? "true" : "false";
      }
      return phrase->domain->dump(phrase->value);
    case PhraseKind::Parameter:
      return "$" + phrase->name;
    case PhraseKind::Cast:
      oss << phrase->domain->to_string() << "(" << phrase_to_string(phrase->args[0]) << ")";
      break;
    case PhraseKind::Formula: {
      oss << phrase->signature.to_string() << "(";
      for (size_t i = 0; i < phrase->args.size(); ++i) {
        if (i) oss << ", ";
        oss << phrase_to_string(phrase->args[i]);
      }
      oss << ")";
      break;
    }
    case PhraseKind::Column:
      oss << "#" << phrase->tag << "." << phrase->column->name;
      break;
    case PhraseKind::Reference:
      oss << "#" << phrase->tag << "[" << phrase->index << "]";
      break;
    case PhraseKind::Embedding:
      oss << "#" << phrase->tag << "()";
      break;
  }
  return oss.str();
}

std::string dump_frame(const FramePtr& frame) {
  if (!frame) return "(empty)\n";
  std::ostringstream oss;
  write_frame(oss, frame, 0);
  return oss.str();
}

}  // namespace navsql
