#include "navsql/domain.h"

#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <functional>
#include <iomanip>
#include <locale>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace navsql {

namespace {

size_t hash_combine(size_t seed, size_t value) {
  return seed ^ (value + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2));
}

size_t hash_integer(const Integer& value) {
  return std::hash<std::string>()(value.str());
}

/// Strips trailing zeros of the fraction so numerically equal decimals compare equal.
DecimalValue normalize(const DecimalValue& value) {
  DecimalValue out = value;
  while (out.scale > 0 && out.unscaled != 0 && out.unscaled % 10 == 0) {
    out.unscaled /= 10;
    --out.scale;
  }
  if (out.unscaled == 0) out.scale = 0;
  return out;
}

std::string quote_item(const std::string& text) {
  std::string out = "'";
  for (char c : text) {
    if (c == '\'') out += "''";
    else out.push_back(c);
  }
  out.push_back('\'');
  return out;
}

bool is_label_char(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-';
}

void skip_spaces(const std::string& text, size_t& pos) {
  while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos]))) {
    ++pos;
  }
}

/// Reads a quoted item starting at an opening quote; doubled quotes escape a quote.
std::string read_quoted(const std::string& text, size_t& pos) {
  ++pos;
  std::string out;
  while (true) {
    if (pos >= text.size()) {
      throw std::invalid_argument("unterminated quoted item");
    }
    char c = text[pos++];
    if (c == '\'') {
      if (pos < text.size() && text[pos] == '\'') {
        out.push_back('\'');
        ++pos;
        continue;
      }
      return out;
    }
    out.push_back(c);
  }
}

bool read_fixed_digits(const std::string& text, size_t& pos, size_t count, int& out) {
  if (pos + count > text.size()) return false;
  int value = 0;
  for (size_t i = 0; i < count; ++i) {
    char c = text[pos + i];
    if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    value = value * 10 + (c - '0');
  }
  pos += count;
  out = value;
  return true;
}

bool is_leap_year(int year) {
  return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

int days_in_month(int year, int month) {
  static const int kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
  if (month == 2 && is_leap_year(year)) return 29;
  return kDays[month - 1];
}

bool parse_date_part(const std::string& text, size_t& pos, DateValue& out) {
  int year = 0;
  int month = 0;
  int day = 0;
  if (!read_fixed_digits(text, pos, 4, year)) return false;
  if (pos >= text.size() || text[pos] != '-') return false;
  ++pos;
  if (!read_fixed_digits(text, pos, 2, month)) return false;
  if (pos >= text.size() || text[pos] != '-') return false;
  ++pos;
  if (!read_fixed_digits(text, pos, 2, day)) return false;
  if (year < 1 || month < 1 || month > 12) {
    throw std::invalid_argument("invalid date literal: month must be in 1..12");
  }
  if (day < 1 || day > days_in_month(year, month)) {
    throw std::invalid_argument("invalid date literal: day is out of range for month");
  }
  out = DateValue{year, month, day};
  return true;
}

bool parse_time_part(const std::string& text, size_t& pos, TimeValue& out) {
  int hour = 0;
  size_t start = pos;
  while (pos < text.size() && pos - start < 2 && std::isdigit(static_cast<unsigned char>(text[pos]))) {
    hour = hour * 10 + (text[pos] - '0');
    ++pos;
  }
  if (pos == start) return false;
  if (pos >= text.size() || text[pos] != ':') return false;
  ++pos;
  int minute = 0;
  if (!read_fixed_digits(text, pos, 2, minute)) return false;
  int second = 0;
  int microsecond = 0;
  if (pos < text.size() && text[pos] == ':') {
    ++pos;
    if (!read_fixed_digits(text, pos, 2, second)) return false;
    if (pos < text.size() && text[pos] == '.') {
      ++pos;
      std::string digits;
      while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
        digits.push_back(text[pos]);
        ++pos;
      }
      if (digits.empty()) return false;
      // WHY: precision beyond microseconds is truncated, shorter fractions are padded.
      digits.resize(6, '0');
      microsecond = std::stoi(digits);
    }
  }
  if (hour > 23 || minute > 59 || second > 59) {
    throw std::invalid_argument("invalid time literal: component out of range");
  }
  out = TimeValue{hour, minute, second, microsecond};
  return true;
}

std::string dump_date(const DateValue& d) {
  char buffer[32];
  std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02d", d.year, d.month, d.day);
  return buffer;
}

std::string dump_time(const TimeValue& t) {
  char buffer[32];
  if (t.microsecond != 0) {
    std::snprintf(buffer, sizeof(buffer), "%02d:%02d:%02d.%06d", t.hour, t.minute, t.second,
                  t.microsecond);
  } else {
    std::snprintf(buffer, sizeof(buffer), "%02d:%02d:%02d", t.hour, t.minute, t.second);
  }
  return buffer;
}

std::string dump_float(double value) {
  for (int precision = 1; precision <= 17; ++precision) {
    std::ostringstream oss;
    oss.imbue(std::locale::classic());
    oss << std::setprecision(precision) << value;
    std::string out = oss.str();
    if (std::strtod(out.c_str(), nullptr) == value || precision == 17) {
      if (out.find_first_of(".eE") == std::string::npos) {
        out += ".0";
      }
      return out;
    }
  }
  return {};
}

std::string dump_decimal(const DecimalValue& value) {
  bool negative = value.unscaled < 0;
  Integer magnitude = negative ? Integer(-value.unscaled) : value.unscaled;
  std::string digits = magnitude.str();
  if (value.scale > 0) {
    size_t scale = static_cast<size_t>(value.scale);
    if (digits.size() <= scale) {
      digits.insert(0, scale - digits.size() + 1, '0');
    }
    digits.insert(digits.size() - scale, ".");
  }
  return negative ? "-" + digits : digits;
}

DecimalValue parse_decimal(const std::string& text) {
  size_t pos = 0;
  bool negative = false;
  if (pos < text.size() && (text[pos] == '+' || text[pos] == '-')) {
    negative = text[pos] == '-';
    ++pos;
  }
  std::string digits;
  int fraction = 0;
  bool seen_point = false;
  while (pos < text.size()) {
    char c = text[pos];
    if (std::isdigit(static_cast<unsigned char>(c))) {
      digits.push_back(c);
      if (seen_point) ++fraction;
    } else if (c == '.' && !seen_point) {
      seen_point = true;
    } else {
      break;
    }
    ++pos;
  }
  if (digits.empty()) {
    throw std::invalid_argument("invalid decimal literal: " + text);
  }
  long exponent = 0;
  if (pos < text.size() && (text[pos] == 'e' || text[pos] == 'E')) {
    ++pos;
    size_t exp_start = pos;
    if (pos < text.size() && (text[pos] == '+' || text[pos] == '-')) ++pos;
    size_t digits_start = pos;
    while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) ++pos;
    if (pos == digits_start || pos - digits_start > 6) {
      throw std::invalid_argument("invalid decimal literal: " + text);
    }
    exponent = std::stol(text.substr(exp_start, pos - exp_start));
  }
  if (pos != text.size()) {
    throw std::invalid_argument("invalid decimal literal: " + text);
  }
  DecimalValue out;
  out.unscaled = Integer(digits.c_str());
  long scale = static_cast<long>(fraction) - exponent;
  if (scale < 0) {
    out.unscaled *= boost::multiprecision::pow(Integer(10), static_cast<unsigned>(-scale));
    scale = 0;
  }
  out.scale = static_cast<int>(scale);
  if (negative) out.unscaled = -out.unscaled;
  return out;
}

std::string dump_identity(const Domain& domain, const Value& value) {
  const auto& items = value.as_list();
  const auto& fields = domain.fields();
  if (items.size() != fields.size()) {
    throw std::invalid_argument("identity value does not match its domain");
  }
  std::string out;
  for (size_t i = 0; i < fields.size(); ++i) {
    if (i > 0) out.push_back('.');
    const Domain& field = *fields[i].domain;
    if (field.kind() == DomainKind::Identity) {
      std::string nested = dump_identity(field, items[i]);
      out += field.fields().size() > 1 ? "(" + nested + ")" : nested;
      continue;
    }
    std::string label = field.dump(items[i]);
    bool plain = !label.empty();
    for (char c : label) {
      if (!is_label_char(c)) plain = false;
    }
    out += plain ? label : quote_item(label);
  }
  return out;
}

Value parse_identity(const Domain& domain, const std::string& text, size_t& pos) {
  std::vector<Value> items;
  const auto& fields = domain.fields();
  for (size_t i = 0; i < fields.size(); ++i) {
    skip_spaces(text, pos);
    if (i > 0) {
      if (pos >= text.size() || text[pos] != '.') {
        throw std::invalid_argument("ill-formed locator");
      }
      ++pos;
      skip_spaces(text, pos);
    }
    const Domain& field = *fields[i].domain;
    if (field.kind() == DomainKind::Identity) {
      if (field.fields().size() > 1) {
        if (pos >= text.size() || text[pos] != '(') {
          throw std::invalid_argument("ill-formed locator");
        }
        ++pos;
        items.push_back(parse_identity(field, text, pos));
        skip_spaces(text, pos);
        if (pos >= text.size() || text[pos] != ')') {
          throw std::invalid_argument("ill-formed locator");
        }
        ++pos;
      } else {
        items.push_back(parse_identity(field, text, pos));
      }
      continue;
    }
    std::string label;
    if (pos < text.size() && text[pos] == '\'') {
      label = read_quoted(text, pos);
    } else {
      while (pos < text.size() && is_label_char(text[pos])) {
        label.push_back(text[pos]);
        ++pos;
      }
      if (label.empty()) {
        throw std::invalid_argument("ill-formed locator");
      }
    }
    items.push_back(field.parse(label));
  }
  return Value::list(std::move(items));
}

/// Parses the bracketed item lists shared by list and record values.
std::vector<Value> parse_items(const std::string& text, char open, char close,
                               const std::vector<DomainPtr>& item_domains, bool fixed_arity) {
  size_t pos = 0;
  skip_spaces(text, pos);
  if (pos >= text.size() || text[pos] != open) {
    throw std::invalid_argument(std::string("expected '") + open + "'");
  }
  ++pos;
  std::vector<Value> items;
  skip_spaces(text, pos);
  if (pos < text.size() && text[pos] == close) {
    ++pos;
  } else {
    while (true) {
      skip_spaces(text, pos);
      size_t index = fixed_arity ? items.size() : 0;
      if (index >= item_domains.size()) {
        throw std::invalid_argument("too many items");
      }
      if (text.compare(pos, 4, "null") == 0) {
        items.push_back(Value());
        pos += 4;
      } else if (pos < text.size() && text[pos] == '\'') {
        std::string raw = read_quoted(text, pos);
        items.push_back(item_domains[index]->parse(raw));
      } else {
        throw std::invalid_argument("expected a quoted item or null");
      }
      skip_spaces(text, pos);
      if (pos < text.size() && text[pos] == ',') {
        ++pos;
        continue;
      }
      if (pos < text.size() && text[pos] == close) {
        ++pos;
        break;
      }
      throw std::invalid_argument(std::string("expected ',' or '") + close + "'");
    }
  }
  skip_spaces(text, pos);
  if (pos != text.size()) {
    throw std::invalid_argument("unexpected trailing input");
  }
  if (fixed_arity && items.size() != item_domains.size()) {
    throw std::invalid_argument("wrong number of record fields");
  }
  return items;
}

std::string dump_items(const std::vector<Value>& items, char open, char close,
                       const std::vector<DomainPtr>& item_domains, bool fixed_arity) {
  std::string out(1, open);
  for (size_t i = 0; i < items.size(); ++i) {
    if (i > 0) out += ", ";
    if (items[i].is_null()) {
      out += "null";
      continue;
    }
    const DomainPtr& domain = item_domains[fixed_arity ? i : 0];
    out += quote_item(domain->dump(items[i]));
  }
  out.push_back(close);
  return out;
}

const char* kind_name(DomainKind kind) {
  switch (kind) {
    case DomainKind::Void: return "void";
    case DomainKind::Untyped: return "untyped";
    case DomainKind::Boolean: return "boolean";
    case DomainKind::Integer: return "integer";
    case DomainKind::Float: return "float";
    case DomainKind::Decimal: return "decimal";
    case DomainKind::Text: return "text";
    case DomainKind::Enum: return "enum";
    case DomainKind::Date: return "date";
    case DomainKind::Time: return "time";
    case DomainKind::DateTime: return "datetime";
    case DomainKind::List: return "list";
    case DomainKind::Record: return "record";
    case DomainKind::Identity: return "identity";
    case DomainKind::Opaque: return "opaque";
    case DomainKind::Entity: return "entity";
  }
  return "unknown";
}

}  // namespace

Value Value::boolean(bool value) { return Value(Storage(std::in_place_type<bool>, value)); }
Value Value::integer(Integer value) {
  return Value(Storage(std::in_place_type<Integer>, std::move(value)));
}
Value Value::floating(double value) { return Value(Storage(std::in_place_type<double>, value)); }
Value Value::decimal(DecimalValue value) {
  return Value(Storage(std::in_place_type<DecimalValue>, std::move(value)));
}
Value Value::text(std::string value) {
  return Value(Storage(std::in_place_type<std::string>, std::move(value)));
}
Value Value::date(DateValue value) { return Value(Storage(std::in_place_type<DateValue>, value)); }
Value Value::time(TimeValue value) { return Value(Storage(std::in_place_type<TimeValue>, value)); }
Value Value::datetime(DateTimeValue value) {
  return Value(Storage(std::in_place_type<DateTimeValue>, value));
}
Value Value::list(std::vector<Value> items) {
  return Value(Storage(std::make_shared<const std::vector<Value>>(std::move(items))));
}

Value::Kind Value::kind() const {
  return static_cast<Kind>(data_.index());
}

bool Value::as_bool() const { return std::get<bool>(data_); }
const Integer& Value::as_integer() const { return std::get<Integer>(data_); }
double Value::as_float() const { return std::get<double>(data_); }
const DecimalValue& Value::as_decimal() const { return std::get<DecimalValue>(data_); }
const std::string& Value::as_text() const { return std::get<std::string>(data_); }
const DateValue& Value::as_date() const { return std::get<DateValue>(data_); }
const TimeValue& Value::as_time() const { return std::get<TimeValue>(data_); }
const DateTimeValue& Value::as_datetime() const { return std::get<DateTimeValue>(data_); }
const std::vector<Value>& Value::as_list() const {
  return *std::get<std::shared_ptr<const std::vector<Value>>>(data_);
}

bool Value::operator==(const Value& other) const {
  if (kind() != other.kind()) return false;
  switch (kind()) {
    case Kind::Null: return true;
    case Kind::Boolean: return as_bool() == other.as_bool();
    case Kind::Integer: return as_integer() == other.as_integer();
    case Kind::Float: return as_float() == other.as_float();
    case Kind::Decimal: {
      DecimalValue a = normalize(as_decimal());
      DecimalValue b = normalize(other.as_decimal());
      return a.scale == b.scale && a.unscaled == b.unscaled;
    }
    case Kind::Text: return as_text() == other.as_text();
    case Kind::Date: {
      const auto& a = as_date();
      const auto& b = other.as_date();
      return a.year == b.year && a.month == b.month && a.day == b.day;
    }
    case Kind::Time: {
      const auto& a = as_time();
      const auto& b = other.as_time();
      return a.hour == b.hour && a.minute == b.minute && a.second == b.second &&
             a.microsecond == b.microsecond;
    }
    case Kind::DateTime: {
      Value da = Value::date(as_datetime().date);
      Value db = Value::date(other.as_datetime().date);
      Value ta = Value::time(as_datetime().time);
      Value tb = Value::time(other.as_datetime().time);
      return da == db && ta == tb;
    }
    case Kind::List: {
      const auto& a = as_list();
      const auto& b = other.as_list();
      if (a.size() != b.size()) return false;
      for (size_t i = 0; i < a.size(); ++i) {
        if (a[i] != b[i]) return false;
      }
      return true;
    }
  }
  return false;
}

size_t Value::hash() const {
  size_t seed = static_cast<size_t>(kind());
  switch (kind()) {
    case Kind::Null: return seed;
    case Kind::Boolean: return hash_combine(seed, as_bool() ? 1 : 2);
    case Kind::Integer: return hash_combine(seed, hash_integer(as_integer()));
    case Kind::Float: return hash_combine(seed, std::hash<double>()(as_float()));
    case Kind::Decimal: {
      DecimalValue n = normalize(as_decimal());
      return hash_combine(hash_combine(seed, hash_integer(n.unscaled)), static_cast<size_t>(n.scale));
    }
    case Kind::Text: return hash_combine(seed, std::hash<std::string>()(as_text()));
    case Kind::Date: return hash_combine(seed, std::hash<std::string>()(dump_date(as_date())));
    case Kind::Time: return hash_combine(seed, std::hash<std::string>()(dump_time(as_time())));
    case Kind::DateTime:
      return hash_combine(seed, std::hash<std::string>()(dump_date(as_datetime().date) + " " +
                                                         dump_time(as_datetime().time)));
    case Kind::List:
      for (const auto& item : as_list()) {
        seed = hash_combine(seed, item.hash());
      }
      return seed;
  }
  return seed;
}

std::shared_ptr<Domain> Domain::allocate(DomainKind kind) {
  return std::make_shared<Domain>(Key(), kind);
}

DomainPtr Domain::void_type() {
  static const DomainPtr instance(allocate(DomainKind::Void));
  return instance;
}

DomainPtr Domain::untyped() {
  static const DomainPtr instance(allocate(DomainKind::Untyped));
  return instance;
}

DomainPtr Domain::boolean() {
  static const DomainPtr instance(allocate(DomainKind::Boolean));
  return instance;
}

DomainPtr Domain::integer() {
  static const DomainPtr instance(allocate(DomainKind::Integer));
  return instance;
}

DomainPtr Domain::floating() {
  static const DomainPtr instance(allocate(DomainKind::Float));
  return instance;
}

DomainPtr Domain::decimal() {
  static const DomainPtr instance(allocate(DomainKind::Decimal));
  return instance;
}

DomainPtr Domain::text() {
  static const DomainPtr instance(allocate(DomainKind::Text));
  return instance;
}

DomainPtr Domain::date() {
  static const DomainPtr instance(allocate(DomainKind::Date));
  return instance;
}

DomainPtr Domain::time() {
  static const DomainPtr instance(allocate(DomainKind::Time));
  return instance;
}

DomainPtr Domain::datetime() {
  static const DomainPtr instance(allocate(DomainKind::DateTime));
  return instance;
}

DomainPtr Domain::enumeration(std::vector<std::string> labels) {
  std::shared_ptr<Domain> domain(allocate(DomainKind::Enum));
  domain->labels_ = std::move(labels);
  return domain;
}

DomainPtr Domain::list(DomainPtr item) {
  std::shared_ptr<Domain> domain(allocate(DomainKind::List));
  domain->item_ = std::move(item);
  return domain;
}

DomainPtr Domain::record(std::vector<DomainField> fields) {
  std::shared_ptr<Domain> domain(allocate(DomainKind::Record));
  domain->fields_ = std::move(fields);
  return domain;
}

DomainPtr Domain::identity(std::vector<DomainPtr> fields) {
  std::shared_ptr<Domain> domain(allocate(DomainKind::Identity));
  for (auto& field : fields) {
    domain->fields_.push_back(DomainField{std::string(), std::move(field)});
  }
  return domain;
}

DomainPtr Domain::opaque(std::string name) {
  std::shared_ptr<Domain> domain(allocate(DomainKind::Opaque));
  domain->name_ = std::move(name);
  return domain;
}

DomainPtr Domain::entity(std::string name) {
  std::shared_ptr<Domain> domain(allocate(DomainKind::Entity));
  domain->name_ = std::move(name);
  return domain;
}

bool Domain::is_numeric() const {
  return kind_ == DomainKind::Integer || kind_ == DomainKind::Float ||
         kind_ == DomainKind::Decimal;
}

Value Domain::parse(const std::string& text) const {
  switch (kind_) {
    case DomainKind::Void:
    case DomainKind::Entity:
      throw std::invalid_argument(std::string("a ") + kind_name(kind_) +
                                  " value cannot be written as a literal");
    case DomainKind::Untyped:
    case DomainKind::Text:
    case DomainKind::Opaque:
      return Value::text(text);
    case DomainKind::Boolean:
      if (text == "true") return Value::boolean(true);
      if (text == "false") return Value::boolean(false);
      throw std::invalid_argument("invalid Boolean literal: expected 'true' or 'false'; got '" +
                                  text + "'");
    case DomainKind::Integer: {
      size_t pos = 0;
      bool negative = false;
      if (pos < text.size() && (text[pos] == '+' || text[pos] == '-')) {
        negative = text[pos] == '-';
        ++pos;
      }
      if (pos == text.size()) {
        throw std::invalid_argument("invalid integer literal: expected an integer in a decimal format; got '" +
                                    text + "'");
      }
      for (size_t i = pos; i < text.size(); ++i) {
        if (!std::isdigit(static_cast<unsigned char>(text[i]))) {
          throw std::invalid_argument("invalid integer literal: expected an integer in a decimal format; got '" +
                                      text + "'");
        }
      }
      Integer value(text.substr(pos).c_str());
      return Value::integer(negative ? Integer(-value) : value);
    }
    case DomainKind::Float: {
      if (text.empty() || std::isspace(static_cast<unsigned char>(text[0]))) {
        throw std::invalid_argument("invalid float literal: '" + text + "'");
      }
      char* end = nullptr;
      double value = std::strtod(text.c_str(), &end);
      if (end != text.c_str() + text.size()) {
        throw std::invalid_argument("invalid float literal: '" + text + "'");
      }
      if (!std::isfinite(value)) {
        throw std::invalid_argument("invalid float literal: '" + text + "'");
      }
      return Value::floating(value);
    }
    case DomainKind::Decimal:
      return Value::decimal(parse_decimal(text));
    case DomainKind::Enum:
      for (const auto& label : labels_) {
        if (label == text) return Value::text(text);
      }
      throw std::invalid_argument("invalid enum literal: got '" + text + "'");
    case DomainKind::Date: {
      size_t pos = 0;
      skip_spaces(text, pos);
      DateValue date;
      if (!parse_date_part(text, pos, date)) {
        throw std::invalid_argument("invalid date literal: expected a valid date in a 'YYYY-MM-DD' format; got '" +
                                    text + "'");
      }
      skip_spaces(text, pos);
      if (pos != text.size()) {
        throw std::invalid_argument("invalid date literal: unexpected trailing input");
      }
      return Value::date(date);
    }
    case DomainKind::Time: {
      size_t pos = 0;
      skip_spaces(text, pos);
      TimeValue time;
      if (!parse_time_part(text, pos, time)) {
        throw std::invalid_argument("invalid time literal: expected a valid time in a 'HH:MM:SS.SSSSSS' format; got '" +
                                    text + "'");
      }
      skip_spaces(text, pos);
      if (pos != text.size()) {
        throw std::invalid_argument("invalid time literal: unexpected trailing input");
      }
      return Value::time(time);
    }
    case DomainKind::DateTime: {
      size_t pos = 0;
      skip_spaces(text, pos);
      DateTimeValue value;
      if (!parse_date_part(text, pos, value.date)) {
        throw std::invalid_argument("invalid datetime literal: expected 'YYYY-MM-DD HH:MM:SS'; got '" +
                                    text + "'");
      }
      if (pos < text.size() && (text[pos] == ' ' || text[pos] == 'T')) {
        ++pos;
        skip_spaces(text, pos);
        if (!parse_time_part(text, pos, value.time)) {
          throw std::invalid_argument("invalid datetime literal: malformed time part in '" + text + "'");
        }
      }
      skip_spaces(text, pos);
      if (pos != text.size()) {
        throw std::invalid_argument("invalid datetime literal: unexpected trailing input");
      }
      return Value::datetime(value);
    }
    case DomainKind::List:
      return Value::list(parse_items(text, '[', ']', {item_}, false));
    case DomainKind::Record: {
      std::vector<DomainPtr> domains;
      for (const auto& field : fields_) domains.push_back(field.domain);
      return Value::list(parse_items(text, '(', ')', domains, true));
    }
    case DomainKind::Identity: {
      size_t pos = 0;
      Value value = parse_identity(*this, text, pos);
      skip_spaces(text, pos);
      if (pos != text.size()) {
        throw std::invalid_argument("ill-formed locator");
      }
      return value;
    }
  }
  throw std::invalid_argument("unsupported domain");
}

std::string Domain::dump(const Value& value) const {
  if (value.is_null()) {
    throw std::invalid_argument("NULL has no text form");
  }
  switch (kind_) {
    case DomainKind::Void:
    case DomainKind::Entity:
      throw std::invalid_argument(std::string("a ") + kind_name(kind_) + " value has no text form");
    case DomainKind::Untyped:
    case DomainKind::Text:
    case DomainKind::Opaque:
    case DomainKind::Enum:
      return value.as_text();
    case DomainKind::Boolean:
      return value.as_bool() ? "true" : "false";
    case DomainKind::Integer:
      return value.as_integer().str();
    case DomainKind::Float:
      return dump_float(value.as_float());
    case DomainKind::Decimal:
      return dump_decimal(value.as_decimal());
    case DomainKind::Date:
      return dump_date(value.as_date());
    case DomainKind::Time:
      return dump_time(value.as_time());
    case DomainKind::DateTime:
      return dump_date(value.as_datetime().date) + " " + dump_time(value.as_datetime().time);
    case DomainKind::List:
      return dump_items(value.as_list(), '[', ']', {item_}, false);
    case DomainKind::Record: {
      std::vector<DomainPtr> domains;
      for (const auto& field : fields_) domains.push_back(field.domain);
      if (value.as_list().size() != domains.size()) {
        throw std::invalid_argument("record value does not match its domain");
      }
      return dump_items(value.as_list(), '(', ')', domains, true);
    }
    case DomainKind::Identity:
      return dump_identity(*this, value);
  }
  throw std::invalid_argument("unsupported domain");
}

bool Domain::equals(const Domain& other) const {
  if (this == &other) return true;
  if (kind_ != other.kind_) return false;
  if (labels_ != other.labels_ || name_ != other.name_) return false;
  if (!same_domain(item_, other.item_)) return false;
  if (fields_.size() != other.fields_.size()) return false;
  for (size_t i = 0; i < fields_.size(); ++i) {
    if (fields_[i].name != other.fields_[i].name) return false;
    if (!same_domain(fields_[i].domain, other.fields_[i].domain)) return false;
  }
  return true;
}

size_t Domain::hash() const {
  size_t seed = static_cast<size_t>(kind_);
  for (const auto& label : labels_) {
    seed = hash_combine(seed, std::hash<std::string>()(label));
  }
  seed = hash_combine(seed, std::hash<std::string>()(name_));
  if (item_) seed = hash_combine(seed, item_->hash());
  for (const auto& field : fields_) {
    seed = hash_combine(seed, std::hash<std::string>()(field.name));
    seed = hash_combine(seed, field.domain->hash());
  }
  return seed;
}

std::string Domain::to_string() const {
  switch (kind_) {
    case DomainKind::List:
      return "[" + item_->to_string() + "]";
    case DomainKind::Record: {
      std::string out = "{";
      for (size_t i = 0; i < fields_.size(); ++i) {
        if (i > 0) out += ", ";
        out += fields_[i].name.empty() ? fields_[i].domain->to_string()
                                       : fields_[i].name + ": " + fields_[i].domain->to_string();
      }
      return out + "}";
    }
    case DomainKind::Identity: {
      std::string out = "[";
      for (size_t i = 0; i < fields_.size(); ++i) {
        if (i > 0) out += ".";
        out += fields_[i].domain->to_string();
      }
      return out + "]";
    }
    case DomainKind::Opaque:
    case DomainKind::Entity:
      return name_.empty() ? kind_name(kind_) : std::string(kind_name(kind_)) + "(" + name_ + ")";
    default:
      return kind_name(kind_);
  }
}

bool same_domain(const DomainPtr& left, const DomainPtr& right) {
  if (left == right) return true;
  if (!left || !right) return false;
  return left->equals(*right);
}

DomainPtr coerce(const DomainPtr& left, const DomainPtr& right) {
  if (!left || !right) return nullptr;
  if (same_domain(left, right)) return left;
  if (left->kind() == DomainKind::Untyped) return right;
  if (right->kind() == DomainKind::Untyped) return left;
  auto rank = [](DomainKind kind) {
    switch (kind) {
      case DomainKind::Integer: return 1;
      case DomainKind::Decimal: return 2;
      case DomainKind::Float: return 3;
      default: return 0;
    }
  };
  int lrank = rank(left->kind());
  int rrank = rank(right->kind());
  if (lrank > 0 && rrank > 0) {
    return lrank >= rrank ? left : right;
  }
  bool left_text = left->kind() == DomainKind::Text || left->kind() == DomainKind::Enum;
  bool right_text = right->kind() == DomainKind::Text || right->kind() == DomainKind::Enum;
  if (left_text && right_text) return Domain::text();
  return nullptr;
}

}  // namespace navsql
