#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <variant>
#include <vector>

#include <boost/multiprecision/cpp_int.hpp>

namespace navsql {

using Integer = boost::multiprecision::cpp_int;

/// Exact decimal number: unscaled * 10^-scale with scale >= 0.
struct DecimalValue {
  Integer unscaled;
  int scale = 0;
};

struct DateValue {
  int year = 1;
  int month = 1;
  int day = 1;
};

struct TimeValue {
  int hour = 0;
  int minute = 0;
  int second = 0;
  int microsecond = 0;
};

struct DateTimeValue {
  DateValue date;
  TimeValue time;
};

/// Holds one scalar or composite value produced by a Domain.
/// MUST compare by value (decimals numerically) and MUST treat NULL as equal only to NULL.
/// Inputs are the typed factories; side effects are none.
class Value {
 public:
  enum class Kind { Null, Boolean, Integer, Float, Decimal, Text, Date, Time, DateTime, List };

  Value() = default;
  static Value boolean(bool value);
  static Value integer(Integer value);
  static Value floating(double value);
  static Value decimal(DecimalValue value);
  static Value text(std::string value);
  static Value date(DateValue value);
  static Value time(TimeValue value);
  static Value datetime(DateTimeValue value);
  static Value list(std::vector<Value> items);

  Kind kind() const;
  bool is_null() const { return kind() == Kind::Null; }

  bool as_bool() const;
  const Integer& as_integer() const;
  double as_float() const;
  const DecimalValue& as_decimal() const;
  const std::string& as_text() const;
  const DateValue& as_date() const;
  const TimeValue& as_time() const;
  const DateTimeValue& as_datetime() const;
  const std::vector<Value>& as_list() const;

  bool operator==(const Value& other) const;
  bool operator!=(const Value& other) const { return !(*this == other); }
  size_t hash() const;

 private:
  using Storage = std::variant<std::monostate, bool, Integer, double, DecimalValue, std::string,
                               DateValue, TimeValue, DateTimeValue,
                               std::shared_ptr<const std::vector<Value>>>;
  explicit Value(Storage data) : data_(std::move(data)) {}

  Storage data_;
};

enum class DomainKind {
  Void,
  Untyped,
  Boolean,
  Integer,
  Float,
  Decimal,
  Text,
  Enum,
  Date,
  Time,
  DateTime,
  List,
  Record,
  Identity,
  Opaque,
  Entity
};

class Domain;
using DomainPtr = std::shared_ptr<const Domain>;

struct DomainField {
  std::string name;
  DomainPtr domain;
};

/// Describes a scalar or composite type and converts values to and from text.
/// MUST be immutable and MUST compare structurally so equal shapes are interchangeable.
/// Inputs are the factory parameters; parse/dump throw std::invalid_argument on bad input.
class Domain {
 public:
  static DomainPtr void_type();
  static DomainPtr untyped();
  static DomainPtr boolean();
  static DomainPtr integer();
  static DomainPtr floating();
  static DomainPtr decimal();
  static DomainPtr text();
  static DomainPtr enumeration(std::vector<std::string> labels);
  static DomainPtr date();
  static DomainPtr time();
  static DomainPtr datetime();
  static DomainPtr list(DomainPtr item);
  static DomainPtr record(std::vector<DomainField> fields);
  static DomainPtr identity(std::vector<DomainPtr> fields);
  static DomainPtr opaque(std::string name);
  static DomainPtr entity(std::string name);

  DomainKind kind() const { return kind_; }
  const std::vector<std::string>& labels() const { return labels_; }
  const DomainPtr& item() const { return item_; }
  const std::vector<DomainField>& fields() const { return fields_; }
  const std::string& name() const { return name_; }

  bool is_numeric() const;

  /// Converts the text form of a value into a Value of this domain.
  /// MUST reject malformed or out-of-range input with std::invalid_argument.
  /// Inputs are the text form; outputs are non-null values.
  Value parse(const std::string& text) const;
  /// Converts a non-null value of this domain into its text form.
  /// MUST satisfy parse(dump(v)) == v for every domain except Opaque.
  /// Inputs are values produced by this domain; outputs are text.
  std::string dump(const Value& value) const;

  bool equals(const Domain& other) const;
  size_t hash() const;
  std::string to_string() const;

  // Public for std::make_shared; only Domain can produce the key.
  struct Key {
   private:
    friend class Domain;
    explicit Key() = default;
  };
  Domain(Key, DomainKind kind) : kind_(kind) {}

 private:
  static std::shared_ptr<Domain> allocate(DomainKind kind);

  DomainKind kind_;
  std::vector<std::string> labels_;
  DomainPtr item_;
  std::vector<DomainField> fields_;
  std::string name_;
};

bool same_domain(const DomainPtr& left, const DomainPtr& right);

/// Finds the common domain two operands can be compared or combined in.
/// MUST return nullptr when no implicit conversion exists.
/// Inputs are two domains; outputs are the coerced domain.
DomainPtr coerce(const DomainPtr& left, const DomainPtr& right);

}  // namespace navsql
