#pragma once
/** @file  Value.hpp
 *  @brief Runtime value held by experiment variables and produced by expressions.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <string>
#include <variant>

namespace trialflow::core {

  /// Number, boolean or string. Integers are numbers with no fractional part.
  using Value = std::variant<double, bool, std::string>;

  enum class ValueType { Number, Boolean, String };

  inline ValueType typeOf(const Value& v) { return static_cast<ValueType>(v.index()); }

  inline const char* toString(ValueType t) {
    switch (t) {
    case ValueType::Number:
      return "number";
    case ValueType::Boolean:
      return "boolean";
    case ValueType::String:
      return "string";
    default:
      return "unknown";
    }
  }

  bool isTruthy(const Value& v);

  /// Numeric view of a value; booleans map to 0/1. Returns false for strings.
  bool asNumber(const Value& v, double& out);

  /// True if \p v is a number with no fractional part.
  bool isIntegral(const Value& v);

  /// Human-readable rendering used by logs and `str()`.
  std::string toDisplayString(const Value& v);

  /// Loose equality: numbers and booleans compare numerically, strings by content.
  bool looselyEqual(const Value& a, const Value& b);

} // namespace trialflow::core
