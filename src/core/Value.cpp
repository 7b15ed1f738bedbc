/* @file Value.cpp
 * @brief helpers over the Value variant
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cmath>
#include <cstdio>

// TrialFlow headers
#include "core/Value.hpp"

namespace trialflow::core {

  bool isTruthy(const Value& v) {
    if (const auto* b = std::get_if<bool>(&v))
      return *b;
    if (const auto* d = std::get_if<double>(&v))
      return *d != 0.0;
    return !std::get<std::string>(v).empty();
  }

  bool asNumber(const Value& v, double& out) {
    if (const auto* d = std::get_if<double>(&v)) {
      out = *d;
      return true;
    }
    if (const auto* b = std::get_if<bool>(&v)) {
      out = *b ? 1.0 : 0.0;
      return true;
    }
    return false;
  }

  bool isIntegral(const Value& v) {
    const auto* d = std::get_if<double>(&v);
    return d && std::isfinite(*d) && std::floor(*d) == *d;
  }

  std::string toDisplayString(const Value& v) {
    if (const auto* s = std::get_if<std::string>(&v))
      return *s;
    if (const auto* b = std::get_if<bool>(&v))
      return *b ? "true" : "false";

    double d = std::get<double>(v);
    if (isIntegral(v) && std::fabs(d) < 1e15) {
      char buf[32];
      std::snprintf(buf, sizeof(buf), "%lld", static_cast<long long>(d));
      return buf;
    }
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.10g", d);
    return buf;
  }

  bool looselyEqual(const Value& a, const Value& b) {
    double x = 0.0;
    double y = 0.0;
    if (asNumber(a, x) && asNumber(b, y))
      return x == y;
    const auto* sa = std::get_if<std::string>(&a);
    const auto* sb = std::get_if<std::string>(&b);
    return sa && sb && *sa == *sb;
  }

} // namespace trialflow::core
