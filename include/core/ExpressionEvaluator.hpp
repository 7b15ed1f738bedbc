#pragma once
/** @file  ExpressionEvaluator.hpp
 *  @brief Parses and evaluates the small expression language used by flows.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <memory>
#include <string>
#include <vector>

#include "core/Value.hpp"

namespace trialflow::core {

  class VariableEnvironment;

  namespace detail {
    struct ExprNode; // defined in ExpressionEvaluator.cpp
  }

  /**
 * @class CompiledExpression
 * @brief Parsed expression tree plus its source text. Cheap to copy (shared tree).
 */
  class CompiledExpression {
  public:
    CompiledExpression() = default;

    const std::string& source() const noexcept { return source_; }
    bool empty() const noexcept { return !root_; }

    /// Every variable name the expression may read, in first-use order.
    const std::vector<std::string>& names() const noexcept { return names_; }

  private:
    friend class ExpressionEvaluator;
    std::string source_;
    std::shared_ptr<const detail::ExprNode> root_;
    std::vector<std::string> names_;
  };

  /**
 * @class ExpressionEvaluator
 * @brief Pure evaluator over a VariableEnvironment.
 *
 *  * Arithmetic `+ - * / %`, comparisons, `and/or/not` (also `&& || !`),
 *    ternary `c ? a : b`, string literals, dotted names such as `trials.thisN`,
 *    and the functions abs, min, max, round, floor, ceil, int, str.
 *  * Throws `EvaluationError` on syntax or type errors and
 *    `UnresolvedNameError` when a name is unbound. Never defaults a value.
 */
  class ExpressionEvaluator {
  public:
    static CompiledExpression compile(const std::string& expr);

    static Value evaluate(const CompiledExpression& expr, const VariableEnvironment& env);

    /// Compile-and-evaluate convenience for one-off expressions.
    static Value evaluate(const std::string& expr, const VariableEnvironment& env);

    /// True if \p name is a valid (optionally dotted) variable name.
    static bool isValidName(const std::string& name);
  };

} // namespace trialflow::core
