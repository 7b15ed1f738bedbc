#pragma once
/** @file  ScriptExecutor.hpp
 *  @brief Assignment scripts run by code components (`x = expr; n += 1`).
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <string>
#include <vector>

#include "core/ExpressionEvaluator.hpp"

namespace trialflow::core {

  class VariableEnvironment;

  /// One `target op expr` line of a script.
  struct Statement {
    enum class Op { Assign, Add, Subtract };

    std::string target;
    Op op{ Op::Assign };
    CompiledExpression expr;
  };

  /// Compiled statement list; empty scripts are valid and do nothing.
  struct CompiledScript {
    std::string source;
    std::vector<Statement> statements;

    bool empty() const noexcept { return statements.empty(); }
  };

  /**
 * @class ScriptExecutor
 * @brief Compiles and runs statement scripts against the environment.
 *
 *  * Statements are separated by `;` or newlines; `#` starts a comment.
 *  * Expressions stay pure; only the executor writes to the environment.
 *  * `+=`/`-=` on an unbound target raise `UnresolvedNameError`.
 */
  class ScriptExecutor {
  public:
    /// Throws `EvaluationError` on malformed statements.
    static CompiledScript compile(const std::string& source);

    static void execute(const CompiledScript& script, VariableEnvironment& env);
  };

} // namespace trialflow::core
