/* @file ScriptExecutor.cpp
 * @brief statement splitting and execution for code components
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cctype>

// TrialFlow headers
#include "core/Errors.hpp"
#include "core/ScriptExecutor.hpp"
#include "core/VariableEnvironment.hpp"

namespace trialflow::core {

  namespace {

    std::string trim(const std::string& s) {
      std::size_t b = 0;
      std::size_t e = s.size();
      while (b < e && std::isspace(static_cast<unsigned char>(s[b])))
        ++b;
      while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1])))
        --e;
      return s.substr(b, e - b);
    }

    /// Split on `;`/newline outside quotes and drop `#` comments.
    std::vector<std::string> splitStatements(const std::string& src) {
      std::vector<std::string> out;
      std::string cur;
      char quote = 0;
      bool comment = false;

      for (std::size_t i = 0; i < src.size(); ++i) {
        char c = src[i];
        if (comment) {
          if (c == '\n') {
            comment = false;
            out.push_back(cur);
            cur.clear();
          }
          continue;
        }
        if (quote) {
          cur += c;
          if (c == '\\' && i + 1 < src.size())
            cur += src[++i];
          else if (c == quote)
            quote = 0;
          continue;
        }
        if (c == '\'' || c == '"') {
          quote = c;
          cur += c;
        } else if (c == '#') {
          comment = true;
        } else if (c == ';' || c == '\n') {
          out.push_back(cur);
          cur.clear();
        } else {
          cur += c;
        }
      }
      out.push_back(cur);
      return out;
    }

    Statement parseStatement(const std::string& line, const std::string& source) {
      std::size_t i = 0;
      while (i < line.size() && (std::isalnum(static_cast<unsigned char>(line[i])) ||
                                 line[i] == '_' || line[i] == '.'))
        ++i;

      Statement st;
      st.target = line.substr(0, i);
      if (!ExpressionEvaluator::isValidName(st.target))
        throw EvaluationError(source, "invalid assignment target in '" + line + "'");

      while (i < line.size() && std::isspace(static_cast<unsigned char>(line[i])))
        ++i;

      if (line.compare(i, 2, "+=") == 0) {
        st.op = Statement::Op::Add;
        i += 2;
      } else if (line.compare(i, 2, "-=") == 0) {
        st.op = Statement::Op::Subtract;
        i += 2;
      } else if (i < line.size() && line[i] == '=' && line.compare(i, 2, "==") != 0) {
        st.op = Statement::Op::Assign;
        i += 1;
      } else {
        throw EvaluationError(source, "expected assignment in '" + line + "'");
      }

      std::string rhs = trim(line.substr(i));
      if (rhs.empty())
        throw EvaluationError(source, "missing value in '" + line + "'");
      st.expr = ExpressionEvaluator::compile(rhs);
      return st;
    }

  } // namespace

  CompiledScript ScriptExecutor::compile(const std::string& source) {
    CompiledScript script;
    script.source = source;
    for (const auto& raw : splitStatements(source)) {
      std::string line = trim(raw);
      if (line.empty())
        continue;
      script.statements.push_back(parseStatement(line, source));
    }
    return script;
  }

  void ScriptExecutor::execute(const CompiledScript& script, VariableEnvironment& env) {
    for (const auto& st : script.statements) {
      Value rhs = ExpressionEvaluator::evaluate(st.expr, env);
      if (st.op == Statement::Op::Assign) {
        env.set(st.target, std::move(rhs));
        continue;
      }

      const Value& current = env.get(st.target);
      if (st.op == Statement::Op::Add) {
        const auto* a = std::get_if<std::string>(&current);
        const auto* b = std::get_if<std::string>(&rhs);
        if (a && b) {
          env.set(st.target, *a + *b);
          continue;
        }
      }

      double x = 0.0;
      double y = 0.0;
      if (!asNumber(current, x) || !asNumber(rhs, y))
        throw EvaluationError(script.source, "'" + st.target + "' cannot be updated in place: " +
                                                 "operands must both be numbers or strings");
      env.set(st.target, st.op == Statement::Op::Add ? x + y : x - y);
    }
  }

} // namespace trialflow::core
