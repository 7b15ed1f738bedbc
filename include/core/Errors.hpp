#pragma once
/** @file  Errors.hpp
 *  @brief Error taxonomy raised while loading and running a flow.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <stdexcept>
#include <string>

namespace trialflow::core {

  /**
 * @class FlowError
 * @brief Common base so the coordinator can report every engine fault in one place.
 *
 *  * All subclasses are deterministic logic/config faults: stop and report,
 *    never retry.
 */
  class FlowError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
  };

  /// Malformed flow structure, bad repetition count, unmatched loop brackets.
  class ConfigurationError : public FlowError {
  public:
    using FlowError::FlowError;
  };

  /// An expression referenced a variable that is not bound (yet).
  class UnresolvedNameError : public FlowError {
  public:
    explicit UnresolvedNameError(std::string name)
        : FlowError("unresolved name '" + name + "'"), name_(std::move(name)) {}

    const std::string& name() const noexcept { return name_; }

  private:
    std::string name_;
  };

  /// Malformed expression syntax or an expression that cannot be evaluated.
  class EvaluationError : public FlowError {
  public:
    EvaluationError(std::string expression, const std::string& reason,
                    std::string component = {})
        : FlowError(format(expression, reason, component)), expression_(std::move(expression)),
          reason_(reason), component_(std::move(component)) {}

    const std::string& expression() const noexcept { return expression_; }
    const std::string& reason() const noexcept { return reason_; }
    const std::string& component() const noexcept { return component_; }

    /// Copy of this error tagged with the component that owned the expression.
    EvaluationError withComponent(const std::string& component) const {
      return EvaluationError(expression_, reason_, component);
    }

  private:
    static std::string format(const std::string& expr, const std::string& reason,
                              const std::string& component) {
      std::string msg = "cannot evaluate '" + expr + "': " + reason;
      if (!component.empty())
        msg += " (component '" + component + "')";
      return msg;
    }

    std::string expression_;
    std::string reason_;
    std::string component_;
  };

} // namespace trialflow::core
