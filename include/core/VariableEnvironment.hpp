#pragma once
/** @file  VariableEnvironment.hpp
 *  @brief Named experiment variables shared by components, loops and expressions.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <map>
#include <optional>
#include <string>
#include <unordered_map>

#include "core/Value.hpp"

namespace trialflow::core {

  class VariableEnvironment;

  /**
 * @class ScopedBinding
 * @brief RAII publication of one variable; restores the shadowed value (or
 *        erases the name) on destruction.
 *
 *  * Non-copyable, move-enabled.
 *  * Must not outlive the environment it was created from.
 */
  class ScopedBinding {
  public:
    ScopedBinding() = default;
    ~ScopedBinding() { release(); }

    /// Overwrite the bound value without giving up the binding.
    void assign(Value value);

    /// Restore the previous state now instead of at destruction.
    void release();

    bool active() const noexcept { return env_ != nullptr; }
    const std::string& name() const noexcept { return name_; }

    //---non-copyable, move-enabled---------------------------------------
    ScopedBinding(const ScopedBinding&) = delete;
    ScopedBinding& operator=(const ScopedBinding&) = delete;
    ScopedBinding(ScopedBinding&& other) noexcept;
    ScopedBinding& operator=(ScopedBinding&& other) noexcept;

  private:
    friend class VariableEnvironment;
    ScopedBinding(VariableEnvironment& env, std::string name, std::optional<Value> previous)
        : env_(&env), name_(std::move(name)), previous_(std::move(previous)) {}

    VariableEnvironment* env_{ nullptr };
    std::string name_;
    std::optional<Value> previous_; ///< shadowed value, nullopt = name was unbound
  };

  /** @class VariableEnvironment
 *  @brief Map of <variable name → Value> scoped to one run.
 *
 *  * Single execution thread; passed by reference down the call chain.
 *  * Dotted names (`trials.thisN`) are plain keys, no structure implied.
 */
  class VariableEnvironment {
  public:
    VariableEnvironment() = default;
    ~VariableEnvironment() = default;

    void set(const std::string& name, Value value);

    /// Throws `UnresolvedNameError` if \p name is not bound.
    const Value& get(const std::string& name) const;

    /// nullptr if \p name is not bound.
    const Value* find(const std::string& name) const;

    bool contains(const std::string& name) const;
    bool erase(const std::string& name);
    std::size_t size() const noexcept { return values_.size(); }

    /// Publish \p value under \p name until the returned binding is destroyed.
    [[nodiscard]] ScopedBinding bind(const std::string& name, Value value);

    /// Name-ordered copy for summaries and logs.
    std::map<std::string, Value> snapshot() const;

    VariableEnvironment(const VariableEnvironment&) = delete;
    VariableEnvironment& operator=(const VariableEnvironment&) = delete;

  private:
    std::unordered_map<std::string, Value> values_;
  };

} // namespace trialflow::core
