/* @file VariableEnvironment.cpp
 * @brief run-scoped variable store and RAII bindings
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// TrialFlow headers
#include "core/VariableEnvironment.hpp"
#include "core/Errors.hpp"

namespace trialflow::core {

  //---ScopedBinding-----------------------------------------------------

  ScopedBinding::ScopedBinding(ScopedBinding&& other) noexcept
      : env_(other.env_), name_(std::move(other.name_)), previous_(std::move(other.previous_)) {
    other.env_ = nullptr;
  }

  ScopedBinding& ScopedBinding::operator=(ScopedBinding&& other) noexcept {
    if (this != &other) {
      release();
      env_ = other.env_;
      name_ = std::move(other.name_);
      previous_ = std::move(other.previous_);
      other.env_ = nullptr;
    }
    return *this;
  }

  void ScopedBinding::assign(Value value) {
    if (!env_)
      throw std::logic_error("[ScopedBinding] assign on released binding");
    env_->set(name_, std::move(value));
  }

  void ScopedBinding::release() {
    if (!env_)
      return;
    if (previous_)
      env_->set(name_, std::move(*previous_));
    else
      env_->erase(name_);
    env_ = nullptr;
    previous_.reset();
  }

  //---VariableEnvironment-----------------------------------------------

  void VariableEnvironment::set(const std::string& name, Value value) {
    values_.insert_or_assign(name, std::move(value));
  }

  const Value& VariableEnvironment::get(const std::string& name) const {
    auto it = values_.find(name);
    if (it == values_.end())
      throw UnresolvedNameError(name);
    return it->second;
  }

  const Value* VariableEnvironment::find(const std::string& name) const {
    auto it = values_.find(name);
    return it == values_.end() ? nullptr : &it->second;
  }

  bool VariableEnvironment::contains(const std::string& name) const {
    return values_.count(name) != 0;
  }

  bool VariableEnvironment::erase(const std::string& name) { return values_.erase(name) != 0; }

  ScopedBinding VariableEnvironment::bind(const std::string& name, Value value) {
    std::optional<Value> previous;
    if (auto it = values_.find(name); it != values_.end())
      previous = it->second;
    set(name, std::move(value));
    return ScopedBinding(*this, name, std::move(previous));
  }

  std::map<std::string, Value> VariableEnvironment::snapshot() const {
    return { values_.begin(), values_.end() };
  }

} // namespace trialflow::core
