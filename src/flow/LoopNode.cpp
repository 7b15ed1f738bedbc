/* @file LoopNode.cpp
 * @brief repetition resolution and the loop iteration state-machine
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <numeric>
#include <stdexcept>

// TrialFlow headers
#include "core/Errors.hpp"
#include "flow/LoopNode.hpp"

namespace trialflow::flow {

  std::size_t repetitionsFrom(const core::Value& value, const LoopNode& loop) {
    std::size_t count = 0;
    if (const auto* b = std::get_if<bool>(&value)) {
      count = *b ? 1 : 0;
    } else if (const auto* d = std::get_if<double>(&value);
               d && core::isIntegral(value) && *d >= 0 &&
               *d <= static_cast<double>(kMaxRepetitions)) {
      count = static_cast<std::size_t>(*d);
    } else {
      throw core::ConfigurationError("repetition count of loop '" + loop.name +
                                     "' must be an integer in [0, " +
                                     std::to_string(kMaxRepetitions) + "], got " +
                                     core::toString(core::typeOf(value)) + " '" +
                                     core::toDisplayString(value) + "'");
    }

    if (loop.kind == LoopKind::BranchGuard && count > 1)
      throw core::ConfigurationError("branch guard '" + loop.name + "' must resolve to 0 or 1, got " +
                                     std::to_string(count));
    return count;
  }

  std::size_t resolveRepetitions(const LoopNode& loop, const core::VariableEnvironment& env) {
    if (loop.nReps.empty())
      throw core::ConfigurationError("loop '" + loop.name + "' has no repetition expression");
    core::Value v;
    try {
      v = core::ExpressionEvaluator::evaluate(loop.nReps, env);
    } catch (const core::EvaluationError& e) {
      throw e.withComponent(loop.name);
    }
    return repetitionsFrom(v, loop);
  }

  BranchGuard::BranchGuard(const LoopNode& loop) : loop_(loop) {
    if (loop.kind != LoopKind::BranchGuard)
      throw std::invalid_argument("[BranchGuard] loop '" + loop.name + "' is not a guard");
  }

  const char* toString(LoopActivation::State s) {
    switch (s) {
    case LoopActivation::State::Pending:
      return "pending";
    case LoopActivation::State::Entering:
      return "entering";
    case LoopActivation::State::Iterating:
      return "iterating";
    case LoopActivation::State::Exited:
      return "exited";
    default:
      return "unknown";
    }
  }

  LoopActivation::LoopActivation(const LoopNode& loop, core::VariableEnvironment& env,
                                 std::mt19937_64& rng)
      : loop_(loop), env_(env), rng_(rng) {}

  std::size_t LoopActivation::enter() {
    if (state_ != State::Pending)
      throw std::logic_error("[LoopActivation] loop '" + loop_.name + "' entered twice");

    state_ = State::Entering;
    count_ = resolveRepetitions(loop_, env_);
    position_ = 0;
    if (count_ == 0) {
      state_ = State::Exited;
      return 0;
    }

    order_.clear();
    if (loop_.order == LoopOrder::Random) {
      order_.resize(count_);
      std::iota(order_.begin(), order_.end(), std::size_t{ 0 });
      if (loop_.seed) {
        std::mt19937_64 seeded(*loop_.seed);
        std::shuffle(order_.begin(), order_.end(), seeded);
      } else {
        std::shuffle(order_.begin(), order_.end(), rng_);
      }
    }
    return count_;
  }

  bool LoopActivation::next() {
    if (state_ == State::Pending)
      throw std::logic_error("[LoopActivation] next() before enter() on '" + loop_.name + "'");
    if (state_ == State::Exited)
      return false;

    row_.clear();
    if ((position_ > 0 && finishRequested()) || position_ >= count_) {
      exit();
      return false;
    }

    const auto n = static_cast<double>(indexAt(position_));
    const auto total = static_cast<double>(count_);
    const auto remaining = static_cast<double>(count_ - position_ - 1);
    const auto rep = static_cast<double>(position_);

    if (counters_.empty()) {
      counters_.push_back(env_.bind(key("thisN"), n));
      counters_.push_back(env_.bind(key("nTotal"), total));
      counters_.push_back(env_.bind(key("nRemaining"), remaining));
      counters_.push_back(env_.bind(key("thisRepN"), rep));
      counters_.push_back(env_.bind(key("finished"), false));
    } else {
      counters_[0].assign(n);
      counters_[1].assign(total);
      counters_[2].assign(remaining);
      counters_[3].assign(rep);
    }

    bindRow(indexAt(position_));
    ++position_;
    state_ = State::Iterating;
    return true;
  }

  void LoopActivation::exit() {
    row_.clear();
    while (!counters_.empty())
      counters_.pop_back(); // release in reverse publication order
    state_ = State::Exited;
  }

  std::size_t LoopActivation::thisN() const {
    if (position_ == 0)
      throw std::logic_error("[LoopActivation] loop '" + loop_.name + "' has no current iteration");
    return indexAt(position_ - 1);
  }

  bool LoopActivation::finishRequested() const {
    const core::Value* v = env_.find(key("finished"));
    return v && core::isTruthy(*v);
  }

  void LoopActivation::bindRow(std::size_t index) {
    if (!loop_.isTrials || !loop_.conditions || loop_.conditions->empty())
      return;

    const std::size_t rowIndex = index % loop_.conditions->size();
    row_.push_back(env_.bind(key("thisIndex"), static_cast<double>(rowIndex)));
    for (const auto& [name, value] : (*loop_.conditions)[rowIndex])
      row_.push_back(env_.bind(name, value));
  }

} // namespace trialflow::flow
