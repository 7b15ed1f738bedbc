#pragma once
/** @file  LoopNode.hpp
 *  @brief Loop definitions, the per-entry iteration state-machine and branch guards.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <cstdint>
#include <map>
#include <optional>
#include <random>
#include <string>
#include <vector>

#include "core/ExpressionEvaluator.hpp"
#include "core/Value.hpp"
#include "core/VariableEnvironment.hpp"

namespace trialflow::flow {

  enum class LoopOrder { Sequential, Random };

  /// Plain repetition vs. a 0/1 branch guard layered over the same loop mechanics.
  enum class LoopKind { Repeat, BranchGuard };

  using ConditionRow = std::map<std::string, core::Value>;
  using ConditionTable = std::vector<ConditionRow>;

  /// Static loop definition, instantiated once per experiment definition.
  struct LoopNode {
    std::string name;
    LoopOrder order{ LoopOrder::Sequential };
    LoopKind kind{ LoopKind::Repeat };
    core::CompiledExpression nReps;
    std::optional<std::uint64_t> seed;
    bool isTrials{ false };
    std::optional<ConditionTable> conditions;
    std::vector<int> endPoints; ///< authoring positions, informational only
  };

  /// Upper bound on one loop entry's repetition count.
  inline constexpr std::size_t kMaxRepetitions = 1'000'000;

  /**
 * Convert an evaluated repetition count into an iteration count. Single
 * source of truth for zero-iteration semantics: false → 0, true → 1,
 * non-negative integral numbers up to `kMaxRepetitions` as-is. Everything
 * else, and anything but 0/1 for a branch guard, is a `ConfigurationError`.
 */
  std::size_t repetitionsFrom(const core::Value& value, const LoopNode& loop);

  /// Evaluate the loop's repetition expression and apply `repetitionsFrom`.
  std::size_t resolveRepetitions(const LoopNode& loop, const core::VariableEnvironment& env);

  /**
 * @class BranchGuard
 * @brief Read-only view of a guard loop as an `if`: the body runs once when
 *        the guard is taken, not at all otherwise. Uses `resolveRepetitions`.
 */
  class BranchGuard {
  public:
    explicit BranchGuard(const LoopNode& loop);

    bool taken(const core::VariableEnvironment& env) const {
      return resolveRepetitions(loop_, env) == 1;
    }

    const LoopNode& loop() const noexcept { return loop_; }

  private:
    const LoopNode& loop_;
  };

  /**
 * @class LoopActivation
 * @brief Iteration state of one entry into a loop:
 *        Pending → Entering → Iterating(i) → Exited.
 *
 *  * Counters (`thisN`, `nTotal`, `nRemaining`, `thisRepN`, `finished`) are
 *    published only while iterating and removed on exit or destruction.
 *  * A condition row (plus `thisIndex`) is bound for the duration of a
 *    single iteration when `isTrials` and a table is present.
 *  * Destroyed and recreated on every entry, so nested loops re-resolve
 *    their count on each outer iteration.
 */
  class LoopActivation {
  public:
    enum class State { Pending, Entering, Iterating, Exited };

    /// @param rng  process-level source, used when the loop has no seed.
    LoopActivation(const LoopNode& loop, core::VariableEnvironment& env, std::mt19937_64& rng);
    ~LoopActivation() = default;

    /// Resolve the count and draw the order. Returns the count (0 ⇒ Exited).
    std::size_t enter();

    /// Finish the current iteration (if any) and publish the next one.
    /// Returns false once the loop has exited.
    bool next();

    /// Leave the loop now, dropping every published name.
    void exit();

    State state() const noexcept { return state_; }
    std::size_t count() const noexcept { return count_; }
    std::size_t position() const noexcept { return position_; } ///< iterations started so far
    std::size_t thisN() const;                                  ///< value published for the current iteration
    const std::vector<std::size_t>& order() const noexcept { return order_; } ///< empty unless random
    const LoopNode& loop() const noexcept { return loop_; }

    LoopActivation(const LoopActivation&) = delete;
    LoopActivation& operator=(const LoopActivation&) = delete;

  private:
    std::string key(const char* counter) const { return loop_.name + "." + counter; }
    bool finishRequested() const;
    std::size_t indexAt(std::size_t pos) const { return order_.empty() ? pos : order_[pos]; }
    void bindRow(std::size_t index);

    const LoopNode& loop_;
    core::VariableEnvironment& env_;
    std::mt19937_64& rng_;

    State state_{ State::Pending };
    std::size_t count_{ 0 };
    std::size_t position_{ 0 };
    std::vector<std::size_t> order_;

    std::vector<core::ScopedBinding> counters_; ///< loop-lifetime
    std::vector<core::ScopedBinding> row_;      ///< iteration-lifetime
  };

  const char* toString(LoopActivation::State s);

} // namespace trialflow::flow
