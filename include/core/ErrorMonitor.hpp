#pragma once
/** @file  ErrorMonitor.hpp
 *  @brief Central fault aggregator & escalation helper.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace trialflow::core {

  /**
 * @class ErrorMonitor
 * @brief Subsystems call `notifyFailure()`; we call the registered
 *        escalation callback exactly once per unique error.
 *
 * * Thread-safe (mutex-protected vector); the logger worker may report too.
 * * Debounces duplicate failures so RunCoordinator doesn’t get spammed.
 */
  class ErrorMonitor {
  public:
    ErrorMonitor() = default;
    virtual ~ErrorMonitor() = default;

    /// Register a lambda that escalates a fatal fault to RunCoordinator.
    void registerEscalation(std::function<void(const std::string&)> cb);

    /// Called by subsystems on fault; will forward to the escalation callback.
    virtual void notifyFailure(const std::string& message);

    /// Unique failures seen so far, in arrival order.
    std::vector<std::string> failures() const;

  private:
    bool rememberIfNew(const std::string& message);

    std::function<void(const std::string&)> escalation_{};
    std::vector<std::string> seen_; ///< de-dupe list
    mutable std::mutex mtx_;
  };

} // namespace trialflow::core
