/* @file ErrorMonitor.cpp
 * @brief de-duplicating fault escalation
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <iostream>

// TrialFlow headers
#include "core/ErrorMonitor.hpp"

namespace trialflow {
  namespace core {

    void ErrorMonitor::registerEscalation(std::function<void(const std::string&)> cb) {
      std::lock_guard<std::mutex> lock(mtx_);
      escalation_ = std::move(cb);
    }

    void ErrorMonitor::notifyFailure(const std::string& message) {
      if (!rememberIfNew(message))
        return;

      std::function<void(const std::string&)> cb;
      {
        std::lock_guard<std::mutex> lock(mtx_);
        cb = escalation_;
      }
      // call outside the lock so the callback may query failures()
      if (cb)
        cb(message);
      else
        std::cerr << "[ErrorMonitor] " << message << '\n';
    }

    std::vector<std::string> ErrorMonitor::failures() const {
      std::lock_guard<std::mutex> lock(mtx_);
      return seen_;
    }

    bool ErrorMonitor::rememberIfNew(const std::string& message) {
      std::lock_guard<std::mutex> lock(mtx_);
      if (std::find(seen_.begin(), seen_.end(), message) != seen_.end())
        return false;
      seen_.push_back(message);
      return true;
    }

  } // namespace core
} // namespace trialflow
