/* @file ErrorMonitor.cpp
 * @brief de-duplicating fault sink with a single escalation hook
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <utility>

// Wayfinder headers
#include "core/ErrorMonitor.hpp"

namespace wayfinder {
  namespace core {

    void ErrorMonitor::registerEscalation(std::function<void(const std::string&)> cb) {
      std::lock_guard<std::mutex> lock(mtx_);
      escalation_ = std::move(cb);
    }

    void ErrorMonitor::notifyFailure(const std::string& message) {
      std::function<void(const std::string&)> cb;
      {
        std::lock_guard<std::mutex> lock(mtx_);
        if (!rememberIfNew(message))
          return;
        cb = escalation_;
      }
      // outside the lock: the callback may call failures()
      if (cb)
        cb(message);
    }

    std::vector<std::string> ErrorMonitor::failures() const {
      std::lock_guard<std::mutex> lock(mtx_);
      return seen_;
    }

    void ErrorMonitor::reset() {
      std::lock_guard<std::mutex> lock(mtx_);
      seen_.clear();
    }

    bool ErrorMonitor::rememberIfNew(const std::string& message) {
      if (std::find(seen_.begin(), seen_.end(), message) != seen_.end())
        return false;
      seen_.push_back(message);
      return true;
    }

  } // namespace core
} // namespace wayfinder
