/* @file ErrorMonitor.cpp
 * @brief de-duplicating fault aggregator
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <utility>

// rfsweep headers
#include "core/ErrorMonitor.hpp"

namespace rfsweep {
  namespace core {

    ErrorMonitor::ErrorMonitor() = default;
    ErrorMonitor::~ErrorMonitor() = default;

    void ErrorMonitor::registerEscalation(std::function<void(const std::string&)> cb) {
      std::lock_guard<std::mutex> lock(mtx_);
      escalation_ = std::move(cb);
    }

    void ErrorMonitor::notifyFailure(const std::string& message) { forwardIfNew(message); }

    std::size_t ErrorMonitor::uniqueFailures() const {
      std::lock_guard<std::mutex> lock(mtx_);
      return seen_.size();
    }

    void ErrorMonitor::reset() {
      std::lock_guard<std::mutex> lock(mtx_);
      seen_.clear();
    }

    void ErrorMonitor::forwardIfNew(const std::string& message) {
      std::function<void(const std::string&)> cb;
      {
        std::lock_guard<std::mutex> lock(mtx_);
        if (std::find(seen_.begin(), seen_.end(), message) != seen_.end())
          return;
        seen_.push_back(message);
        cb = escalation_;
      }
      // escalate outside the lock so the callback may call back into us
      if (cb)
        cb(message);
    }

  } // namespace core
} // namespace rfsweep
