#pragma once
/** @file  ErrorMonitor.hpp
 *  @brief Collects fault reports from the hub, the sweep and the coordinator.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <cstddef>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace rfsweep::core {

  /**
 * @class ErrorMonitor
 * @brief `notifyFailure()` records a message and hands it to the escalation
 *        callback the first time that exact message is seen.
 *
 * * Safe to call from any thread; the callback runs outside the lock.
 * * A sweep that loses the same instrument on every point escalates once.
 * * `notifyFailure()` is virtual so tests can observe reports with gmock.
 */
  class ErrorMonitor {
  public:
    ErrorMonitor();
    virtual ~ErrorMonitor();

    /// Replaces any previous escalation callback.
    void registerEscalation(std::function<void(const std::string&)> cb);

    virtual void notifyFailure(const std::string& message);

    /// Distinct messages since construction or the last reset().
    std::size_t uniqueFailures() const;

    /// Called by the coordinator at the start of each run.
    void reset();

  private:
    void forwardIfNew(const std::string& message);

    std::function<void(const std::string&)> escalation_{};
    std::vector<std::string> seen_;
    mutable std::mutex mtx_;
  };

} // namespace rfsweep::core
