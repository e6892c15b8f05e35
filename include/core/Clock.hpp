#pragma once
/** @file  Clock.hpp
 *  @brief Injectable dwell timer and cancellation flag for the sweep loop.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <atomic>
#include <chrono>
#include <thread>

namespace rfsweep {
  namespace core {

    /** Dwells go through here so tests can run the state machine without real delays. */
    class Clock {
    public:
      virtual ~Clock() = default;
      virtual void sleepFor(std::chrono::milliseconds d) = 0;
    };

    class SteadyClock : public Clock {
    public:
      void sleepFor(std::chrono::milliseconds d) override { std::this_thread::sleep_for(d); }
    };

    /** Set from another thread (signal handler, UI); polled at the top of each sweep point. */
    class CancellationToken {
    public:
      void cancel() { cancelled_.store(true); }
      void reset() { cancelled_.store(false); }
      bool cancelled() const { return cancelled_.load(); }

    private:
      std::atomic<bool> cancelled_{ false };
    };

  } // namespace core
} // namespace rfsweep
