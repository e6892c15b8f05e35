#pragma once
/** @file  Progress.hpp
 *  @brief Progress events pushed by the sweep to a single observer.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <functional>
#include <optional>
#include <string>

namespace rfsweep {
  namespace protocols {

    enum class ProgressStatus { Running, Error, Completed };

    inline const char* toString(ProgressStatus s) {
      switch (s) {
      case ProgressStatus::Running:
        return "running";
      case ProgressStatus::Error:
        return "error";
      case ProgressStatus::Completed:
        return "completed";
      default:
        return "unknown";
      }
    }

    struct ProgressEvent {
      ProgressStatus status{ ProgressStatus::Running };
      int current{ 0 }; ///< 1-based step index; result count on `Completed`
      int total{ 0 };   ///< declared upper bound, not necessarily the axis size
      int boardNo{ 0 };
      int channelNo{ 0 };
      std::optional<std::string> hex; ///< "0x0A" for per-step events
      std::string message;
    };

    /// Observer contract: returns nothing the sweep can act on, and anything
    /// it throws is logged and discarded.
    using ProgressSink = std::function<void(const ProgressEvent&)>;

    struct MeasurementResult {
      std::string sweepLabel; ///< "0A"
      double frequencyHz{ 0.0 };
      double powerDbm{ 0.0 };
    };

  } // namespace protocols
} // namespace rfsweep
