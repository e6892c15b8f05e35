#pragma once
/** @file  Logger.hpp
 *  @brief Asynchronous CSV logger (runs its own worker thread).
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <atomic>
#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace rfsweep {
  namespace io {
    class FileLogger;
  } // namespace io

  namespace core {

    template <typename T> class RingBuffer; // forward decl to avoid heavy include

    enum class LogLevel { Debug, Info, Warning, Error };

    const char* toString(LogLevel level);

    struct LogEvent {
      std::chrono::system_clock::time_point timestamp{ std::chrono::system_clock::now() };
      LogLevel level{ LogLevel::Info };
      std::string source;  ///< e.g. "SweepProtocol"
      std::string message;
    };

    /// Render one event as `timestamp,level,source,"message"` (no newline).
    std::string toCsv(const LogEvent& event);

    class Logger {

    public:
      explicit Logger(std::size_t queueCapacity = 1024);
      ~Logger(); ///< finishRun() if still running

      // --- public API ---
      bool startNewRun(const std::string& csvPath); ///< open file + launch worker thread
      /// Enqueue without waiting on disk I/O. Ignored unless a run is active;
      /// every event accepted before finishRun() returns reaches the file.
      void log(const LogEvent& event);
      void log(LogLevel level, std::string source, std::string message);
      void finishRun();                             ///< flush + join worker thread

      bool running() const { return running_.load(); }
      std::size_t droppedEvents() const;
      std::size_t acceptedEvents() const; ///< since the last startNewRun()

      Logger(const Logger&) = delete;
      Logger& operator=(const Logger&) = delete;

    private:
      void drain();

      std::unique_ptr<io::FileLogger> csvFile_;
      std::unique_ptr<RingBuffer<LogEvent>> buffer_;
      std::thread worker_;
      std::atomic<bool> running_{ false };
      std::size_t accepted_{ 0 };
      mutable std::mutex gate_; ///< orders log() against finishRun()
    };

  } // namespace core
} // namespace rfsweep
