/* @file Logger.cpp
 * @brief worker-thread CSV logger; producers never block on disk I/O
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <ctime>
#include <iomanip>
#include <sstream>
#include <utility>

// rfsweep headers
#include "core/Logger.hpp"
#include "core/RingBuffer.hpp"
#include "io/FileLogger.hpp"

namespace rfsweep {
  namespace core {

    namespace {
      constexpr std::chrono::milliseconds kPollInterval{ 50 };

      std::string isoTimestamp(std::chrono::system_clock::time_point tp) {
        const auto secs = std::chrono::system_clock::to_time_t(tp);
        const auto ms =
            std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()) % 1000;
        std::tm utc{};
        gmtime_r(&secs, &utc);
        std::ostringstream os;
        os << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0')
           << ms.count() << 'Z';
        return os.str();
      }
    } // namespace

    const char* toString(LogLevel level) {
      switch (level) {
      case LogLevel::Debug:
        return "DEBUG";
      case LogLevel::Info:
        return "INFO";
      case LogLevel::Warning:
        return "WARN";
      case LogLevel::Error:
        return "ERROR";
      default:
        return "UNKNOWN";
      }
    }

    std::string toCsv(const LogEvent& event) {
      std::string quoted;
      quoted.reserve(event.message.size() + 2);
      quoted += '"';
      for (char c : event.message) {
        if (c == '"')
          quoted += '"';
        quoted += c;
      }
      quoted += '"';
      return isoTimestamp(event.timestamp) + ',' + toString(event.level) + ',' + event.source +
             ',' + quoted;
    }

    Logger::Logger(std::size_t queueCapacity)
        : csvFile_{ std::make_unique<io::FileLogger>() },
          buffer_{ std::make_unique<RingBuffer<LogEvent>>(queueCapacity) } {}

    Logger::~Logger() { finishRun(); }

    bool Logger::startNewRun(const std::string& csvPath) {
      finishRun();
      if (!csvFile_->open(csvPath))
        return false;
      csvFile_->write("timestamp,level,source,message\n");
      {
        std::lock_guard<std::mutex> lock(gate_);
        running_ = true;
        accepted_ = 0;
      }
      worker_ = std::thread([this] { drain(); });
      return true;
    }

    void Logger::log(const LogEvent& event) {
      // finishRun() flips running_ under the same lock, so anything pushed
      // here is still in the queue when the worker makes its final drain
      std::lock_guard<std::mutex> lock(gate_);
      if (!running_)
        return;
      buffer_->push(event);
      ++accepted_;
    }

    void Logger::log(LogLevel level, std::string source, std::string message) {
      LogEvent event;
      event.level = level;
      event.source = std::move(source);
      event.message = std::move(message);
      log(event);
    }

    void Logger::finishRun() {
      {
        std::lock_guard<std::mutex> lock(gate_);
        if (!running_.exchange(false))
          return;
      }
      if (worker_.joinable())
        worker_.join();
      csvFile_->close(); // flushes the tail
    }

    std::size_t Logger::droppedEvents() const { return buffer_->dropped(); }

    std::size_t Logger::acceptedEvents() const {
      std::lock_guard<std::mutex> lock(gate_);
      return accepted_;
    }

    void Logger::drain() {
      // keep going after running_ drops until the queue is empty
      while (running_ || !buffer_->empty()) {
        if (auto event = buffer_->pop(kPollInterval))
          csvFile_->write(toCsv(*event) + "\n");
      }
    }

  } // namespace core
} // namespace rfsweep
