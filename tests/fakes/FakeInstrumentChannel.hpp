#pragma once
/** @file  FakeInstrumentChannel.hpp
 *  @brief InstrumentChannel derivative with controlled method outputs for InstrumentHub testing.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <deque>
#include <string>
#include <vector>

#include "io/InstrumentChannel.hpp"

namespace rfsweep {
  namespace test {

    /**
 * @class FakeInstrumentChannel
 * @brief Replies are served from `replies` in order; an empty queue reads as a timeout.
 */
    class FakeInstrumentChannel : public rfsweep::io::InstrumentChannel {
    public:
      bool open_called = false;
      bool open_success = true;
      bool write_success = true;
      bool closed = false;
      std::deque<std::string> replies;
      std::vector<std::string> written;

      bool open(const std::string&, std::uint16_t) override {
        open_called = true;
        return open_success;
      }

      bool writeLine(const std::string& line) override {
        written.push_back(line);
        return write_success;
      }

      std::optional<std::string> readLine(std::chrono::milliseconds) override {
        if (replies.empty())
          return std::nullopt;
        std::string line = replies.front();
        replies.pop_front();
        return line;
      }

      void close() override { closed = true; }

      const std::string& getLastWritten() const { return written.back(); }
    };

  } // namespace test
} // namespace rfsweep
