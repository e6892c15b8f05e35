#pragma once
/** @file  InstrumentChannel.hpp
 *  @brief Line-oriented command channel to one bench instrument.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace rfsweep {
  namespace io {

    /**
 * @class InstrumentChannel
 * @brief Abstract line I/O: SCPI commands out, `\n`-terminated replies in.
 *
 *  * Concrete channels own their descriptor and release it on destruction.
 *  * Tests substitute a fake that scripts replies.
 */
    class InstrumentChannel {
    public:
      InstrumentChannel() = default;
      virtual ~InstrumentChannel() = default;

      virtual bool open(const std::string& host, std::uint16_t port) = 0;
      virtual bool writeLine(const std::string& line) = 0; // returns false on EIO
      virtual std::optional<std::string> readLine(std::chrono::milliseconds timeout) = 0;
      virtual void close() = 0;

      //---non-copyable-----------------------------------------
      InstrumentChannel(const InstrumentChannel&) = delete;
      InstrumentChannel& operator=(const InstrumentChannel&) = delete;
    };

  } // namespace io
} // namespace rfsweep
