#pragma once
/** @file  Errors.hpp
 *  @brief Exception taxonomy shared by the sequencer, the codec and the I/O layer.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <stdexcept>
#include <string>

namespace rfsweep {
  namespace core {

    /// Malformed hex input or a decoded byte count that does not match the field.
    class ValidationError : public std::invalid_argument {
    public:
      using std::invalid_argument::invalid_argument;
    };

    /// Missing analyzer, wrong offset arity or an unusable configuration value.
    class ConfigurationError : public std::runtime_error {
    public:
      using std::runtime_error::runtime_error;
    };

    /// A configured field offset lies outside the payload.
    class FieldOffsetError : public std::out_of_range {
    public:
      FieldOffsetError(int offset, std::size_t payloadLength)
          : std::out_of_range("offset " + std::to_string(offset) +
                              " is out of range for payload length " +
                              std::to_string(payloadLength)),
            offset_{ offset }, payloadLength_{ payloadLength } {}

      int offset() const noexcept { return offset_; }
      std::size_t payloadLength() const noexcept { return payloadLength_; }

    private:
      int offset_;
      std::size_t payloadLength_;
    };

    /// Socket open/bind/send failure. Per-step when raised inside the sweep loop.
    class TransportError : public std::runtime_error {
    public:
      using std::runtime_error::runtime_error;
    };

    /// Analyzer read failure (marker frequency / power).
    class MeasurementError : public std::runtime_error {
    public:
      using std::runtime_error::runtime_error;
    };

    /// Instrument channel failure (open, write, no reply before the timeout).
    class InstrumentError : public std::runtime_error {
    public:
      using std::runtime_error::runtime_error;
    };

  } // namespace core
} // namespace rfsweep
