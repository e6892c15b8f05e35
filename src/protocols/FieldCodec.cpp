/* @file FieldCodec.cpp
 * @brief hex field parsing for the pulse-width / PRT parameters
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cctype>
#include <string>

// rfsweep headers
#include "core/Errors.hpp"
#include "protocols/FieldCodec.hpp"

namespace rfsweep {
  namespace protocols {

    namespace {
      constexpr char kDigits[] = "0123456789ABCDEF";

      int nibble(char c) {
        if (c >= '0' && c <= '9')
          return c - '0';
        if (c >= 'a' && c <= 'f')
          return c - 'a' + 10;
        if (c >= 'A' && c <= 'F')
          return c - 'A' + 10;
        return -1;
      }
    } // namespace

    Bytes decodeHex(const std::string& text, std::size_t expectedByteCount) {
      std::string digits;
      digits.reserve(text.size());
      for (char c : text) {
        if (!std::isspace(static_cast<unsigned char>(c)))
          digits += c;
      }

      if (digits.empty())
        return Bytes(expectedByteCount, 0x00);

      if (digits.size() % 2 != 0)
        throw core::ValidationError("hex string length must be even (pairs of hex digits): '" +
                                    text + "'");

      Bytes out;
      out.reserve(digits.size() / 2);
      for (std::size_t i = 0; i < digits.size(); i += 2) {
        const int hi = nibble(digits[i]);
        const int lo = nibble(digits[i + 1]);
        if (hi < 0 || lo < 0)
          throw core::ValidationError("invalid hex digit in '" + text + "'");
        out.push_back(static_cast<std::uint8_t>((hi << 4) | lo));
      }

      if (out.size() != expectedByteCount)
        throw core::ValidationError("expecting " + std::to_string(expectedByteCount) +
                                    " bytes, got " + std::to_string(out.size()));
      return out;
    }

    std::string encodeHex(std::span<const std::uint8_t> bytes) {
      std::string out;
      out.reserve(bytes.size() * 3);
      for (std::size_t i = 0; i < bytes.size(); ++i) {
        if (i != 0)
          out += ' ';
        out += hexLabel(bytes[i]);
      }
      return out;
    }

    std::string hexLabel(std::uint8_t value) {
      return { kDigits[value >> 4], kDigits[value & 0x0F] };
    }

  } // namespace protocols
} // namespace rfsweep
