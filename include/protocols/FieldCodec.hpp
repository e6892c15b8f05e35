#pragma once
/** @file  FieldCodec.hpp
 *  @brief Hex text <-> fixed-length byte fields.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace rfsweep {
  namespace protocols {

    using Bytes = std::vector<std::uint8_t>;

    /**
     * Decode `"0A AB"` / `"0AAB"` into exactly \p expectedByteCount bytes.
     *
     * Whitespace anywhere in the input is ignored. Empty (or all-blank) input
     * yields \p expectedByteCount zero bytes.
     *
     * @throws core::ValidationError on an odd digit count, a non-hex
     *         character, or a decoded length other than \p expectedByteCount.
     */
    Bytes decodeHex(const std::string& text, std::size_t expectedByteCount);

    /// Upper-case hex, pairs separated by a single space ("0A AB 00").
    std::string encodeHex(std::span<const std::uint8_t> bytes);

    /// Two upper-case hex digits, e.g. 0x05 -> "05".
    std::string hexLabel(std::uint8_t value);

  } // namespace protocols
} // namespace rfsweep
