#pragma once
/** @file  PacketBuilder.hpp
 *  @brief 40-byte device packet: fixed template + injected fields + sweep byte.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

// rfsweep headers
#include "protocols/FieldCodec.hpp"

namespace rfsweep {
  namespace protocols {

    constexpr std::size_t kPayloadLength = 40;
    constexpr int kDefaultSweepOffset = 9;

    using Payload = std::array<std::uint8_t, kPayloadLength>;

    /// Template shipped with the DUT firmware; bytes 9..15 are overwritten per point.
    constexpr Payload kDefaultTemplate{ {
        0x00, 0xAB, 0xAB, 0x06, 0x00, 0x00, 0x07, 0x00, 0x00, 0x00, //
        0x0B, 0x0C, 0x0D, 0x0E, 0x0F, 0x10, 0x11, 0x12, 0x13, 0x00, //
        0x15, 0x16, 0x17, 0x18, 0x19, 0x1A, 0x1B, 0x1C, 0x1D, 0x1E, //
        0x1F, 0x20, 0x21, 0x22, 0x23, 0x24, 0x25, 0x26, 0x27, 0x28,
    } };

    /// A named field: how many bytes it carries and where each byte lands.
    struct FieldSpec {
      std::string name;
      std::size_t byteLength{ 0 };
      std::vector<int> offsets; ///< offsets[i] receives source byte i
    };

    FieldSpec pulseWidthField(std::vector<int> offsets = { 10, 11 });
    FieldSpec prtField(std::vector<int> offsets = { 12, 13, 14, 15 });

    /// A field spec bound to its decoded bytes.
    struct FieldValue {
      FieldSpec spec;
      Bytes bytes;
    };

    /**
     * Copy \p tmpl, write every field's bytes in the given order, then the
     * sweep byte at \p sweepOffset. The sweep byte is written last and wins
     * any collision.
     *
     * @throws core::FieldOffsetError if any offset is outside the payload.
     */
    Payload buildPacket(const Payload& tmpl, const std::vector<FieldValue>& fields,
                        int sweepOffset, std::uint8_t sweepValue);

    /**
 * @class PacketBuilder
 * @brief Holds the immutable template and the configured fields for one run.
 *
 *  * `addField()` validates arity, byte count and bounds up-front so the
 *    sweep loop never trips over a bad offset halfway through a run.
 *  * `build()` is const and returns a fresh buffer every call.
 */
    class PacketBuilder {
    public:
      explicit PacketBuilder(const Payload& tmpl = kDefaultTemplate,
                             int sweepOffset = kDefaultSweepOffset);

      /**
       * @throws core::ConfigurationError  offsets.size() != byteLength
       * @throws core::ValidationError     bytes.size()   != byteLength
       * @throws core::FieldOffsetError    offset outside [0, 40)
       */
      void addField(const FieldSpec& spec, Bytes bytes);

      Payload build(std::uint8_t sweepValue) const;

      /// Offsets written by more than one field or by a field and the sweep byte.
      std::vector<int> overlappingOffsets() const;

      const Payload& payloadTemplate() const { return template_; }
      int sweepOffset() const { return sweepOffset_; }
      const std::vector<FieldValue>& fields() const { return fields_; }

    private:
      const Payload template_;
      const int sweepOffset_;
      std::vector<FieldValue> fields_;
    };

  } // namespace protocols
} // namespace rfsweep
