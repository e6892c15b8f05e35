/* @file PacketBuilder.cpp
 * @brief per-point packet construction
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <map>
#include <utility>

// rfsweep headers
#include "core/Errors.hpp"
#include "protocols/PacketBuilder.hpp"

namespace rfsweep {
  namespace protocols {

    namespace {
      void checkOffset(int offset) {
        if (offset < 0 || offset >= static_cast<int>(kPayloadLength))
          throw core::FieldOffsetError(offset, kPayloadLength);
      }
    } // namespace

    FieldSpec pulseWidthField(std::vector<int> offsets) {
      return FieldSpec{ "pulse_width", 2, std::move(offsets) };
    }

    FieldSpec prtField(std::vector<int> offsets) {
      return FieldSpec{ "prt", 4, std::move(offsets) };
    }

    Payload buildPacket(const Payload& tmpl, const std::vector<FieldValue>& fields,
                        int sweepOffset, std::uint8_t sweepValue) {
      Payload payload = tmpl;

      for (const auto& field : fields) {
        const std::size_t n = std::min(field.spec.offsets.size(), field.bytes.size());
        for (std::size_t i = 0; i < n; ++i) {
          const int idx = field.spec.offsets[i];
          checkOffset(idx);
          payload[static_cast<std::size_t>(idx)] = field.bytes[i];
        }
      }

      checkOffset(sweepOffset);
      payload[static_cast<std::size_t>(sweepOffset)] = sweepValue;
      return payload;
    }

    PacketBuilder::PacketBuilder(const Payload& tmpl, int sweepOffset)
        : template_{ tmpl }, sweepOffset_{ sweepOffset } {
      checkOffset(sweepOffset_);
    }

    void PacketBuilder::addField(const FieldSpec& spec, Bytes bytes) {
      if (spec.offsets.size() != spec.byteLength)
        throw core::ConfigurationError(spec.name + " offsets must be a list of " +
                                       std::to_string(spec.byteLength) + " integers, got " +
                                       std::to_string(spec.offsets.size()));
      if (bytes.size() != spec.byteLength)
        throw core::ValidationError(spec.name + " expects " + std::to_string(spec.byteLength) +
                                    " bytes, got " + std::to_string(bytes.size()));
      for (int offset : spec.offsets)
        checkOffset(offset);

      fields_.push_back(FieldValue{ spec, std::move(bytes) });
    }

    Payload PacketBuilder::build(std::uint8_t sweepValue) const {
      return buildPacket(template_, fields_, sweepOffset_, sweepValue);
    }

    std::vector<int> PacketBuilder::overlappingOffsets() const {
      std::map<int, int> writes{ { sweepOffset_, 1 } };
      for (const auto& field : fields_)
        for (int offset : field.spec.offsets)
          ++writes[offset];

      std::vector<int> out;
      for (const auto& [offset, count] : writes)
        if (count > 1)
          out.push_back(offset);
      return out;
    }

  } // namespace protocols
} // namespace rfsweep
