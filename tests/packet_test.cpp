#include "core/Errors.hpp"
#include "protocols/PacketBuilder.hpp"
#include "protocols/SweepAxis.hpp"

#include <gtest/gtest.h>

#include <set>

using namespace rfsweep::protocols;
using rfsweep::core::ConfigurationError;
using rfsweep::core::FieldOffsetError;
using rfsweep::core::ValidationError;

TEST(packet_builder, every_sweep_value_lands_on_byte_nine) {
  PacketBuilder builder;
  for (int v = 0; v <= 0xFF; ++v) {
    const Payload p = builder.build(static_cast<std::uint8_t>(v));
    EXPECT_EQ(p.size(), kPayloadLength);
    EXPECT_EQ(p[9], v);
  }
}

TEST(packet_builder, fields_are_written_to_their_offsets) {
  PacketBuilder builder;
  builder.addField(pulseWidthField(), decodeHex("00 01", 2));
  builder.addField(prtField(), decodeHex("0A AB 00 00", 4));

  const Payload p = builder.build(0x05);

  EXPECT_EQ(p[10], 0x00);
  EXPECT_EQ(p[11], 0x01);
  EXPECT_EQ(p[12], 0x0A);
  EXPECT_EQ(p[13], 0xAB);
  EXPECT_EQ(p[14], 0x00);
  EXPECT_EQ(p[15], 0x00);

  // everything else comes from the template
  for (std::size_t i = 0; i < kPayloadLength; ++i) {
    if (i >= 9 && i <= 15)
      continue;
    EXPECT_EQ(p[i], kDefaultTemplate[i]) << "byte " << i;
  }
}

TEST(packet_builder, custom_offsets_follow_source_byte_order) {
  PacketBuilder builder;
  builder.addField(pulseWidthField({ 20, 3 }), Bytes{ 0x11, 0x22 });
  const Payload p = builder.build(0);
  EXPECT_EQ(p[20], 0x11);
  EXPECT_EQ(p[3], 0x22);
}

TEST(packet_builder, template_is_never_mutated) {
  const Payload tmpl = kDefaultTemplate;
  PacketBuilder builder(tmpl);
  builder.addField(prtField(), Bytes{ 1, 2, 3, 4 });
  const Payload a = builder.build(0x10);
  const Payload b = builder.build(0x20);
  EXPECT_EQ(builder.payloadTemplate(), tmpl);
  EXPECT_EQ(a[9], 0x10);
  EXPECT_EQ(b[9], 0x20);
}

TEST(packet_builder, sweep_byte_wins_collisions) {
  PacketBuilder builder;
  builder.addField(pulseWidthField({ 9, 10 }), Bytes{ 0xEE, 0xDD });
  const Payload p = builder.build(0x50);
  EXPECT_EQ(p[9], 0x50);
  EXPECT_EQ(p[10], 0xDD);
  EXPECT_EQ(builder.overlappingOffsets(), (std::vector<int>{ 9 }));
}

TEST(packet_builder, later_field_wins_overlap) {
  PacketBuilder builder;
  builder.addField(pulseWidthField({ 12, 13 }), Bytes{ 0xAA, 0xBB });
  builder.addField(prtField(), Bytes{ 0x01, 0x02, 0x03, 0x04 });
  const Payload p = builder.build(0);
  EXPECT_EQ(p[12], 0x01);
  EXPECT_EQ(p[13], 0x02);
  EXPECT_EQ(builder.overlappingOffsets(), (std::vector<int>{ 12, 13 }));
}

TEST(packet_builder, out_of_range_offsets_are_rejected) {
  PacketBuilder builder;
  EXPECT_THROW(builder.addField(pulseWidthField({ 10, 40 }), Bytes{ 0, 0 }), FieldOffsetError);
  EXPECT_THROW(builder.addField(prtField({ -1, 13, 14, 15 }), Bytes{ 0, 0, 0, 0 }), FieldOffsetError);
  EXPECT_THROW(PacketBuilder(kDefaultTemplate, 40), FieldOffsetError);
  EXPECT_TRUE(builder.fields().empty());
}

TEST(packet_builder, build_packet_reports_offset_and_length) {
  std::vector<FieldValue> fields{ { prtField({ 12, 13, 14, 99 }), Bytes{ 1, 2, 3, 4 } } };
  try {
    buildPacket(kDefaultTemplate, fields, kDefaultSweepOffset, 0);
    FAIL() << "expected FieldOffsetError";
  } catch (const FieldOffsetError& e) {
    EXPECT_EQ(e.offset(), 99);
    EXPECT_STREQ(e.what(), "offset 99 is out of range for payload length 40");
  }
}

TEST(packet_builder, arity_and_byte_count_are_checked) {
  PacketBuilder builder;
  EXPECT_THROW(builder.addField(pulseWidthField({ 10 }), Bytes{ 0, 0 }), ConfigurationError);
  EXPECT_THROW(builder.addField(prtField(), Bytes{ 0, 0 }), ValidationError);
}

TEST(sweep_axis, default_axis_enumerates_seventeen_ascending_values) {
  SweepAxis axis;
  const auto values = axis.values();
  ASSERT_EQ(values.size(), 17u);
  EXPECT_EQ(axis.size(), 17u);
  for (std::size_t i = 0; i < values.size(); ++i)
    EXPECT_EQ(values[i], i * 5);
  EXPECT_EQ(values.back(), 0x50);
  EXPECT_EQ(std::set<std::uint8_t>(values.begin(), values.end()).size(), values.size());
}

TEST(sweep_axis, unreachable_stop_is_not_included) {
  SweepAxis axis(0, 12, 5);
  EXPECT_EQ(axis.values(), (std::vector<std::uint8_t>{ 0, 5, 10 }));
  EXPECT_EQ(axis.size(), 3u);
}

TEST(sweep_axis, invalid_ranges_are_rejected) {
  EXPECT_THROW(SweepAxis(0, 0x50, 0), ConfigurationError);
  EXPECT_THROW(SweepAxis(0x50, 0, 5), ConfigurationError);
  EXPECT_THROW(SweepAxis(0, 0x100, 5), ConfigurationError);
  EXPECT_THROW(SweepAxis(-5, 0x50, 5), ConfigurationError);
}
