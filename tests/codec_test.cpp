#include "core/Errors.hpp"
#include "protocols/FieldCodec.hpp"

#include <gtest/gtest.h>

using rfsweep::core::ValidationError;
using rfsweep::protocols::Bytes;
using rfsweep::protocols::decodeHex;
using rfsweep::protocols::encodeHex;
using rfsweep::protocols::hexLabel;

TEST(field_codec, decodes_spaced_and_packed_pairs) {
  EXPECT_EQ(decodeHex("0A AB", 2), (Bytes{ 0x0A, 0xAB }));
  EXPECT_EQ(decodeHex("0AAB", 2), (Bytes{ 0x0A, 0xAB }));
  EXPECT_EQ(decodeHex("0a ab 00 00", 4), (Bytes{ 0x0A, 0xAB, 0x00, 0x00 }));
  EXPECT_EQ(decodeHex(" 00\t01\n", 2), (Bytes{ 0x00, 0x01 }));
}

TEST(field_codec, empty_input_decodes_to_zero_bytes) {
  EXPECT_EQ(decodeHex("", 4), Bytes(4, 0x00));
  EXPECT_EQ(decodeHex("   ", 2), Bytes(2, 0x00));
}

TEST(field_codec, odd_digit_count_is_rejected) {
  EXPECT_THROW(decodeHex("0A B", 2), ValidationError);
  EXPECT_THROW(decodeHex("ABC", 2), ValidationError);
}

TEST(field_codec, wrong_byte_count_is_rejected) {
  EXPECT_THROW(decodeHex("00", 2), ValidationError);
  EXPECT_THROW(decodeHex("00 01 02", 2), ValidationError);
  EXPECT_THROW(decodeHex("0A AB 00 00 00", 4), ValidationError);
}

TEST(field_codec, non_hex_digits_are_rejected) {
  EXPECT_THROW(decodeHex("0G 00", 2), ValidationError);
  EXPECT_THROW(decodeHex("0x01", 2), ValidationError);
}

TEST(field_codec, validation_error_is_an_invalid_argument) {
  try {
    decodeHex("00", 4);
    FAIL() << "expected ValidationError";
  } catch (const std::invalid_argument& e) {
    EXPECT_NE(std::string(e.what()).find("expecting 4 bytes, got 1"), std::string::npos);
  }
}

TEST(field_codec, encode_is_inverse_of_decode) {
  for (const char* text : { "00 01", "0A AB 00 00", "FF 80 7F 01" }) {
    const std::string s(text);
    const std::size_t n = (s.size() + 1) / 3;
    EXPECT_EQ(encodeHex(decodeHex(s, n)), s);
  }
}

TEST(field_codec, hex_label_is_two_uppercase_digits) {
  EXPECT_EQ(hexLabel(0x00), "00");
  EXPECT_EQ(hexLabel(0x05), "05");
  EXPECT_EQ(hexLabel(0x3C), "3C");
  EXPECT_EQ(hexLabel(0x50), "50");
}
