// spectackler headers
#include "protocols/AsciiCodec.hpp"
#include "protocols/DasnetCodec.hpp"
#include "protocols/NeslabCodec.hpp"
#include "protocols/ShimadzuCodec.hpp"

// GTest headers
#include <gtest/gtest.h>

#include <cstdio>
#include <stdexcept>

using namespace spectackler::protocols;

//------------------------------------------------------------------------------
// DASNET
//------------------------------------------------------------------------------
TEST(dasnet_codec, encodes_known_frame) {
  const Bytes frame = dasnet::encode({ '1', 'R', '0', "remote" });
  EXPECT_EQ(toString(frame), "1R006REMOTE1B\r");
}

TEST(dasnet_codec, checksum_brings_sum_to_zero_mod_256) {
  const std::string text = "1R006REMOTE";
  unsigned total = dasnet::checksum(text);
  for (unsigned char c : text)
    total += c;
  EXPECT_EQ(total % 256, 0u);
}

TEST(dasnet_codec, decodes_pump_reply) {
  const auto msg = dasnet::decode(toBytes("0R00BVOLA=123.4540\r"));
  EXPECT_EQ(msg.dest, '0');
  EXPECT_EQ(msg.ack, 'R');
  EXPECT_EQ(msg.source, '0');
  EXPECT_EQ(msg.body, "VOLA=123.45");
}

TEST(dasnet_codec, round_trips_message) {
  const dasnet::Message in{ '1', 'R', '0', "PRESS=1500" };
  const auto out = dasnet::decode(dasnet::encode(in));
  EXPECT_EQ(out.body, in.body);
  EXPECT_EQ(out.dest, in.dest);
}

TEST(dasnet_codec, rejects_any_single_corrupted_byte) {
  const Bytes good = dasnet::encode({ '1', 'R', '0', "VOLA" });
  for (std::size_t i = 0; i + 1 < good.size(); ++i) {
    Bytes bad = good;
    bad[i] = static_cast<std::uint8_t>(bad[i] ^ 0x01);
    EXPECT_THROW(dasnet::decode(bad), ProtocolError) << "byte " << i;
  }
}

TEST(dasnet_codec, rejects_missing_terminator_and_length_mismatch) {
  EXPECT_THROW(dasnet::decode(toBytes("0R00BVOLA=123.4540")), ProtocolError);
  // declared length 0C, body is 11 characters; checksum recomputed to isolate the length check
  const std::string body = "0R00CVOLA=123.45";
  char sum[3];
  std::snprintf(sum, sizeof(sum), "%02X", dasnet::checksum(body));
  EXPECT_THROW(dasnet::decode(toBytes(body + sum + "\r")), ProtocolError);
}

TEST(dasnet_codec, refuses_oversized_message) {
  EXPECT_THROW(dasnet::encode({ '1', 'R', '0', std::string(256, 'A') }), std::invalid_argument);
}

//------------------------------------------------------------------------------
// NESLAB
//------------------------------------------------------------------------------
TEST(neslab_codec, encodes_read_internal_temperature) {
  EXPECT_EQ(neslab::encode({ 0x20 }, {}), (Bytes{ 0xCA, 0x00, 0x01, 0x20, 0x00, 0xDE }));
}

TEST(neslab_codec, multidrop_uses_rs485_lead_and_address) {
  const Bytes frame = neslab::encode({ 0x20 }, {}, { true, 5 });
  ASSERT_EQ(frame.size(), 6u);
  EXPECT_EQ(frame[0], neslab::kLeadRs485);
  EXPECT_EQ(frame[2], 5);
  EXPECT_THROW(neslab::encode({ 0x20 }, {}, { true, 64 }), std::invalid_argument);
}

TEST(neslab_codec, checksum_is_inverted_byte_sum) {
  const Bytes bytes{ 0x00, 0x01, 0x20, 0x03, 0x11, 0x00, 0xD2 };
  EXPECT_EQ(neslab::checksum(bytes), 0xF8);
}

TEST(neslab_codec, decodes_reply_and_value) {
  const Bytes request = neslab::encode({ 0x20 }, {});
  const Bytes reply{ 0xCA, 0x00, 0x01, 0x20, 0x03, 0x11, 0x00, 0xD2, 0xF8 };
  const Bytes data = neslab::decode(reply, request);
  ASSERT_EQ(data.size(), 3u);
  EXPECT_DOUBLE_EQ(neslab::decodeValue(data), 21.0);
}

TEST(neslab_codec, value_resolution_follows_qualifier) {
  EXPECT_DOUBLE_EQ(neslab::decodeValue({ 0x10, 0x00, 0xD2 }), 21.0);
  EXPECT_DOUBLE_EQ(neslab::decodeValue({ 0x21, 0x08, 0x34 }), 21.0);
  EXPECT_DOUBLE_EQ(neslab::decodeValue({ 0x21, 0xFF, 0x38 }), -2.0);
}

TEST(neslab_codec, int16_is_big_endian_twos_complement) {
  EXPECT_EQ(neslab::encodeInt16(2100), (Bytes{ 0x08, 0x34 }));
  EXPECT_EQ(neslab::encodeInt16(-200), (Bytes{ 0xFF, 0x38 }));
}

TEST(neslab_codec, rejects_any_single_corrupted_byte) {
  const Bytes request = neslab::encode({ 0x20 }, {});
  const Bytes good{ 0xCA, 0x00, 0x01, 0x20, 0x03, 0x11, 0x00, 0xD2, 0xF8 };
  for (std::size_t i = 0; i < good.size(); ++i) {
    Bytes bad = good;
    bad[i] = static_cast<std::uint8_t>(bad[i] ^ 0x04);
    EXPECT_THROW(neslab::decode(bad, request), ProtocolError) << "byte " << i;
  }
}

TEST(neslab_codec, rejects_reply_to_another_command) {
  const Bytes request = neslab::encode({ 0x21 }, {});
  const Bytes reply{ 0xCA, 0x00, 0x01, 0x20, 0x03, 0x11, 0x00, 0xD2, 0xF8 };
  EXPECT_THROW(neslab::decode(reply, request), ProtocolError);
}

TEST(neslab_codec, status_bits_are_msb_first) {
  const auto bits = neslab::decodeStatus({ 0x80, 0x00, 0x00, 0x08, 0x00 });
  ASSERT_EQ(bits.size(), 37u);
  EXPECT_EQ(bits[0].first, "rtd1_open_fault");
  EXPECT_TRUE(bits[0].second);
  EXPECT_EQ(bits[28].first, "unit_on");
  EXPECT_TRUE(bits[28].second);
  EXPECT_FALSE(bits[29].second);
  EXPECT_THROW(neslab::decodeStatus({ 0x00 }), ProtocolError);
}

//------------------------------------------------------------------------------
// RF-5301 framing
//------------------------------------------------------------------------------
TEST(shimadzu_codec, parity_makes_every_byte_odd) {
  for (auto b : shimadzu::toWire("WA0D481162#CR")) {
    int ones = 0;
    for (int i = 0; i < 8; ++i)
      ones += (b >> i) & 1;
    EXPECT_EQ(ones % 2, 1) << std::hex << static_cast<int>(b);
  }
  EXPECT_EQ(shimadzu::fromWire(shimadzu::toWire("N1")), "N1");
}

TEST(shimadzu_codec, signal_bytes_carry_parity) {
  EXPECT_EQ(shimadzu::toWire("\x05")[0], shimadzu::kEnq);
  EXPECT_EQ(shimadzu::toWire("\x06")[0], shimadzu::kAck);
  EXPECT_EQ(shimadzu::toWire("\x03")[0], shimadzu::kEtx);
  EXPECT_EQ(shimadzu::toWire("\x17")[0], shimadzu::kEtb);
}

TEST(shimadzu_codec, encodes_known_command_with_table_checksum) {
  const Bytes frame = shimadzu::encode("R");
  ASSERT_EQ(frame.size(), 4u);
  EXPECT_EQ(frame[0], shimadzu::kStx);
  EXPECT_EQ(frame[1], 0x52); // 'R' already odd
  EXPECT_EQ(frame[2], shimadzu::kEtx);
  EXPECT_EQ(frame[3], 0x51);
}

TEST(shimadzu_codec, unknown_message_is_unsupported_before_any_write) {
  EXPECT_THROW(shimadzu::encode("WA0DAC1234"), UnsupportedCommand);
}

TEST(shimadzu_codec, decodes_block_and_checks_structure) {
  Bytes block{ shimadzu::kStx };
  const Bytes text = shimadzu::toWire("0R000123");
  block.insert(block.end(), text.begin(), text.end());
  block.push_back(shimadzu::kEtx);
  block.push_back(0x00); // not in the table: structural checks only
  EXPECT_EQ(shimadzu::decodeBlock(block), "0R000123");

  Bytes noStx(block.begin() + 1, block.end());
  EXPECT_THROW(shimadzu::decodeBlock(noStx), ProtocolError);
  Bytes noEtx = block;
  noEtx[noEtx.size() - 2] = 0x41;
  EXPECT_THROW(shimadzu::decodeBlock(noEtx), ProtocolError);
}

TEST(shimadzu_codec, block_in_table_must_carry_table_checksum) {
  Bytes block = shimadzu::encode("N1");
  EXPECT_EQ(shimadzu::decodeBlock(block), "N1");
  block.back() = static_cast<std::uint8_t>(block.back() ^ 0xFF);
  EXPECT_THROW(shimadzu::decodeBlock(block), ProtocolError);
}

TEST(shimadzu_codec, hex24_is_signed) {
  EXPECT_EQ(shimadzu::hex24("000123"), 0x123);
  EXPECT_EQ(shimadzu::hex24("FFFFFF"), -1);
  EXPECT_EQ(shimadzu::hex24("800000"), -0x800000);
  EXPECT_THROW(shimadzu::hex24("12G"), ProtocolError);
  EXPECT_THROW(shimadzu::hex24(""), ProtocolError);
}

TEST(shimadzu_codec, strips_echoed_command) {
  EXPECT_EQ(shimadzu::stripEcho("0R000123", "R"), "000123");
  EXPECT_EQ(shimadzu::stripEcho("1234", "V"), "1234");
}

//------------------------------------------------------------------------------
// ASCII
//------------------------------------------------------------------------------
TEST(ascii_codec, encodes_with_terminator) {
  EXPECT_EQ(toString(ascii::encode("RT")), "RT\r");
  EXPECT_EQ(toString(ascii::encode("TEM", "\n")), "TEM\n");
}

TEST(ascii_codec, decode_trims_and_rejects_noise) {
  EXPECT_EQ(ascii::decode(toBytes(" 21.35C\r\n")), "21.35C");
  EXPECT_THROW(ascii::decode({ 0x32, 0xFF, 0x0D }), ProtocolError);
}

TEST(ascii_codec, parses_numbers_with_units) {
  EXPECT_DOUBLE_EQ(*ascii::parseNumber("21.35C"), 21.35);
  EXPECT_DOUBLE_EQ(*ascii::parseNumber("-5.2"), -5.2);
  EXPECT_DOUBLE_EQ(*ascii::parseNumber("45%RH"), 45.0);
  EXPECT_FALSE(ascii::parseNumber("OK"));
  EXPECT_FALSE(ascii::parseNumber(""));
}

TEST(ascii_codec, number_is_the_first_word_that_starts_with_one) {
  EXPECT_DOUBLE_EQ(*ascii::parseNumber("T1 21.3"), 21.3);
  EXPECT_DOUBLE_EQ(*ascii::parseNumber("SP -4.50 C"), -4.5);
  EXPECT_DOUBLE_EQ(*ascii::parseNumber(".5"), 0.5);
  EXPECT_FALSE(ascii::parseNumber("- . E"));
}

TEST(ascii_codec, ok_sentinel_is_literal) {
  EXPECT_TRUE(ascii::isOk("OK"));
  EXPECT_FALSE(ascii::isOk("ERR"));
}
