// test_host_protocol.cpp — host-side encoder, decoder and payload parsers.

#include <gtest/gtest.h>

#include "host_protocol.hpp"

using namespace picorelay;

namespace {

std::string encode(CommandKind kind, const std::vector<std::string>& args) {
  std::string out, err;
  EXPECT_TRUE(build_request(kind, args, out, err)) << err;
  return out;
}

std::string refuse(CommandKind kind, const std::vector<std::string>& args) {
  std::string out, err;
  EXPECT_FALSE(build_request(kind, args, out, err));
  EXPECT_TRUE(out.empty());
  return err;
}

} // namespace

TEST(Encoder, BuildsCanonicalLines) {
  EXPECT_EQ(encode(CommandKind::PING, {}), "PING\n");
  EXPECT_EQ(encode(CommandKind::ON, {"03"}), "ON 3\n");
  EXPECT_EQ(encode(CommandKind::ALL, {"on"}), "ALL ON\n");
  EXPECT_EQ(encode(CommandKind::SET, {"10100000"}), "SET 10100000\n");
  EXPECT_EQ(encode(CommandKind::PULSE, {"2", "500"}), "PULSE 2 500\n");
  EXPECT_EQ(encode(CommandKind::GET, {"name", "4"}), "GET NAME 4\n");
  EXPECT_EQ(encode(CommandKind::NAME, {"1", "Pump"}), "NAME 1 Pump\n");
  EXPECT_EQ(encode(CommandKind::NAME, {"1"}), "NAME 1\n");
  EXPECT_EQ(encode(CommandKind::BEEP, {}), "BEEP\n");
  EXPECT_EQ(encode(CommandKind::TONE, {"440", "300"}), "TONE 440 300\n");
}

TEST(Encoder, RefusesBadCounts) {
  EXPECT_EQ(refuse(CommandKind::ON, {}), "bad_count:ON(1)");
  EXPECT_EQ(refuse(CommandKind::NAME, {}), "bad_count:NAME(1..2)");
  EXPECT_EQ(refuse(CommandKind::PING, {"x"}), "bad_count:PING(0)");
}

TEST(Encoder, RefusesBadValues) {
  EXPECT_EQ(refuse(CommandKind::ON, {"9"}), "bad_value:relay(1..8)");
  EXPECT_EQ(refuse(CommandKind::OFF, {"0x1"}), "bad_value:relay(1..8)");
  EXPECT_EQ(refuse(CommandKind::PULSE, {"1", "5001"}), "bad_value:duration_ms(1..5000)");
  EXPECT_EQ(refuse(CommandKind::BEEP, {"0"}), "bad_value:duration_ms(1..5000)");
  EXPECT_EQ(refuse(CommandKind::TONE, {"20001", "100"}), "bad_value:freq_hz(50..20000)");
  EXPECT_EQ(refuse(CommandKind::BUZZ, {"loud"}), "bad_value:state(on|off)");
  EXPECT_EQ(refuse(CommandKind::SET, {"1111"}), "bad_value:pattern(8x0|1)");
  EXPECT_EQ(refuse(CommandKind::GET, {"label", "1"}), "bad_value:get(name)");
}

TEST(Encoder, RefusesValuesBeyondIntRange) {
  // 2^32 + 3 and 2^64 + 3: neither may wrap around to relay 3.
  EXPECT_EQ(refuse(CommandKind::ON, {"4294967299"}), "bad_value:relay(1..8)");
  EXPECT_EQ(refuse(CommandKind::ON, {"18446744073709551619"}), "bad_value:relay(1..8)");
  EXPECT_EQ(refuse(CommandKind::OFF, {"-4294967293"}), "bad_value:relay(1..8)");
  EXPECT_EQ(refuse(CommandKind::PULSE, {"4294967299", "100"}), "bad_value:relay(1..8)");
  EXPECT_EQ(refuse(CommandKind::PULSE, {"1", "4294967396"}), "bad_value:duration_ms(1..5000)");
  EXPECT_EQ(refuse(CommandKind::NAME, {"4294967299", "PUMP"}), "bad_value:relay(1..8)");
  EXPECT_EQ(refuse(CommandKind::GET, {"NAME", "4294967299"}), "bad_value:relay(1..8)");
  EXPECT_EQ(refuse(CommandKind::TONE, {"4294967736", "100"}), "bad_value:freq_hz(50..20000)");
}

TEST(Encoder, RefusesNamesTheWireCannotCarry) {
  EXPECT_EQ(refuse(CommandKind::NAME, {"1", ""}), "bad_value:name(empty)");
  EXPECT_EQ(refuse(CommandKind::NAME, {"1", std::string(33, 'a')}), "bad_value:name(<=32)");
  EXPECT_EQ(refuse(CommandKind::NAME, {"1", "two words"}), "bad_value:name(no_space)");
  EXPECT_EQ(refuse(CommandKind::NAME, {"1", "bell\x07"}), "bad_value:name(printable)");
}

TEST(Decoder, ClassifiesResponses) {
  Response ok = decode_response("OK\r\n");
  EXPECT_TRUE(ok.ok);
  EXPECT_TRUE(ok.data.empty());

  Response data = decode_response("  00000101 ");
  EXPECT_TRUE(data.ok);
  EXPECT_EQ(data.data, "00000101");

  Response err = decode_response("ERROR:INVALID_RELAY_NUMBER\n");
  EXPECT_FALSE(err.ok);
  EXPECT_EQ(err.error_code, "INVALID_RELAY_NUMBER");

  Response empty = decode_response("");
  EXPECT_TRUE(empty.ok);
  EXPECT_TRUE(empty.data.empty());
}

TEST(Decoder, ErrorPrefixWithoutCodeIsData) {
  Response bare = decode_response("ERROR:\r\n");
  EXPECT_TRUE(bare.ok);
  EXPECT_EQ(bare.data, "ERROR:");
  EXPECT_TRUE(bare.error_code.empty());

  Response one = decode_response("ERROR:X");
  EXPECT_FALSE(one.ok);
  EXPECT_EQ(one.error_code, "X");
}

TEST(Decoder, StatusUsesMsbForRelayEight) {
  std::map<int, bool> st;
  ASSERT_TRUE(parse_status("10000001", st));
  ASSERT_EQ(st.size(), 8u);
  EXPECT_TRUE(st[1]);
  EXPECT_TRUE(st[8]);
  EXPECT_FALSE(st[2]);

  ASSERT_TRUE(parse_status("00000100", st));
  EXPECT_TRUE(st[3]);
  EXPECT_FALSE(st[1]);

  EXPECT_FALSE(parse_status("0101", st));
  EXPECT_FALSE(parse_status("ERROR:X", st));
}

TEST(Decoder, InfoFields) {
  BoardInfo full = parse_info("WAVESHARE-PICO-RELAY-B,V1.0,8CH,UID:E66038B713849D2F");
  EXPECT_EQ(full.board_name, "WAVESHARE-PICO-RELAY-B");
  EXPECT_EQ(full.version, "V1.0");
  EXPECT_EQ(full.channels, "8CH");
  EXPECT_EQ(full.uid, "E66038B713849D2F");

  BoardInfo partial = parse_info("SOMEBOARD,V2");
  EXPECT_EQ(partial.board_name, "SOMEBOARD");
  EXPECT_EQ(partial.version, "V2");
  EXPECT_TRUE(partial.channels.empty());
  EXPECT_TRUE(partial.uid.empty());
}

TEST(Decoder, HelpList) {
  const std::vector<std::string> names = parse_help("Commands: PING, STATUS,,ON");
  ASSERT_EQ(names.size(), 3u);
  EXPECT_EQ(names[0], "PING");
  EXPECT_EQ(names[1], "STATUS");
  EXPECT_EQ(names[2], "ON");

  EXPECT_EQ(parse_help(help_text()).size(), kCommandKindCount);
  EXPECT_TRUE(parse_help("").empty());
}

TEST(Decoder, Trim) {
  EXPECT_EQ(trim(" \t x y \r\n"), "x y");
  EXPECT_EQ(trim("\r\n"), "");
}
