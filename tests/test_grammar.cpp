// test_grammar.cpp — command table, value checks and validation order.

#include <gtest/gtest.h>

#include "relay_dispatch.hpp"   // tokenize
#include "relay_grammar.hpp"

using namespace picorelay;

namespace {

bool validate(const std::string& line, Command& cmd, ErrorCode& err) {
  return validate_tokens(tokenize(line), cmd, err);
}

ErrorCode reject(const std::string& line) {
  Command cmd;
  ErrorCode err = ErrorCode::INVALID_COMMAND;
  EXPECT_FALSE(validate(line, cmd, err)) << line;
  return err;
}

Command accept(const std::string& line) {
  Command cmd;
  ErrorCode err = ErrorCode::INVALID_COMMAND;
  EXPECT_TRUE(validate(line, cmd, err)) << line << " -> " << error_code_name(err);
  return cmd;
}

} // namespace

TEST(Grammar, CommandNamesRoundTripCaseInsensitive) {
  for (size_t i = 0; i < kCommandKindCount; ++i) {
    const CommandKind k = static_cast<CommandKind>(i);
    CommandKind back;
    ASSERT_TRUE(command_from_name(command_name(k), back));
    EXPECT_EQ(back, k);
  }
  CommandKind k;
  ASSERT_TRUE(command_from_name("pulse", k));
  EXPECT_EQ(k, CommandKind::PULSE);
  EXPECT_FALSE(command_from_name("PINGX", k));
  EXPECT_FALSE(command_from_name("", k));
}

TEST(Grammar, HelpListsEveryCommandInOrder) {
  EXPECT_EQ(help_text(),
            "Commands: PING,STATUS,ON,OFF,ALL,SET,PULSE,INFO,UID,NAME,GET,"
            "BEEP,BUZZ,TONE,VERSION,HELP,SAVE,LOAD,CLEAR");
}

TEST(Grammar, ErrorCodeNames) {
  EXPECT_STREQ(error_code_name(ErrorCode::INVALID_PARAMETER_COUNT), "INVALID_PARAMETER_COUNT");
  EXPECT_STREQ(error_code_name(ErrorCode::NO_SAVED_STATE), "NO_SAVED_STATE");
  ErrorCode c;
  ASSERT_TRUE(error_code_from_name("CLEAR_FAILED", c));
  EXPECT_EQ(c, ErrorCode::CLEAR_FAILED);
  EXPECT_FALSE(error_code_from_name("clear_failed", c));
  EXPECT_FALSE(error_code_from_name("BOGUS", c));
}

TEST(Grammar, Arity) {
  EXPECT_EQ(command_arity(CommandKind::PING).max, 0);
  EXPECT_EQ(command_arity(CommandKind::NAME).min, 1);
  EXPECT_EQ(command_arity(CommandKind::NAME).max, 2);
  EXPECT_EQ(command_arity(CommandKind::BEEP).min, 0);
  EXPECT_EQ(command_arity(CommandKind::BEEP).max, 1);
  EXPECT_EQ(command_arity(CommandKind::TONE).min, 2);
}

TEST(Grammar, ParseIntAcceptsSignsAndLeadingZeros) {
  int32_t v = 0;
  ASSERT_TRUE(parse_int("007", v));
  EXPECT_EQ(v, 7);
  ASSERT_TRUE(parse_int("+3", v));
  EXPECT_EQ(v, 3);
  ASSERT_TRUE(parse_int("-1", v));
  EXPECT_EQ(v, -1);
  ASSERT_TRUE(parse_int("99999999999999", v));
  EXPECT_EQ(v, INT32_MAX);
  EXPECT_FALSE(parse_int("", v));
  EXPECT_FALSE(parse_int("-", v));
  EXPECT_FALSE(parse_int("1.5", v));
  EXPECT_FALSE(parse_int("0x10", v));
  EXPECT_FALSE(parse_int("abc", v));
}

TEST(Grammar, RangeChecks) {
  EXPECT_TRUE(is_valid_relay(1));
  EXPECT_TRUE(is_valid_relay(8));
  EXPECT_FALSE(is_valid_relay(0));
  EXPECT_FALSE(is_valid_relay(9));
  EXPECT_TRUE(is_valid_duration(5000));
  EXPECT_FALSE(is_valid_duration(5001));
  EXPECT_FALSE(is_valid_duration(0));
  EXPECT_TRUE(is_valid_frequency(50));
  EXPECT_TRUE(is_valid_frequency(20000));
  EXPECT_FALSE(is_valid_frequency(49));
  EXPECT_FALSE(is_valid_frequency(20001));
  EXPECT_TRUE(is_binary_pattern("10100000"));
  EXPECT_FALSE(is_binary_pattern("1010000"));
  EXPECT_FALSE(is_binary_pattern("10100002"));
  EXPECT_TRUE(is_valid_name_length(std::string(32, 'A')));
  EXPECT_FALSE(is_valid_name_length(std::string(33, 'A')));
  EXPECT_EQ(reverse_pattern("10000000"), "00000001");
}

TEST(Grammar, UnknownOrEmptyIsInvalidCommand) {
  EXPECT_EQ(reject(""), ErrorCode::INVALID_COMMAND);
  EXPECT_EQ(reject("FOO"), ErrorCode::INVALID_COMMAND);
  EXPECT_EQ(reject("FOO 1 2 3"), ErrorCode::INVALID_COMMAND);
}

TEST(Grammar, CountIsCheckedBeforeValues) {
  EXPECT_EQ(reject("ON"), ErrorCode::INVALID_PARAMETER_COUNT);
  EXPECT_EQ(reject("ON 99 1"), ErrorCode::INVALID_PARAMETER_COUNT);
  EXPECT_EQ(reject("PING 1"), ErrorCode::INVALID_PARAMETER_COUNT);
  EXPECT_EQ(reject("PULSE 1"), ErrorCode::INVALID_PARAMETER_COUNT);
  EXPECT_EQ(reject("NAME 1 A B"), ErrorCode::INVALID_PARAMETER_COUNT);
  EXPECT_EQ(reject("BEEP 1 2"), ErrorCode::INVALID_PARAMETER_COUNT);
  EXPECT_EQ(reject("GET NAME"), ErrorCode::INVALID_PARAMETER_COUNT);
}

TEST(Grammar, RelayErrors) {
  EXPECT_EQ(reject("ON 0"), ErrorCode::INVALID_RELAY_NUMBER);
  EXPECT_EQ(reject("ON 9"), ErrorCode::INVALID_RELAY_NUMBER);
  EXPECT_EQ(reject("OFF X"), ErrorCode::INVALID_RELAY_NUMBER);
  EXPECT_EQ(reject("NAME 9 FOO"), ErrorCode::INVALID_RELAY_NUMBER);
  EXPECT_EQ(reject("GET NAME 0"), ErrorCode::INVALID_RELAY_NUMBER);
}

TEST(Grammar, PulseSplitsMalformedFromOutOfRange) {
  EXPECT_EQ(reject("PULSE X 100"), ErrorCode::INVALID_PARAMETER);
  EXPECT_EQ(reject("PULSE 9 100"), ErrorCode::INVALID_RELAY_NUMBER);
  EXPECT_EQ(reject("PULSE 1 0"), ErrorCode::INVALID_PARAMETER);
  EXPECT_EQ(reject("PULSE 1 5001"), ErrorCode::INVALID_PARAMETER);
  EXPECT_EQ(reject("PULSE 1 FAST"), ErrorCode::INVALID_PARAMETER);

  const Command c = accept("PULSE 3 5000");
  EXPECT_EQ(c.kind, CommandKind::PULSE);
  EXPECT_EQ(c.relay, 3);
  EXPECT_EQ(c.duration_ms, 5000);
}

TEST(Grammar, KeywordAndPatternParameters) {
  EXPECT_EQ(reject("ALL MAYBE"), ErrorCode::INVALID_PARAMETER);
  EXPECT_EQ(reject("BUZZ 1"), ErrorCode::INVALID_PARAMETER);
  EXPECT_EQ(reject("SET 1010"), ErrorCode::INVALID_PARAMETER);
  EXPECT_EQ(reject("SET 1010101X"), ErrorCode::INVALID_PARAMETER);
  EXPECT_EQ(reject("GET LABEL 1"), ErrorCode::INVALID_PARAMETER);

  EXPECT_TRUE(accept("ALL on").on);
  EXPECT_FALSE(accept("BUZZ OFF").on);
  EXPECT_EQ(accept("SET 10000001").pattern, "10000001");
}

TEST(Grammar, BeepAndTone) {
  EXPECT_EQ(accept("BEEP").duration_ms, kDefaultBeepMs);
  EXPECT_EQ(accept("BEEP 250").duration_ms, 250);
  EXPECT_EQ(reject("BEEP 0"), ErrorCode::INVALID_PARAMETER);

  const Command t = accept("TONE 440 300");
  EXPECT_EQ(t.freq_hz, 440);
  EXPECT_EQ(t.duration_ms, 300);
  EXPECT_EQ(reject("TONE 49 300"), ErrorCode::INVALID_PARAMETER);
  EXPECT_EQ(reject("TONE 440 5001"), ErrorCode::INVALID_PARAMETER);
  EXPECT_EQ(reject("TONE A 300"), ErrorCode::INVALID_PARAMETER);
}

TEST(Grammar, NameSetAndClear) {
  const Command set = accept("NAME 2 PUMP");
  EXPECT_TRUE(set.has_name);
  EXPECT_EQ(set.relay, 2);
  EXPECT_EQ(set.name, "PUMP");

  const Command clear = accept("NAME 2");
  EXPECT_FALSE(clear.has_name);

  EXPECT_TRUE(accept("NAME 1 " + std::string(32, 'N')).has_name);
  EXPECT_EQ(reject("NAME 1 " + std::string(33, 'N')), ErrorCode::INVALID_PARAMETER);
}
