// test_config_json.cpp — persisted document layout and decode tolerance.

#include <gtest/gtest.h>

#include "config_json.hpp"

using namespace picorelay;

TEST(ConfigJson, EncodeThenDecodeKeepsEveryField) {
  RelayConfig cfg = make_default_config(1234);
  cfg.names[0] = "PUMP";
  cfg.names[7] = "";
  cfg.states[2] = 1;
  cfg.auto_load = false;
  cfg.settings.has_last_saved = true;
  cfg.settings.last_saved = 99000;

  std::string text;
  ASSERT_TRUE(encode_config(cfg, text));

  RelayConfig back;
  ASSERT_TRUE(decode_config(text, back));
  EXPECT_EQ(back.names[0], "PUMP");
  EXPECT_EQ(back.names[1], "Relay 2");
  EXPECT_EQ(back.names[7], "");
  EXPECT_EQ(back.states[2], 1);
  EXPECT_EQ(back.states[0], 0);
  EXPECT_FALSE(back.auto_load);
  EXPECT_EQ(back.settings.created_time, 1234u);
  EXPECT_TRUE(back.settings.has_last_saved);
  EXPECT_EQ(back.settings.last_saved, 99000u);
}

TEST(ConfigJson, NoSnapshotOmitsLastSaved) {
  std::string text;
  ASSERT_TRUE(encode_config(make_default_config(0), text));
  EXPECT_EQ(text.find("last_saved"), std::string::npos);
  EXPECT_NE(text.find("\"auto_load\":true"), std::string::npos);
}

TEST(ConfigJson, MissingMembersTakeDefaults) {
  RelayConfig cfg;
  ASSERT_TRUE(decode_config("{\"names\":{\"3\":\"FAN\"},\"states\":{\"3\":true}}", cfg));
  EXPECT_EQ(cfg.names[2], "FAN");
  EXPECT_EQ(cfg.names[0], "Relay 1");
  EXPECT_EQ(cfg.states[2], 1);
  EXPECT_TRUE(cfg.auto_load);
  EXPECT_FALSE(cfg.settings.has_last_saved);
}

TEST(ConfigJson, RejectsMalformedDocuments) {
  RelayConfig cfg;
  EXPECT_FALSE(decode_config("", cfg));
  EXPECT_FALSE(decode_config("not json", cfg));
  EXPECT_FALSE(decode_config("[1,2,3]", cfg));
  EXPECT_FALSE(decode_config("{\"names\":[]}", cfg));
  EXPECT_FALSE(decode_config("{\"names\":{\"1\":5}}", cfg));
  EXPECT_FALSE(decode_config("{\"states\":{\"1\":\"on\"}}", cfg));
  EXPECT_FALSE(decode_config("{\"auto_load\":\"yes\"}", cfg));
  EXPECT_FALSE(decode_config("{\"settings\":{\"last_saved\":\"never\"}}", cfg));
  EXPECT_FALSE(decode_config("{\"names\":{\"1\":\"" + std::string(33, 'N') + "\"}}", cfg));
}
