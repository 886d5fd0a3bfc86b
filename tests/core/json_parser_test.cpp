// Tests for core/json_parser.h -- flat-object JSON parsing.

#include "core/json_parser.h"

#include <gtest/gtest.h>

#include <string>

namespace satb {
namespace {

TEST(JsonParserTest, ParsesScalars) {
  auto result = parseJsonObject(
      R"({"key": "C_major", "verbose": true, "pretty": false, "count": 4, "none": null})");
  ASSERT_TRUE(result.ok) << result.error;
  EXPECT_EQ(result.values["key"].asString(), "C_major");
  EXPECT_TRUE(result.values["verbose"].asBool());
  EXPECT_FALSE(result.values["pretty"].asBool(true));
  EXPECT_EQ(result.values["count"].asInt(), 4);
  EXPECT_EQ(result.values["none"].type, JsonValue::Null);
}

TEST(JsonParserTest, ParsesStringArrays) {
  auto result = parseJsonObject(R"({"chords": ["F4 D4 B3 G2", "E4 C4 C4 C3"]})");
  ASSERT_TRUE(result.ok) << result.error;
  const JsonValue& chords = result.values["chords"];
  ASSERT_EQ(chords.type, JsonValue::Array);
  auto list = chords.asStringList();
  ASSERT_EQ(list.size(), 2u);
  EXPECT_EQ(list[0], "F4 D4 B3 G2");
  EXPECT_EQ(list[1], "E4 C4 C4 C3");
}

TEST(JsonParserTest, StringListFromPlainString) {
  auto result = parseJsonObject(R"({"disabled_rules": "voice_overlap"})");
  ASSERT_TRUE(result.ok);
  auto list = result.values["disabled_rules"].asStringList();
  ASSERT_EQ(list.size(), 1u);
  EXPECT_EQ(list[0], "voice_overlap");
}

TEST(JsonParserTest, EmptyObjectAndEmptyArray) {
  auto empty = parseJsonObject("{}");
  EXPECT_TRUE(empty.ok);
  EXPECT_TRUE(empty.values.empty());

  auto with_array = parseJsonObject(R"({"chords": []})");
  ASSERT_TRUE(with_array.ok);
  EXPECT_TRUE(with_array.values["chords"].asStringList().empty());
}

TEST(JsonParserTest, SkipsNestedObjects) {
  auto result = parseJsonObject(R"({"meta": {"a": "}"}, "key": "G_major"})");
  ASSERT_TRUE(result.ok) << result.error;
  EXPECT_EQ(result.values.count("meta"), 0u);
  EXPECT_EQ(result.values["key"].asString(), "G_major");
}

TEST(JsonParserTest, HandlesEscapes) {
  auto result = parseJsonObject(R"({"text": "a\"b\\c"})");
  ASSERT_TRUE(result.ok);
  EXPECT_EQ(result.values["text"].asString(), "a\"b\\c");
}

TEST(JsonParserTest, DefaultsOnTypeMismatch) {
  auto result = parseJsonObject(R"({"verbose": "yes"})");
  ASSERT_TRUE(result.ok);
  EXPECT_TRUE(result.values["verbose"].asBool(true));
  EXPECT_EQ(result.values["verbose"].asInt(7), 7);
}

TEST(JsonParserTest, RejectsMalformedInput) {
  EXPECT_FALSE(parseJsonObject("").ok);
  EXPECT_FALSE(parseJsonObject("[1, 2]").ok);
  EXPECT_FALSE(parseJsonObject(R"({"key" "C_major"})").ok);
  EXPECT_FALSE(parseJsonObject(R"({"key": "C_major")").ok);
  EXPECT_FALSE(parseJsonObject(R"({"key": tru})").ok);

  auto result = parseJsonObject(R"({"key": })");
  EXPECT_FALSE(result.ok);
  EXPECT_FALSE(result.error.empty());
}

}  // namespace
}  // namespace satb
