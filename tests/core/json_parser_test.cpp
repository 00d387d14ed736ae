// Tests for core/json_parser.h -- flat JSON object parsing.

#include "core/json_parser.h"

#include <gtest/gtest.h>

#include <map>
#include <string>

namespace symforge {
namespace {

TEST(JsonParserTest, ParsesScalarTypes) {
  std::map<std::string, JsonValue> values;
  std::string error;
  ASSERT_TRUE(parseFlatJsonObject(
      R"({"name": "assets", "min": 0.05, "margin": -3, "verbose": true, "x": null})", values,
      error))
      << error;

  ASSERT_EQ(values.size(), 5u);
  EXPECT_TRUE(values["name"].isString());
  EXPECT_EQ(values["name"].string_val, "assets");
  EXPECT_TRUE(values["min"].isNumber());
  EXPECT_DOUBLE_EQ(values["min"].number_val, 0.05);
  EXPECT_DOUBLE_EQ(values["margin"].number_val, -3.0);
  EXPECT_TRUE(values["verbose"].isBool());
  EXPECT_TRUE(values["verbose"].bool_val);
  EXPECT_EQ(values["x"].type, JsonValue::Null);
}

TEST(JsonParserTest, EmptyObject) {
  std::map<std::string, JsonValue> values;
  std::string error;
  EXPECT_TRUE(parseFlatJsonObject("  { }  ", values, error));
  EXPECT_TRUE(values.empty());
}

TEST(JsonParserTest, UnescapesStrings) {
  std::map<std::string, JsonValue> values;
  std::string error;
  ASSERT_TRUE(parseFlatJsonObject(R"({"path": "a\\b\"c\n"})", values, error));
  EXPECT_EQ(values["path"].string_val, "a\\b\"c\n");
}

TEST(JsonParserTest, SkipsNestedContainers) {
  std::map<std::string, JsonValue> values;
  std::string error;
  ASSERT_TRUE(parseFlatJsonObject(R"({"list": [1, "]", {"a": 2}], "after": 7})", values,
                                  error))
      << error;
  EXPECT_EQ(values.count("list"), 0u);
  EXPECT_DOUBLE_EQ(values["after"].number_val, 7.0);
}

TEST(JsonParserTest, RejectsMalformedInput) {
  std::map<std::string, JsonValue> values;
  std::string error;
  EXPECT_FALSE(parseFlatJsonObject("[1, 2]", values, error));
  EXPECT_FALSE(error.empty());

  error.clear();
  EXPECT_FALSE(parseFlatJsonObject(R"({"a": 1 "b": 2})", values, error));
  EXPECT_FALSE(error.empty());

  error.clear();
  EXPECT_FALSE(parseFlatJsonObject(R"({"a": tru})", values, error));
  EXPECT_FALSE(error.empty());

  error.clear();
  EXPECT_FALSE(parseFlatJsonObject(R"({"a": 1)", values, error));
  EXPECT_FALSE(error.empty());
}

}  // namespace
}  // namespace symforge
