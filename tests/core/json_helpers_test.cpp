// Tests for core/json_helpers.h -- JsonWriter serialization.

#include "core/json_helpers.h"

#include <gtest/gtest.h>

#include <limits>
#include <optional>
#include <string>

namespace symforge {
namespace {

// ---------------------------------------------------------------------------
// Simple values
// ---------------------------------------------------------------------------

TEST(JsonWriterTest, EmptyObject) {
  JsonWriter writer;
  writer.beginObject();
  writer.endObject();
  EXPECT_EQ(writer.toString(), "{}");
}

TEST(JsonWriterTest, EmptyArray) {
  JsonWriter writer;
  writer.beginArray();
  writer.endArray();
  EXPECT_EQ(writer.toString(), "[]");
}

TEST(JsonWriterTest, FieldsAreCommaSeparated) {
  JsonWriter writer;
  writer.beginObject();
  writer.field("template_name", "Flat_32x32");
  writer.field("width", 32);
  writer.field("is_valid", true);
  writer.endObject();
  EXPECT_EQ(writer.toString(), R"({"template_name":"Flat_32x32","width":32,"is_valid":true})");
}

TEST(JsonWriterTest, OptionalFieldWritesNullWhenEmpty) {
  JsonWriter writer;
  writer.beginObject();
  writer.optionalField("seed", std::optional<int64_t>());
  writer.optionalField("notes", std::optional<std::string>("hello"));
  writer.endObject();
  EXPECT_EQ(writer.toString(), R"({"seed":null,"notes":"hello"})");
}

TEST(JsonWriterTest, DoubleUsesSixSignificantDigits) {
  JsonWriter writer;
  writer.beginArray();
  writer.value(0.5);
  writer.value(23.828125);
  writer.endArray();
  EXPECT_EQ(writer.toString(), "[0.5,23.8281]");
}

// ---------------------------------------------------------------------------
// Nesting
// ---------------------------------------------------------------------------

TEST(JsonWriterTest, NestedObjectAndArray) {
  JsonWriter writer;
  writer.beginObject();
  writer.key("provenance");
  writer.beginObject();
  writer.field("method", "Binarized");
  writer.endObject();
  writer.key("results");
  writer.beginArray();
  writer.beginObject();
  writer.field("validator", "Density Validator");
  writer.endObject();
  writer.beginObject();
  writer.field("validator", "Contrast Validator");
  writer.endObject();
  writer.endArray();
  writer.endObject();
  EXPECT_EQ(writer.toString(),
            R"({"provenance":{"method":"Binarized"},"results":[{"validator":"Density Validator"},)"
            R"({"validator":"Contrast Validator"}]})");
}

// ---------------------------------------------------------------------------
// Escaping
// ---------------------------------------------------------------------------

TEST(JsonWriterTest, EscapesQuotesBackslashAndControl) {
  JsonWriter writer;
  writer.beginObject();
  writer.field("note", std::string("a\"b\\c\nd\x01"));
  writer.endObject();
  EXPECT_EQ(writer.toString(), R"({"note":"a\"b\\c\nd\u0001"})");
}

// ---------------------------------------------------------------------------
// Pretty-print
// ---------------------------------------------------------------------------

TEST(JsonWriterTest, PrettyPrintIndentsNestedValues) {
  JsonWriter writer;
  writer.beginObject();
  writer.field("width", 32);
  writer.key("inner");
  writer.beginObject();
  writer.field("ok", true);
  writer.endObject();
  writer.endObject();

  std::string expected =
      "{\n"
      "  \"width\": 32,\n"
      "  \"inner\": {\n"
      "    \"ok\": true\n"
      "  }\n"
      "}";
  EXPECT_EQ(writer.toPrettyString(2), expected);
}

TEST(JsonWriterTest, PrettyPrintKeepsEmptyContainersCompact) {
  JsonWriter writer;
  writer.beginObject();
  writer.key("results");
  writer.beginArray();
  writer.endArray();
  writer.endObject();
  EXPECT_EQ(writer.toPrettyString(), "{\n  \"results\": []\n}");
}

TEST(JsonWriterTest, PrettyPrintLeavesStringContentsAlone) {
  JsonWriter writer;
  writer.beginObject();
  writer.field("lineage", "Flat:a -> Flat:b, {x}");
  writer.endObject();
  EXPECT_NE(writer.toPrettyString().find("\"Flat:a -> Flat:b, {x}\""), std::string::npos);
}

// ---------------------------------------------------------------------------
// Special double values
// ---------------------------------------------------------------------------

TEST(JsonWriterTest, NanAndInfBecomeNull) {
  JsonWriter writer;
  writer.beginArray();
  writer.value(std::numeric_limits<double>::quiet_NaN());
  writer.value(std::numeric_limits<double>::infinity());
  writer.endArray();
  EXPECT_EQ(writer.toString(), "[null,null]");
}

}  // namespace
}  // namespace symforge
