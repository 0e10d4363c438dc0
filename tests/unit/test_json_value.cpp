#include <gtest/gtest.h>
#include "config/json_value.hpp"

#include <limits>

using namespace ramm;

TEST(JsonValueTest, ParsesNestedDocument) {
    auto v = parse_json(R"({"a": 1.5, "b": {"c": [1, 2, 3]}, "d": "x", "e": true, "f": null})");
    ASSERT_TRUE(v.is_object());
    EXPECT_DOUBLE_EQ(v.get_number("a"), 1.5);

    const JsonValue* b = v.get_object("b");
    ASSERT_NE(b, nullptr);
    const JsonValue* c = b->get_array("c");
    ASSERT_NE(c, nullptr);
    ASSERT_EQ(c->arr.size(), 3u);
    EXPECT_DOUBLE_EQ(c->arr[2].number, 3.0);

    EXPECT_EQ(v.get_string("d"), "x");
    EXPECT_TRUE(v.get_bool("e"));
    ASSERT_TRUE(v.contains("f"));
    EXPECT_TRUE(v.find("f")->is_null());
}

TEST(JsonValueTest, AccessorsFallBackOnMissingOrMistyped) {
    auto v = parse_json(R"({"n": "not a number", "s": 3})");
    EXPECT_DOUBLE_EQ(v.get_number("n", 7.0), 7.0);
    EXPECT_EQ(v.get_string("s", "def"), "def");
    EXPECT_EQ(v.get_int("missing", 42), 42);
    EXPECT_EQ(v.get_object("s"), nullptr);
}

TEST(JsonValueTest, GetIntRoundsToNearest) {
    auto v = parse_json(R"({"q": 199.6, "neg": -2.5})");
    EXPECT_EQ(v.get_int("q"), 200);
    EXPECT_EQ(v.get_int("neg"), -3);
}

TEST(JsonValueTest, ParsesStringEscapes) {
    auto v = parse_json(R"({"s": "a\"b\\c\ndA"})");
    EXPECT_EQ(v.get_string("s"), "a\"b\\c\ndA");
}

TEST(JsonValueTest, ParsesNumbersWithExponent) {
    auto v = parse_json(R"([-1.25e2, 0, 3E-1])");
    ASSERT_TRUE(v.is_array());
    EXPECT_DOUBLE_EQ(v.arr[0].number, -125.0);
    EXPECT_DOUBLE_EQ(v.arr[1].number, 0.0);
    EXPECT_DOUBLE_EQ(v.arr[2].number, 0.3);
}

TEST(JsonValueTest, RejectsMalformedInput) {
    EXPECT_THROW(parse_json(""), ParseError);
    EXPECT_THROW(parse_json("{"), ParseError);
    EXPECT_THROW(parse_json(R"({"a" 1})"), ParseError);
    EXPECT_THROW(parse_json(R"({"a": 1,})"), ParseError);
    EXPECT_THROW(parse_json(R"({"a": 1} trailing)"), ParseError);
    EXPECT_THROW(parse_json("[1, 2"), ParseError);
    EXPECT_THROW(parse_json("nul"), ParseError);
}

TEST(JsonValueTest, WritesCompactOrderedObjects) {
    JsonValue v = JsonValue::make_object();
    v.set("order_id", JsonValue::make_string("ORD_1"));
    v.set("price", JsonValue::make_number(100.1));
    v.set("qty", JsonValue::make_number(200));
    v.set("tags", JsonValue::make_array());
    EXPECT_EQ(to_json(v), R"({"order_id":"ORD_1","price":100.1,"qty":200,"tags":[]})");
}

TEST(JsonValueTest, SetReplacesExistingKeyInPlace) {
    JsonValue v = JsonValue::make_object();
    v.set("a", JsonValue::make_number(1));
    v.set("b", JsonValue::make_number(2));
    v.set("a", JsonValue::make_number(3));
    EXPECT_EQ(to_json(v), R"({"a":3,"b":2})");
}

TEST(JsonValueTest, NonFiniteNumbersWrittenAsNull) {
    JsonValue v = JsonValue::make_array();
    v.push(JsonValue::make_number(std::numeric_limits<double>::quiet_NaN()));
    v.push(JsonValue::make_number(std::numeric_limits<double>::infinity()));
    EXPECT_EQ(to_json(v), "[null,null]");
}

TEST(JsonValueTest, EscapesControlCharactersOnWrite) {
    JsonValue v = JsonValue::make_string("line1\nline2\t\"q\"");
    std::string out = to_json(v);
    EXPECT_EQ(out, R"("line1\nline2\t\"q\"")");
    EXPECT_EQ(parse_json(out).str, "line1\nline2\t\"q\"");
}
