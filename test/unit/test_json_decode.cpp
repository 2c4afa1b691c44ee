#include "verity/core/serde.hpp"

#include <gtest/gtest.h>

#include <string>

using namespace verity;
using namespace verity::serde;

TEST(JsonDecodeTest, ParsesNestedDocument) {
    auto doc = decode_json(R"({"a": [1, -2, 3.5, true, null], "b": {"c": "d"}})");
    ASSERT_TRUE(doc.has_value());
    const auto& a = doc->find("a")->as_array();
    ASSERT_EQ(a.size(), 5u);
    EXPECT_EQ(a[0].type(), json_value::kind::integer);
    EXPECT_EQ(a[1].as_int64(), -2);
    EXPECT_DOUBLE_EQ(a[2].as_double(), 3.5);
    EXPECT_TRUE(a[3].as_bool());
    EXPECT_TRUE(a[4].is_null());
    EXPECT_EQ(doc->find("b")->find("c")->as_string(), "d");
}

TEST(JsonDecodeTest, LargeIntegersKeepPrecision) {
    auto big = decode_json("18446744073709551615");
    ASSERT_TRUE(big.has_value());
    EXPECT_EQ(big->type(), json_value::kind::unsigned_integer);
    EXPECT_EQ(big->as_uint64(), 18446744073709551615ULL);

    auto huge = decode_json("123456789012345678901234567890");
    ASSERT_TRUE(huge.has_value());
    EXPECT_EQ(huge->type(), json_value::kind::number);
}

TEST(JsonDecodeTest, UnicodeEscapes) {
    auto doc = decode_json(R"("caf\u00e9 \ud83d\ude00")");
    ASSERT_TRUE(doc.has_value());
    EXPECT_EQ(doc->as_string(), "caf\xC3\xA9 \xF0\x9F\x98\x80");
}

TEST(JsonDecodeTest, RejectsUnpairedSurrogate) {
    auto doc = decode_json(R"("\ud83d")");
    ASSERT_FALSE(doc.has_value());
    EXPECT_EQ(doc.error().reason, "unpaired surrogate");
}

TEST(JsonDecodeTest, RejectsTrailingCharacters) {
    auto doc = decode_json(R"({"a": 1} x)");
    ASSERT_FALSE(doc.has_value());
    EXPECT_EQ(doc.error().offset, 9u);
}

TEST(JsonDecodeTest, RejectsMalformedInput) {
    EXPECT_FALSE(decode_json("").has_value());
    EXPECT_FALSE(decode_json("{").has_value());
    EXPECT_FALSE(decode_json("[1,]").has_value());
    EXPECT_FALSE(decode_json("{\"a\" 1}").has_value());
    EXPECT_FALSE(decode_json("01").has_value());
    EXPECT_FALSE(decode_json("1.").has_value());
    EXPECT_FALSE(decode_json("tru").has_value());
    EXPECT_FALSE(decode_json("\"tab\there\"").has_value());
}

TEST(JsonDecodeTest, DepthLimit) {
    std::string deep(10, '[');
    deep.append(10, ']');
    EXPECT_TRUE(decode_json(deep, decode_limits{16}).has_value());

    auto limited = decode_json(deep, decode_limits{4});
    ASSERT_FALSE(limited.has_value());
    EXPECT_EQ(limited.error().reason, "nesting depth limit exceeded");
}

TEST(JsonDecodeTest, DuplicateKeysLastWins) {
    auto doc = decode_json(R"({"a": 1, "a": 2})");
    ASSERT_TRUE(doc.has_value());
    EXPECT_EQ(doc->size(), 1u);
    EXPECT_EQ(doc->find("a")->as_int64(), 2);
}

TEST(JsonDecodeTest, SerializationRoundTripsStructure) {
    const std::string text = R"({"name":"x","tags":["a","b"],"n":-7,"f":0.25,"ok":false})";
    auto doc = decode_json(text);
    ASSERT_TRUE(doc.has_value());
    EXPECT_EQ(to_string(*doc), text);
}
