#include "support/fixtures.hpp"
#include "verity/core/descriptor.hpp"
#include "verity/core/json_schema.hpp"
#include "verity/core/serde.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace verity;

namespace {

json_value parse(std::string_view text) {
    auto doc = serde::decode_json(text);
    EXPECT_TRUE(doc.has_value()) << text;
    return doc.value_or(json_value{});
}

compiled_schema compile(std::string_view text) {
    auto schema = compiled_schema::compile(parse(text));
    EXPECT_TRUE(schema.has_value());
    return schema ? *schema : compiled_schema::accept_all();
}

std::vector<schema_violation> violations(const compiled_schema& s, std::string_view instance) {
    auto r = s.check(parse(instance));
    return r ? std::vector<schema_violation>{} : r.error();
}

} // namespace

TEST(JsonSchemaTest, TypeMismatchStopsFurtherChecks) {
    auto s = compile(R"({"type":"integer","minimum":10})");
    auto v = violations(s, R"("12")");
    ASSERT_EQ(v.size(), 1u);
    EXPECT_EQ(v[0].instance_path, "");
    EXPECT_EQ(v[0].description, R"("12" is not of type "integer")");

    auto nullable = compile(R"({"type":["string","null"]})");
    EXPECT_TRUE(nullable.accepts(parse("null")));
    auto bad = violations(nullable, "3");
    ASSERT_EQ(bad.size(), 1u);
    EXPECT_EQ(bad[0].description, R"(3 is not of types "string", "null")");
}

TEST(JsonSchemaTest, IntegerAcceptsIntegralNumbers) {
    auto s = compile(R"({"type":"integer"})");
    EXPECT_TRUE(s.accepts(parse("5.0")));
    EXPECT_TRUE(s.accepts(parse("18446744073709551615")));
    EXPECT_FALSE(s.accepts(parse("5.5")));
}

TEST(JsonSchemaTest, NumericBounds) {
    auto s = compile(R"({"minimum":0,"maximum":100,"multipleOf":5})");
    EXPECT_TRUE(s.accepts(parse("0")));
    EXPECT_TRUE(s.accepts(parse("100")));

    auto v = violations(s, "103");
    ASSERT_EQ(v.size(), 2u);
    EXPECT_EQ(v[0].description, "103 is greater than the maximum of 100");
    EXPECT_EQ(v[1].description, "103 is not a multiple of 5");

    auto low = violations(s, "-5");
    ASSERT_EQ(low.size(), 1u);
    EXPECT_EQ(low[0].description, "-5 is less than the minimum of 0");

    auto exclusive = compile(R"({"exclusiveMinimum":0,"exclusiveMaximum":1})");
    EXPECT_TRUE(exclusive.accepts(parse("0.5")));
    auto edge = violations(exclusive, "0");
    ASSERT_EQ(edge.size(), 1u);
    EXPECT_EQ(edge[0].description, "0 is less than or equal to the minimum of 0");
}

TEST(JsonSchemaTest, LargeUnsignedComparesExactly) {
    auto s = compile(R"({"maximum":18446744073709551614})");
    EXPECT_TRUE(s.accepts(parse("18446744073709551614")));
    EXPECT_FALSE(s.accepts(parse("18446744073709551615")));
    EXPECT_TRUE(s.accepts(parse("-1")));
}

TEST(JsonSchemaTest, StringKeywords) {
    auto s = compile(R"({"type":"string","minLength":2,"maxLength":4,"pattern":"^[a-z]+$"})");
    EXPECT_TRUE(s.accepts(parse(R"("abc")")));

    auto v = violations(s, R"("A")");
    ASSERT_EQ(v.size(), 2u);
    EXPECT_EQ(v[0].description, R"("A" is shorter than 2 characters)");
    EXPECT_EQ(v[1].description, R"("A" does not match "^[a-z]+$")");

    auto single = compile(R"({"maxLength":1})");
    auto longer = violations(single, R"("ab")");
    ASSERT_EQ(longer.size(), 1u);
    EXPECT_EQ(longer[0].description, R"("ab" is longer than 1 character)");
}

TEST(JsonSchemaTest, PatternSearchesUnlessAnchored) {
    auto s = compile(R"({"pattern":"[0-9]"})");
    EXPECT_TRUE(s.accepts(parse(R"("abc1")")));
    EXPECT_FALSE(s.accepts(parse(R"("abc")")));
    EXPECT_TRUE(s.accepts(parse("12")));
}

TEST(JsonSchemaTest, ArrayKeywordsAndItemPaths) {
    auto s = compile(R"({"type":"array","maxItems":3,"uniqueItems":true,"items":{"type":"integer"}})");
    auto v = violations(s, R"([1,"x",1,2])");
    ASSERT_EQ(v.size(), 3u);
    EXPECT_EQ(v[0].description, R"([1,"x",1,2] has more than 3 items)");
    EXPECT_EQ(v[1].description, R"([1,"x",1,2] has non-unique elements)");
    EXPECT_EQ(v[2].instance_path, "/1");
    EXPECT_EQ(v[2].description, R"("x" is not of type "integer")");

    auto min = compile(R"({"minItems":1})");
    auto empty = violations(min, "[]");
    ASSERT_EQ(empty.size(), 1u);
    EXPECT_EQ(empty[0].description, "[] has less than 1 item");
}

TEST(JsonSchemaTest, UniquenessComparesNumbersByValue) {
    auto s = compile(R"({"uniqueItems":true})");
    EXPECT_FALSE(s.accepts(parse("[1, 1.0]")));
    EXPECT_FALSE(s.accepts(parse(R"([{"a":1,"b":2},{"b":2,"a":1}])")));
    EXPECT_TRUE(s.accepts(parse(R"([[1],[2]])")));
}

TEST(JsonSchemaTest, ObjectKeywords) {
    auto s = compile(R"({"type":"object","properties":{"a/b":{"type":"string"}},"required":["a/b","c"],)"
                     R"("maxProperties":1})");
    auto v = violations(s, R"({"a/b":1,"d":true})");
    ASSERT_EQ(v.size(), 3u);
    EXPECT_EQ(v[0].description, R"("c" is a required property)");
    EXPECT_EQ(v[1].description, R"({"a/b":1,"d":true} has more than 1 property)");
    EXPECT_EQ(v[2].instance_path, "/a~1b");
    EXPECT_EQ(v[2].description, R"(1 is not of type "string")");
}

TEST(JsonSchemaTest, AdditionalProperties) {
    auto closed = compile(R"({"properties":{"x":{}},"additionalProperties":false})");
    EXPECT_TRUE(closed.accepts(parse(R"({"x":1})")));
    auto one = violations(closed, R"({"x":1,"y":2})");
    ASSERT_EQ(one.size(), 1u);
    EXPECT_EQ(one[0].description, "Additional properties are not allowed ('y' was unexpected)");
    auto two = violations(closed, R"({"y":2,"z":3})");
    ASSERT_EQ(two.size(), 1u);
    EXPECT_EQ(two[0].description, "Additional properties are not allowed ('y', 'z' were unexpected)");

    auto typed = compile(R"({"additionalProperties":{"type":"integer","minimum":0}})");
    auto v = violations(typed, R"({"a":1,"b":-1})");
    ASSERT_EQ(v.size(), 1u);
    EXPECT_EQ(v[0].instance_path, "/b");
}

TEST(JsonSchemaTest, EnumConstAndBooleanSchemas) {
    auto e = compile(R"({"enum":["a",1,null]})");
    EXPECT_TRUE(e.accepts(parse("1.0")));
    auto v = violations(e, R"("b")");
    ASSERT_EQ(v.size(), 1u);
    EXPECT_EQ(v[0].description, R"("b" is not one of ["a",1,null])");

    auto c = compile(R"({"const":{"k":true}})");
    auto cv = violations(c, "{}");
    ASSERT_EQ(cv.size(), 1u);
    EXPECT_EQ(cv[0].description, R"({"k":true} was expected)");

    auto never = compile("false");
    auto nv = violations(never, "7");
    ASSERT_EQ(nv.size(), 1u);
    EXPECT_EQ(nv[0].description, "False schema does not allow 7");
    EXPECT_TRUE(compile("true").accepts(parse("7")));
    EXPECT_TRUE(compiled_schema::accept_all().accepts(parse(R"({"any":[1,2]})")));
}

TEST(JsonSchemaTest, UnknownKeywordsAreIgnored) {
    auto s = compile(R"({"$schema":"http://json-schema.org/draft-07/schema#","title":"x","format":"email"})");
    EXPECT_TRUE(s.accepts(parse(R"("not an email")")));
}

TEST(JsonSchemaTest, MalformedSchemasFailToCompile) {
    auto bad_type = compiled_schema::compile(parse(R"({"type":"float"})"));
    ASSERT_FALSE(bad_type.has_value());
    EXPECT_EQ(bad_type.error().code, error_code::invalid_schema);
    EXPECT_EQ(bad_type.error().schema_path, "/type");

    auto nested = compiled_schema::compile(parse(R"({"properties":{"a":{"minLength":-1}}})"));
    ASSERT_FALSE(nested.has_value());
    EXPECT_EQ(nested.error().schema_path, "/properties/a/minLength");

    auto tuple = compiled_schema::compile(parse(R"({"items":[{"type":"string"}]})"));
    ASSERT_FALSE(tuple.has_value());
    EXPECT_EQ(tuple.error().schema_path, "/items");

    auto zero = compiled_schema::compile(parse(R"({"multipleOf":0})"));
    ASSERT_FALSE(zero.has_value());

    auto pattern = compiled_schema::compile(parse(R"({"pattern":"(unclosed"})"));
    ASSERT_FALSE(pattern.has_value());
    EXPECT_EQ(pattern.error().code, error_code::invalid_pattern);
    EXPECT_EQ(pattern.error().schema_path, "/pattern");

    EXPECT_FALSE(compiled_schema::compile(parse("3")).has_value());
}

TEST(JsonSchemaTest, GeneratedSchemasCompileAndAgreeWithRules) {
    using test_support::profile;
    auto s = compiled_schema::compile(generate_schema<profile>());
    ASSERT_TRUE(s.has_value());

    EXPECT_TRUE(s->accepts(parse(R"({"userName":"ann","age":30,"addresses":[],"scores":{}})")));

    auto v = violations(*s, R"({"userName":"ann","age":-1,"email":null,"addresses":[null,{"city":"Oslo"}],)"
                            R"("scores":{"x":"y"}})");
    ASSERT_EQ(v.size(), 3u);
    EXPECT_EQ(v[0].instance_path, "/age");
    EXPECT_EQ(v[0].description, "-1 is less than the minimum of 0");
    EXPECT_EQ(v[1].instance_path, "/addresses/1");
    EXPECT_EQ(v[1].description, R"("zip" is a required property)");
    EXPECT_EQ(v[2].instance_path, "/scores/x");
}
