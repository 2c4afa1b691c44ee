#include "support/fixtures.hpp"
#include "verity/core/metrics.hpp"
#include "verity/core/pipeline.hpp"

#include <gtest/gtest.h>

#include <string>
#include <typeindex>
#include <vector>

using namespace verity;
using namespace verity::test_support;

class PipelineTest : public ::testing::Test {
protected:
    schema_cache cache;
    pipeline_options options;
};

TEST_F(PipelineTest, AcceptsValidDocument) {
    auto before = global_metrics().snapshot();
    auto r = decode_and_validate<bounded>(R"({"val": 500})", options, cache);
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r->val, 500);
    EXPECT_EQ(global_metrics().snapshot().accepted - before.accepted, 1u);
}

TEST_F(PipelineTest, MalformedBodyIsDecodeFailure) {
    auto r = decode_and_validate<bounded>(R"({"val": )", options, cache);
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().kind(), failure_kind::decode);
    EXPECT_EQ(r.error().stage(), pipeline_stage::decoding);
    EXPECT_EQ(r.error().code(), error_code::decode_failed);
    EXPECT_EQ(r.error().message(), "invalid json body");
    EXPECT_FALSE(r.error().detail().empty());
    EXPECT_EQ(r.error().flatten(), (std::vector<flat_error>{{"", "invalid json body"}}));
    EXPECT_EQ(cache.size(), 0u);
}

TEST_F(PipelineTest, OversizedBodyIsRejectedBeforeParsing) {
    options.max_body_size = 8;
    auto r = decode_and_validate<bounded>(R"({"val": 500})", options, cache);
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().message(), "payload too large");
}

TEST_F(PipelineTest, DepthLimitApplies) {
    options.max_depth = 2;
    auto r = decode_and_validate<bounded>(R"({"val": [[[1]]]})", options, cache);
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().kind(), failure_kind::decode);
}

TEST_F(PipelineTest, SchemaViolationStopsBeforeBinding) {
    auto before = global_metrics().snapshot();
    auto r = decode_and_validate<bounded>(R"({"val": "x"})", options, cache);
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().kind(), failure_kind::schema);
    EXPECT_EQ(r.error().stage(), pipeline_stage::schema_checking);
    EXPECT_EQ(r.error().code(), error_code::schema_violation);
    ASSERT_EQ(r.error().violations().size(), 1u);
    EXPECT_EQ(r.error().violations()[0].instance_path, "/val");
    EXPECT_EQ(r.error().violations()[0].description, R"("x" is not of type "integer")");

    auto after = global_metrics().snapshot();
    EXPECT_EQ(after.schema_failures - before.schema_failures, 1u);
    EXPECT_EQ(after.decode_failures - before.decode_failures, 0u);
    EXPECT_EQ(after.internal_mismatches - before.internal_mismatches, 0u);
}

TEST_F(PipelineTest, SchemaReportsEveryViolation) {
    auto r = decode_and_validate<profile>(
        R"({"userName":7,"age":300,"addresses":[{"city":"Oslo"}],"scores":{"a":"x"}})", options, cache);
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().kind(), failure_kind::schema);
    std::vector<flat_error> expected{
        {"/userName", R"(7 is not of type "string")"},
        {"/age", "300 is greater than the maximum of 255"},
        {"/addresses/0", R"("zip" is a required property)"},
        {"/scores/a", R"("x" is not of type "integer")"},
    };
    EXPECT_EQ(r.error().flatten(), expected);
    EXPECT_EQ(r.error().to_string(),
              R"([{"path":"/userName","message":"7 is not of type \"string\""},)"
              R"({"path":"/age","message":"300 is greater than the maximum of 255"},)"
              R"({"path":"/addresses/0","message":"\"zip\" is a required property"},)"
              R"({"path":"/scores/a","message":"\"x\" is not of type \"integer\""}])");
}

TEST_F(PipelineTest, ConstraintFailuresPassSchemaAndFailValidation) {
    auto before = global_metrics().snapshot();
    auto r = decode_and_validate<bounded>(R"({"val": 1234})", options, cache);
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().kind(), failure_kind::validation);
    EXPECT_EQ(r.error().stage(), pipeline_stage::validating);
    EXPECT_EQ(r.error().flatten(), (std::vector<flat_error>{{"/val", "the number must be <= 1000."}}));
    EXPECT_EQ(r.error().to_string(), R"({"errors":[],"properties":{"val":["the number must be <= 1000."]}})");
    EXPECT_EQ(cache.size(), 1u);

    auto after = global_metrics().snapshot();
    EXPECT_EQ(after.schema_failures - before.schema_failures, 0u);
    EXPECT_EQ(after.validation_failures - before.validation_failures, 1u);
}

TEST_F(PipelineTest, DuplicateItemsAreAValidationFailure) {
    auto r = decode_and_validate<tag_list>(R"({"items":["a","a"]})", options, cache);
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().kind(), failure_kind::validation);
    EXPECT_EQ(r.error().flatten(), (std::vector<flat_error>{{"/items", "the items must be unique."}}));

    auto profile_result = decode_and_validate<profile>(
        R"({"userName":"","age":30,"addresses":[],"scores":{"a":-1}})", options, cache);
    ASSERT_FALSE(profile_result.has_value());
    EXPECT_EQ(profile_result.error().kind(), failure_kind::validation);
    std::vector<flat_error> expected{
        {"/userName", "the length of the value must be >= 1."},
        {"/scores/a", "the number must be >= 0."},
    };
    EXPECT_EQ(profile_result.error().flatten(), expected);
}

TEST_F(PipelineTest, RuleFailuresTheSchemaCannotExpress) {
    auto r = decode_and_validate<date_range>(R"({"start": 9, "end": 1})", options, cache);
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().kind(), failure_kind::validation);
    EXPECT_EQ(r.error().stage(), pipeline_stage::validating);
    EXPECT_EQ(r.error().code(), error_code::validation_failed);
    ASSERT_TRUE(r.error().errors().has_value());
    EXPECT_EQ(r.error().to_string(), R"({"errors":["start must not be after end."],"properties":{}})");
}

TEST_F(PipelineTest, SchemaStepCanBeDisabled) {
    options.schema_check = false;
    auto r = decode_and_validate<bounded>(R"({"val": 1234})", options, cache);
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().kind(), failure_kind::validation);
    EXPECT_EQ(r.error().flatten(), (std::vector<flat_error>{{"/val", "the number must be <= 1000."}}));
    EXPECT_EQ(cache.size(), 0u);
}

TEST_F(PipelineTest, BindingFailureWithoutSchemaIsInvalidRequest) {
    options.schema_check = false;
    auto r = decode_and_validate<bounded>(R"({"val": "x"})", options, cache);
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().kind(), failure_kind::decode);
    EXPECT_EQ(r.error().stage(), pipeline_stage::deserializing);
    EXPECT_EQ(r.error().code(), error_code::deserialize_failed);
    EXPECT_EQ(r.error().message(), "invalid request");
    EXPECT_EQ(r.error().detail(), "invalid type: expected integer, found string at \"/val\"");
}

TEST_F(PipelineTest, BindingFailureAfterPassingSchemaIsInternalMismatch) {
    log_capture logs(log_level::warn);
    auto before = global_metrics().snapshot();

    auto r = decode_and_validate<counter>(R"({"count": 18446744073709551615})", options, cache);
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().kind(), failure_kind::internal_mismatch);
    EXPECT_EQ(r.error().code(), error_code::internal_mismatch);
    EXPECT_EQ(r.error().message(), "invalid request");
    EXPECT_EQ(r.error().flatten(), (std::vector<flat_error>{{"", "invalid request"}}));

    ASSERT_EQ(logs.count(log_level::error), 1u);
    EXPECT_EQ(logs.lines().front().component, "pipeline");
    EXPECT_NE(logs.lines().front().message.find("schema validation passed"), std::string::npos);
    EXPECT_EQ(global_metrics().snapshot().internal_mismatches - before.internal_mismatches, 1u);
}

TEST_F(PipelineTest, BindingFailureBehindFallbackSchemaIsInvalidRequest) {
    log_capture logs(log_level::warn);
    cache.get_or_compile(std::type_index(typeid(bounded)), "bounded", [] {
        json_value s = json_value::object();
        s["type"] = "float";
        return s;
    });
    auto before = global_metrics().snapshot();

    auto r = decode_and_validate<bounded>(R"({"val": "x"})", options, cache);
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().kind(), failure_kind::decode);
    EXPECT_EQ(r.error().stage(), pipeline_stage::deserializing);
    EXPECT_EQ(r.error().message(), "invalid request");
    EXPECT_EQ(global_metrics().snapshot().internal_mismatches - before.internal_mismatches, 0u);
}

TEST_F(PipelineTest, ValidateValueSkipsDecoding) {
    json_value doc = json_value::object();
    doc["val"] = 7;
    auto r = validate_value<bounded>(doc, options, cache);
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r->val, 7);
}

TEST_F(PipelineTest, YamlInput) {
    auto r = decode_and_validate<order>("sku: ABC-1\nprice: 250\ndiscounts: [5, 10]\n", options, cache,
                                        input_format::yaml);
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r->price.cents, 250);
    ASSERT_EQ(r->discounts.size(), 2u);

    auto bad = decode_and_validate<order>("sku: [unclosed\n", options, cache, input_format::yaml);
    ASSERT_FALSE(bad.has_value());
    EXPECT_EQ(bad.error().message(), "invalid yaml document");
}

TEST_F(PipelineTest, YamlDepthLimitApplies) {
    options.max_depth = 8;
    std::string deep = "sku: " + std::string(100000, '[') + std::string(100000, ']') + "\n";
    auto r = decode_and_validate<order>(deep, options, cache, input_format::yaml);
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().kind(), failure_kind::decode);
    EXPECT_EQ(r.error().message(), "invalid yaml document");
    EXPECT_EQ(r.error().detail(), "nesting depth limit exceeded");
}

TEST(ConvenienceEntryPointsTest, FromJsonStr) {
    auto ok = from_json_str<amount>("25");
    ASSERT_TRUE(ok.has_value());
    EXPECT_EQ(ok->cents, 25);

    auto bad = from_json_str<amount>("-3");
    ASSERT_FALSE(bad.has_value());
    EXPECT_EQ(bad.error().to_string(),
              R"(["the number must be >= 0.","the value must be multiple of 5."])");
}

TEST(ConvenienceEntryPointsTest, FromYamlStr) {
    auto r = from_yaml_str<address>("city: Oslo\nzip: \"1234\"\n");
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().flatten(),
              (std::vector<flat_error>{{"/zip", "the value must match the pattern of \"[0-9]{5}\"."}}));
}

TEST(ConvenienceEntryPointsTest, FromJsonValue) {
    json_value doc = json_value::object();
    doc["x"] = 1;
    doc["y"] = 2;
    doc["z"] = 3;
    auto r = from_json_value<strict_point>(doc);
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().message(), "invalid request");
    EXPECT_EQ(r.error().detail(), "unknown field \"z\" at \"/z\"");
}

TEST(PipelineNamesTest, StageAndKindNames) {
    EXPECT_EQ(pipeline_stage_name(pipeline_stage::schema_checking), "schema_checking");
    EXPECT_EQ(failure_kind_name(failure_kind::internal_mismatch), "internal_mismatch");
}
