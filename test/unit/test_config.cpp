#include "verity/core/config.hpp"

#include <gtest/gtest.h>

#include <cstdlib>

using namespace verity;

namespace {

constexpr const char* config_vars[] = {"VERITY_SCHEMA_CHECK", "VERITY_MAX_BODY_SIZE", "VERITY_MAX_DEPTH",
                                       "VERITY_LOG_LEVEL"};

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override { clear(); }
    void TearDown() override { clear(); }

    static void clear() {
        for (const char* name : config_vars) {
            unsetenv(name);
        }
    }
};

} // namespace

TEST_F(ConfigTest, Defaults) {
    auto opts = pipeline_options::from_env();
    EXPECT_TRUE(opts.schema_check);
    EXPECT_EQ(opts.max_body_size, 10u * 1024u * 1024u);
    EXPECT_EQ(opts.max_depth, 128u);
    EXPECT_EQ(opts.level, log_level::warn);
}

TEST_F(ConfigTest, ReadsEnvironment) {
    setenv("VERITY_SCHEMA_CHECK", "off", 1);
    setenv("VERITY_MAX_BODY_SIZE", "4096", 1);
    setenv("VERITY_MAX_DEPTH", "16", 1);
    setenv("VERITY_LOG_LEVEL", "debug", 1);

    auto opts = pipeline_options::from_env();
    EXPECT_FALSE(opts.schema_check);
    EXPECT_EQ(opts.max_body_size, 4096u);
    EXPECT_EQ(opts.max_depth, 16u);
    EXPECT_EQ(opts.level, log_level::debug);
}

TEST_F(ConfigTest, MalformedValuesKeepDefaults) {
    setenv("VERITY_SCHEMA_CHECK", "maybe", 1);
    setenv("VERITY_MAX_BODY_SIZE", "12k", 1);
    setenv("VERITY_MAX_DEPTH", "0", 1);
    setenv("VERITY_LOG_LEVEL", "loud", 1);

    auto opts = pipeline_options::from_env();
    EXPECT_TRUE(opts.schema_check);
    EXPECT_EQ(opts.max_body_size, 10u * 1024u * 1024u);
    EXPECT_EQ(opts.max_depth, 128u);
    EXPECT_EQ(opts.level, log_level::warn);
}
