#include "quire/config.hpp"

#include "test_util.hpp"

#include <gtest/gtest.h>

using namespace quire;
using quire::testing::TempDir;
using quire::testing::write_file;

namespace {

ConfigErrorCode error_code_of(std::string_view json) {
    auto config = parse_config(json);
    EXPECT_FALSE(config) << "expected " << json << " to be rejected";
    return config ? ConfigErrorCode::InvalidValue : config.error().code;
}

} // namespace

TEST(ConfigTest, EmptyObjectGivesDefaults) {
    auto config = parse_config("{}");
    ASSERT_TRUE(config) << config.error().describe();
    EXPECT_EQ(config->src_dir, "site");
    EXPECT_EQ(config->out_dir, "dist");
    EXPECT_EQ(config->cache_dir, ".quire");
    EXPECT_EQ(config->renderer, "raw");
    EXPECT_EQ(config->render_timeout_seconds, 60);
    EXPECT_EQ(config->isg.default_ttl_seconds, 21600);
    EXPECT_EQ(config->isg.clock_drift_tolerance_seconds, 30);
    EXPECT_FALSE(config->isg.max_age_cap_days.has_value());
    EXPECT_TRUE(config->isg.aging.empty());
}

TEST(ConfigTest, ReadsEveryKey) {
    auto config = parse_config(R"({
        "srcDir": "content",
        "outDir": "public",
        "cacheDir": ".cache",
        "includeDrafts": true,
        "jobs": 4,
        "logLevel": "debug",
        "renderer": "exec",
        "renderCommand": ["pandoc", "{input}", "-o", "{output}"],
        "renderTimeoutSeconds": 5,
        "watchDebounceMs": 50,
        "watchPollMs": 100,
        "isg": {
            "ttlSeconds": 600,
            "maxAgeCapDays": 365,
            "aging": [{"untilDays": 7, "ttlSeconds": 300}, {"untilDays": 30, "ttlSeconds": 3600}],
            "clockDriftToleranceSeconds": 10,
            "pendingInvalidationTtlSeconds": 86400
        }
    })");
    ASSERT_TRUE(config) << config.error().describe();
    EXPECT_EQ(config->src_dir, "content");
    EXPECT_EQ(config->out_dir, "public");
    EXPECT_EQ(config->cache_dir, ".cache");
    EXPECT_TRUE(config->include_drafts);
    EXPECT_EQ(config->jobs, 4u);
    EXPECT_EQ(config->log_level, log::Level::Debug);
    EXPECT_EQ(config->renderer, "exec");
    EXPECT_EQ(config->render_command.size(), 4u);
    EXPECT_EQ(config->render_timeout_seconds, 5);
    EXPECT_EQ(config->watch_debounce_ms, 50);
    EXPECT_EQ(config->watch_poll_ms, 100);
    EXPECT_EQ(config->isg.default_ttl_seconds, 600);
    EXPECT_EQ(config->isg.max_age_cap_days, 365);
    EXPECT_EQ(config->isg.aging, (std::vector<AgingRule>{{7, 300}, {30, 3600}}));
    EXPECT_EQ(config->isg.clock_drift_tolerance_seconds, 10);
    EXPECT_EQ(config->isg.pending_invalidation_ttl_seconds, 86400);
}

// ============================================================================
// ISG validation codes
// ============================================================================

TEST(ConfigValidationTest, TtlBounds) {
    EXPECT_EQ(error_code_of(R"({"isg": {"ttlSeconds": -1}})"), ConfigErrorCode::InvalidTtl);
    EXPECT_EQ(error_code_of(R"({"isg": {"ttlSeconds": 40000000}})"), ConfigErrorCode::InvalidTtl);
    EXPECT_EQ(error_code_of(R"({"isg": {"ttlSeconds": "60"}})"), ConfigErrorCode::InvalidTtl);
    EXPECT_TRUE(parse_config(R"({"isg": {"ttlSeconds": 0}})"));
}

TEST(ConfigValidationTest, MaxAgeCapBounds) {
    EXPECT_EQ(error_code_of(R"({"isg": {"maxAgeCapDays": 0}})"), ConfigErrorCode::InvalidMaxAgeCap);
    EXPECT_EQ(error_code_of(R"({"isg": {"maxAgeCapDays": 4000}})"), ConfigErrorCode::InvalidMaxAgeCap);
    EXPECT_EQ(error_code_of(R"({"isg": {"maxAgeCapDays": 1.5}})"), ConfigErrorCode::InvalidMaxAgeCap);
}

TEST(ConfigValidationTest, AgingRuleShape) {
    EXPECT_EQ(error_code_of(R"({"isg": {"aging": [{"untilDays": 0, "ttlSeconds": 60}]}})"),
              ConfigErrorCode::InvalidAgingRule);
    EXPECT_EQ(error_code_of(R"({"isg": {"aging": [{"untilDays": 7, "ttlSeconds": -5}]}})"),
              ConfigErrorCode::InvalidAgingRule);
    EXPECT_EQ(error_code_of(R"({"isg": {"aging": [{"untilDays": 7, "ttlSeconds": 3000000}]}})"),
              ConfigErrorCode::InvalidAgingRule);
    EXPECT_EQ(error_code_of(R"({"isg": {"aging": [{"untilDays": 7}]}})"), ConfigErrorCode::InvalidAgingRule);
    EXPECT_EQ(error_code_of(R"({"isg": {"aging": {"untilDays": 7}}})"), ConfigErrorCode::InvalidAgingRule);
}

TEST(ConfigValidationTest, DuplicateAgingRule) {
    EXPECT_EQ(error_code_of(R"({"isg": {"aging": [{"untilDays": 7, "ttlSeconds": 60},
                                                  {"untilDays": 7, "ttlSeconds": 120}]}})"),
              ConfigErrorCode::DuplicateAgingRule);
}

TEST(ConfigValidationTest, UnsortedAgingRules) {
    EXPECT_EQ(error_code_of(R"({"isg": {"aging": [{"untilDays": 30, "ttlSeconds": 3600},
                                                  {"untilDays": 7, "ttlSeconds": 300}]}})"),
              ConfigErrorCode::UnsortedAgingRules);
}

TEST(ConfigValidationTest, AgingRuleBeyondCap) {
    EXPECT_EQ(error_code_of(R"({"isg": {"maxAgeCapDays": 30,
                                        "aging": [{"untilDays": 60, "ttlSeconds": 3600}]}})"),
              ConfigErrorCode::AgingRuleExceedsCap);
}

TEST(ConfigValidationTest, DriftBounds) {
    EXPECT_EQ(error_code_of(R"({"isg": {"clockDriftToleranceSeconds": -1}})"), ConfigErrorCode::InvalidDrift);
    EXPECT_EQ(error_code_of(R"({"isg": {"clockDriftToleranceSeconds": 90000}})"), ConfigErrorCode::InvalidDrift);
}

TEST(ConfigValidationTest, StableCodeNames) {
    EXPECT_EQ(to_string(ConfigErrorCode::InvalidTtl), "ISG_INVALID_TTL");
    EXPECT_EQ(to_string(ConfigErrorCode::InvalidMaxAgeCap), "ISG_INVALID_MAX_AGE_CAP");
    EXPECT_EQ(to_string(ConfigErrorCode::InvalidAgingRule), "ISG_INVALID_AGING_RULE");
    EXPECT_EQ(to_string(ConfigErrorCode::DuplicateAgingRule), "ISG_DUPLICATE_AGING_RULE");
    EXPECT_EQ(to_string(ConfigErrorCode::UnsortedAgingRules), "ISG_UNSORTED_AGING_RULES");
    EXPECT_EQ(to_string(ConfigErrorCode::AgingRuleExceedsCap), "ISG_AGING_RULE_EXCEEDS_CAP");
    EXPECT_EQ(to_string(ConfigErrorCode::InvalidDrift), "ISG_INVALID_DRIFT");
}

TEST(ConfigValidationTest, OtherFieldsAreChecked) {
    EXPECT_EQ(error_code_of(R"({"logLevel": "loud"})"), ConfigErrorCode::InvalidValue);
    EXPECT_EQ(error_code_of(R"({"jobs": -2})"), ConfigErrorCode::InvalidValue);
    EXPECT_EQ(error_code_of(R"({"renderCommand": []})"), ConfigErrorCode::InvalidValue);
    EXPECT_EQ(error_code_of(R"({"srcDir": ""})"), ConfigErrorCode::InvalidValue);
    EXPECT_EQ(error_code_of("[]"), ConfigErrorCode::InvalidValue);
    EXPECT_EQ(error_code_of("{"), ConfigErrorCode::InvalidValue);
}

// ============================================================================
// Loading
// ============================================================================

TEST(ConfigLoadTest, MissingDefaultFileMeansDefaults) {
    TempDir dir;
    auto config = load_config(dir.path());
    ASSERT_TRUE(config) << config.error();
    EXPECT_EQ(config->src_dir, "site");
}

TEST(ConfigLoadTest, MissingExplicitFileIsAnError) {
    TempDir dir;
    EXPECT_FALSE(load_config(dir.path(), dir / "other.json"));
}

TEST(ConfigLoadTest, InvalidFileIsAnErrorNamingTheCode) {
    TempDir dir;
    write_file(dir / "quire.json", R"({"isg": {"ttlSeconds": -10}})");
    auto config = load_config(dir.path());
    ASSERT_FALSE(config);
    EXPECT_NE(config.error().find("ISG_INVALID_TTL"), std::string::npos);
}

TEST(ConfigLoadTest, ReadsProjectFile) {
    TempDir dir;
    write_file(dir / "quire.json", R"({"outDir": "build/site", "isg": {"ttlSeconds": 120}})");
    auto config = load_config(dir.path());
    ASSERT_TRUE(config) << config.error();
    EXPECT_EQ(config->out_dir, "build/site");
    EXPECT_EQ(config->isg.default_ttl_seconds, 120);
}
