#include <gtest/gtest.h>

#include "tmauth/foundation/config_manager.hpp"
#include "tmauth/foundation/error_code.hpp"
#include "tmauth/service/auth_config.hpp"

#include <cstdlib>
#include <string>

using namespace tmauth::service;
using tmauth::foundation::ConfigManager;
using tmauth::foundation::ErrorCode;

// =============================================================================
// parseLifetimeHours
// =============================================================================

TEST(ParseLifetimeHoursTest, PositiveIntegers) {
    auto lifetime = parseLifetimeHours("24");
    ASSERT_TRUE(lifetime.hasValue());
    EXPECT_EQ(lifetime.value(), std::chrono::hours(24));

    auto one = parseLifetimeHours("1");
    ASSERT_TRUE(one.hasValue());
    EXPECT_EQ(one.value(), std::chrono::hours(1));
}

TEST(ParseLifetimeHoursTest, UpperBound) {
    auto tenYears = parseLifetimeHours("87600");
    ASSERT_TRUE(tenYears.hasValue());
    EXPECT_EQ(tenYears.value(), kMaxTokenLifetime);

    for (const char* text : {"87601", "3000000", "9223372036854775807"}) {
        auto lifetime = parseLifetimeHours(text);
        ASSERT_TRUE(lifetime.hasError()) << text;
        EXPECT_EQ(lifetime.error().code(), ErrorCode::ConfigTypeMismatch) << text;
    }
}

TEST(ParseLifetimeHoursTest, RejectsNonPositiveAndNonNumeric) {
    for (const char* text : {"", "0", "-3", "abc", "24h", " 24", "1.5", "99999999999999999999"}) {
        auto lifetime = parseLifetimeHours(text);
        ASSERT_TRUE(lifetime.hasError()) << text;
        EXPECT_EQ(lifetime.error().code(), ErrorCode::ConfigTypeMismatch) << text;
    }
}

// =============================================================================
// loadAuthConfig
// =============================================================================

TEST(LoadAuthConfigTest, ReadsAllKeys) {
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString(R"(
auth:
  signing_secret: "s3cret"
  token_lifetime_hours: "12"
  scrypt:
    log2_n: 15
    r: 8
    p: 2
)").hasValue());

    auto auth = loadAuthConfig(config);
    ASSERT_TRUE(auth.hasValue()) << auth.error().message();
    EXPECT_EQ(auth.value().signingSecret, "s3cret");
    EXPECT_EQ(auth.value().tokenLifetime, std::chrono::hours(12));
    EXPECT_EQ(auth.value().scrypt.log2N, 15u);
    EXPECT_EQ(auth.value().scrypt.r, 8u);
    EXPECT_EQ(auth.value().scrypt.p, 2u);
}

TEST(LoadAuthConfigTest, NumericLifetimeAndDefaultCost) {
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString("auth:\n  signing_secret: k\n  token_lifetime_hours: 24\n")
                    .hasValue());

    auto auth = loadAuthConfig(config);
    ASSERT_TRUE(auth.hasValue());
    EXPECT_EQ(auth.value().tokenLifetime, std::chrono::hours(24));
    EXPECT_EQ(auth.value().scrypt.log2N, 14u);
    EXPECT_EQ(auth.value().scrypt.r, 8u);
    EXPECT_EQ(auth.value().scrypt.p, 1u);
}

TEST(LoadAuthConfigTest, MissingSecret) {
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString("auth:\n  token_lifetime_hours: 24\n").hasValue());
    auto auth = loadAuthConfig(config);
    ASSERT_TRUE(auth.hasError());
    EXPECT_EQ(auth.error().code(), ErrorCode::ConfigKeyNotFound);
}

TEST(LoadAuthConfigTest, EmptySecretCountsAsMissing) {
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString("auth:\n  signing_secret: \"\"\n  token_lifetime_hours: 24\n")
                    .hasValue());
    auto auth = loadAuthConfig(config);
    ASSERT_TRUE(auth.hasError());
    EXPECT_EQ(auth.error().code(), ErrorCode::ConfigKeyNotFound);
}

TEST(LoadAuthConfigTest, MissingLifetime) {
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString("auth:\n  signing_secret: k\n").hasValue());
    auto auth = loadAuthConfig(config);
    ASSERT_TRUE(auth.hasError());
    EXPECT_EQ(auth.error().code(), ErrorCode::ConfigKeyNotFound);
}

TEST(LoadAuthConfigTest, InvalidLifetime) {
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString("auth:\n  signing_secret: k\n  token_lifetime_hours: soon\n")
                    .hasValue());
    auto auth = loadAuthConfig(config);
    ASSERT_TRUE(auth.hasError());
    EXPECT_EQ(auth.error().code(), ErrorCode::ConfigTypeMismatch);
}

TEST(LoadAuthConfigTest, OutOfRangeCost) {
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString(
        "auth:\n  signing_secret: k\n  token_lifetime_hours: 1\n  scrypt:\n    log2_n: 31\n")
                    .hasValue());
    auto auth = loadAuthConfig(config);
    ASSERT_TRUE(auth.hasError());
    EXPECT_EQ(auth.error().code(), ErrorCode::ConfigTypeMismatch);
}

TEST(LoadAuthConfigTest, CostOverMemoryCap) {
    // Each bound alone is fine; together they need 8 GiB per hash.
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString("auth:\n  signing_secret: k\n  token_lifetime_hours: 1\n"
                                      "  scrypt:\n    log2_n: 20\n    r: 64\n")
                    .hasValue());
    auto auth = loadAuthConfig(config);
    ASSERT_TRUE(auth.hasError());
    EXPECT_EQ(auth.error().code(), ErrorCode::ConfigTypeMismatch);
}

TEST(LoadAuthConfigTest, CostAtMemoryCap) {
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString("auth:\n  signing_secret: k\n  token_lifetime_hours: 1\n"
                                      "  scrypt:\n    log2_n: 20\n    r: 2\n")
                    .hasValue());
    auto auth = loadAuthConfig(config);
    ASSERT_TRUE(auth.hasValue());
    EXPECT_EQ(scryptMemoryBytes(auth.value().scrypt), kMaxScryptMemoryBytes);
}

TEST(LoadAuthConfigTest, LifetimeOverUpperBound) {
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString("auth:\n  signing_secret: k\n  token_lifetime_hours: 3000000\n")
                    .hasValue());
    auto auth = loadAuthConfig(config);
    ASSERT_TRUE(auth.hasError());
    EXPECT_EQ(auth.error().code(), ErrorCode::ConfigTypeMismatch);
}

TEST(LoadAuthConfigTest, EnvironmentOverridesFile) {
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString("auth:\n  signing_secret: from-file\n  token_lifetime_hours: 1\n")
                    .hasValue());

    ::setenv(kSigningSecretEnv, "from-env", 1);
    ::setenv(kTokenLifetimeEnv, "48", 1);
    applyEnvironmentOverrides(config);
    ::unsetenv(kSigningSecretEnv);
    ::unsetenv(kTokenLifetimeEnv);

    auto auth = loadAuthConfig(config);
    ASSERT_TRUE(auth.hasValue());
    EXPECT_EQ(auth.value().signingSecret, "from-env");
    EXPECT_EQ(auth.value().tokenLifetime, std::chrono::hours(48));
}

TEST(LoadAuthConfigTest, EnvironmentAloneIsEnough) {
    ConfigManager config;
    ::setenv(kSigningSecretEnv, "env-only", 1);
    ::setenv(kTokenLifetimeEnv, "6", 1);
    applyEnvironmentOverrides(config);
    ::unsetenv(kSigningSecretEnv);
    ::unsetenv(kTokenLifetimeEnv);

    auto auth = loadAuthConfig(config);
    ASSERT_TRUE(auth.hasValue());
    EXPECT_EQ(auth.value().signingSecret, "env-only");
    EXPECT_EQ(auth.value().tokenLifetime, std::chrono::hours(6));
}
