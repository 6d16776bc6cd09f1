#include <gtest/gtest.h>

#include "tmauth/foundation/config_manager.hpp"
#include "tmauth/foundation/error_code.hpp"
#include "tmauth/service/auth_config.hpp"
#include "tmauth/service/service_runner.hpp"

#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace tmauth::service;
using tmauth::foundation::ConfigManager;
using tmauth::foundation::ErrorCode;

namespace {

std::filesystem::path writeTempConfig(const std::string& content) {
    auto now = std::chrono::steady_clock::now().time_since_epoch().count();
    auto path = std::filesystem::temp_directory_path() /
                ("tmauth_runner_" + std::to_string(now) + ".yaml");
    std::ofstream(path) << content;
    return path;
}

} // namespace

// =============================================================================
// parseConfigArg / resolveConfigPath
// =============================================================================

TEST(ParseConfigArgTest, FindsFlag) {
    char prog[] = "tmauth_server";
    char flag[] = "--config";
    char value[] = "/tmp/tmauth.yaml";
    char* argv[] = {prog, flag, value};
    EXPECT_EQ(parseConfigArg(3, argv), std::filesystem::path("/tmp/tmauth.yaml"));
}

TEST(ParseConfigArgTest, MissingValueIsEmpty) {
    char prog[] = "tmauth_server";
    char flag[] = "--config";
    char* argv[] = {prog, flag};
    EXPECT_TRUE(parseConfigArg(2, argv).empty());
    EXPECT_TRUE(parseConfigArg(1, argv).empty());
}

TEST(ResolveConfigPathTest, Precedence) {
    ::unsetenv(kConfigPathEnv);
    EXPECT_EQ(resolveConfigPath({}), std::filesystem::path(kDefaultConfigPath));

    ::setenv(kConfigPathEnv, "/from/env.yaml", 1);
    EXPECT_EQ(resolveConfigPath({}), std::filesystem::path("/from/env.yaml"));
    EXPECT_EQ(resolveConfigPath("/from/cli.yaml"), std::filesystem::path("/from/cli.yaml"));
    ::unsetenv(kConfigPathEnv);
}

// =============================================================================
// loadConfig
// =============================================================================

TEST(LoadConfigTest, FileThenEnvironment) {
    auto path = writeTempConfig("auth:\n  signing_secret: file\n  token_lifetime_hours: 2\n");
    ::setenv(kSigningSecretEnv, "env", 1);

    ConfigManager config;
    auto loaded = loadConfig(config, path, true);
    ::unsetenv(kSigningSecretEnv);
    std::filesystem::remove(path);

    ASSERT_TRUE(loaded.hasValue());
    auto auth = loadAuthConfig(config);
    ASSERT_TRUE(auth.hasValue());
    EXPECT_EQ(auth.value().signingSecret, "env");
    EXPECT_EQ(auth.value().tokenLifetime, std::chrono::hours(2));
}

TEST(LoadConfigTest, MissingOptionalFileIsTolerated) {
    ConfigManager config;
    auto loaded = loadConfig(config, "/nonexistent/tmauth/config.yaml", false);
    EXPECT_TRUE(loaded.hasValue());
}

TEST(LoadConfigTest, MissingRequiredFileFails) {
    ConfigManager config;
    auto loaded = loadConfig(config, "/nonexistent/tmauth/config.yaml", true);
    ASSERT_TRUE(loaded.hasError());
    EXPECT_EQ(loaded.error().code(), ErrorCode::ConfigLoadFailed);
}

TEST(LoadConfigTest, UnparsableFileFailsEvenWhenOptional) {
    auto path = writeTempConfig("auth: [broken");
    ConfigManager config;
    auto loaded = loadConfig(config, path, false);
    std::filesystem::remove(path);
    ASSERT_TRUE(loaded.hasError());
    EXPECT_EQ(loaded.error().code(), ErrorCode::ConfigLoadFailed);
}

// =============================================================================
// GracefulShutdown
// =============================================================================

TEST(GracefulShutdownTest, HooksExecuteInOrder) {
    GracefulShutdown shutdown;
    std::vector<int> order;

    shutdown.addHook("first",  [&]() { order.push_back(1); });
    shutdown.addHook("second", [&]() { order.push_back(2); });
    shutdown.addHook("third",  [&]() { order.push_back(3); });
    EXPECT_EQ(shutdown.hookCount(), 3u);

    shutdown.execute();
    EXPECT_EQ(order, (std::vector<int>{1, 2, 3}));
}

TEST(GracefulShutdownTest, ErrorInHookDoesNotStopOthers) {
    GracefulShutdown shutdown;
    std::vector<int> order;

    shutdown.addHook("first", [&]() { order.push_back(1); });
    shutdown.addHook("error", [&]() {
        order.push_back(2);
        throw std::runtime_error("simulated failure");
    });
    shutdown.addHook("third", [&]() { order.push_back(3); });

    shutdown.execute();
    EXPECT_EQ(order, (std::vector<int>{1, 2, 3}));
}

TEST(GracefulShutdownTest, EmptyShutdownIsNoOp) {
    GracefulShutdown shutdown;
    EXPECT_EQ(shutdown.hookCount(), 0u);
    shutdown.execute();
}

// =============================================================================
// SignalHandler
// =============================================================================

TEST(SignalHandlerTest, RaiseSetsFlag) {
    SignalHandler signals;
    EXPECT_FALSE(signals.shutdownRequested());
    std::raise(SIGTERM);
    EXPECT_TRUE(signals.shutdownRequested());
    signals.waitForShutdown();
}
