#pragma once

/// @file service_runner.hpp
/// @brief Signal handling, configuration loading, graceful shutdown
///        and CLI parsing for the service executable.

#include <atomic>
#include <filesystem>
#include <functional>
#include <string>
#include <vector>

#include "tmauth/foundation/config_manager.hpp"
#include "tmauth/foundation/service_result.hpp"

namespace tmauth::service {

/// Default configuration file location.
inline constexpr const char* kDefaultConfigPath = "/etc/tmauth/config.yaml";

/// Environment variable naming the configuration file.
inline constexpr const char* kConfigPathEnv = "TMAUTH_CONFIG_PATH";

/// Installs SIGINT and SIGTERM handlers and exposes a shutdown flag.
///
/// Only one SignalHandler instance should exist per process.
/// The handler writes to a static atomic flag in an async-signal-safe
/// manner (relaxed store on a lock-free atomic).
///
/// The original default handlers are restored on destruction so that
/// a second signal terminates the process immediately.
class SignalHandler {
public:
    SignalHandler();
    ~SignalHandler();

    SignalHandler(const SignalHandler&) = delete;
    SignalHandler& operator=(const SignalHandler&) = delete;

    /// Returns true after SIGINT or SIGTERM is received.
    [[nodiscard]] bool shutdownRequested() const noexcept;

    /// Block the calling thread until a shutdown signal arrives.
    void waitForShutdown() const;

private:
    static std::atomic<bool> shutdownFlag_;
    static void handler(int signal);
};

using ShutdownHook = std::function<void()>;

/// Runs named shutdown hooks in registration order.
///
/// @code
///   GracefulShutdown shutdown;
///   shutdown.addHook("http",   [&]() { server.stop(); });
///   shutdown.addHook("logger", [&]() { ServiceLogger::instance().flush(); });
///   signals.waitForShutdown();
///   shutdown.execute();
/// @endcode
class GracefulShutdown {
public:
    void addHook(std::string name, ShutdownHook hook);

    /// Execute all hooks in order. A hook that throws is logged and the
    /// remaining hooks still run.
    void execute();

    [[nodiscard]] std::size_t hookCount() const;

private:
    struct Hook {
        std::string name;
        ShutdownHook callback;
    };
    std::vector<Hook> hooks_;
};

/// Resolve the configuration file: @p cliPath if non-empty, else
/// TMAUTH_CONFIG_PATH, else /etc/tmauth/config.yaml.
[[nodiscard]] std::filesystem::path resolveConfigPath(const std::filesystem::path& cliPath);

/// Load @p path into @p config and apply the TMAUTH_* environment overrides.
///
/// A missing file is tolerated only when it was not named explicitly
/// (@p required false); the environment must then supply every required
/// key. A file that exists but does not parse is always ConfigLoadFailed.
[[nodiscard]] foundation::ServiceResult<void> loadConfig(foundation::ConfigManager& config,
                                                         const std::filesystem::path& path,
                                                         bool required);

/// Parse `--config <path>` from command-line arguments.
///
/// @return Config file path, or empty path if not specified.
[[nodiscard]] std::filesystem::path parseConfigArg(int argc, char* argv[]);

} // namespace tmauth::service
