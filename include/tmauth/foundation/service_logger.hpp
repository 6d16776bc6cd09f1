#pragma once

/// @file service_logger.hpp
/// @brief ServiceLogger: category-filtered logging on top of kcenon common_system.
///
/// The kcenon logger registry stays hidden behind a PIMPL so that public
/// headers do not pull in the logging backend.

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "tmauth/foundation/service_result.hpp"

namespace tmauth::foundation {

/// Log severity. Maps one-to-one onto kcenon::common::interfaces::log_level.
enum class LogLevel : uint8_t {
    Trace    = 0,
    Debug    = 1,
    Info     = 2,
    Warning  = 3,
    Error    = 4,
    Critical = 5,
    Off      = 6
};

/// Subsystem a log line belongs to. Each has its own minimum level.
enum class LogCategory : uint8_t {
    Core    = 0, ///< Startup, shutdown, wiring
    Auth    = 1, ///< Registration, token exchange, validation
    Crypto  = 2, ///< Salt generation, hashing, signing
    Storage = 3, ///< Credential store
    Http    = 4, ///< Transport and routing
    Config  = 5  ///< Configuration loading
};

inline constexpr std::size_t kLogCategoryCount = 6;

constexpr std::string_view logCategoryName(LogCategory cat) {
    constexpr std::array<std::string_view, kLogCategoryCount> names = {
        "Core", "Auth", "Crypto", "Storage", "Http", "Config"
    };
    auto idx = static_cast<std::size_t>(cat);
    return idx < kLogCategoryCount ? names[idx] : "Unknown";
}

constexpr std::string_view logLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:    return "TRACE";
        case LogLevel::Debug:    return "DEBUG";
        case LogLevel::Info:     return "INFO";
        case LogLevel::Warning:  return "WARNING";
        case LogLevel::Error:    return "ERROR";
        case LogLevel::Critical: return "CRITICAL";
        case LogLevel::Off:      return "OFF";
    }
    return "UNKNOWN";
}

/// Structured fields appended to a log line.
///
/// Never put passwords, salts, secrets or full tokens in here.
struct LogContext {
    std::optional<std::string> username;
    std::optional<std::string> requestId;
    std::unordered_map<std::string, std::string> extra;
};

/// Category-aware logger forwarding to the kcenon GlobalLoggerRegistry.
///
/// Lines are formatted as `[Category] message {key=value, ...}` and sent
/// to the registry logger named `tmauth.<Category>`, falling back to the
/// registry default logger.
///
/// Default levels: Crypto is Warning, everything else Info.
///
/// @code
///   LogContext ctx;
///   ctx.username = "alice";
///   ServiceLogger::instance().logWithContext(
///       LogLevel::Info, LogCategory::Auth, "token issued", ctx);
/// @endcode
class ServiceLogger {
public:
    ServiceLogger();
    ~ServiceLogger();

    ServiceLogger(const ServiceLogger&) = delete;
    ServiceLogger& operator=(const ServiceLogger&) = delete;
    ServiceLogger(ServiceLogger&&) noexcept;
    ServiceLogger& operator=(ServiceLogger&&) noexcept;

    /// No-op when level is below the category minimum.
    void log(LogLevel level, LogCategory cat, std::string_view msg);

    void logWithContext(LogLevel level, LogCategory cat,
                        std::string_view msg, const LogContext& ctx);

    void setCategoryLevel(LogCategory cat, LogLevel minLevel);

    [[nodiscard]] LogLevel getCategoryLevel(LogCategory cat) const;

    [[nodiscard]] bool isEnabled(LogLevel level, LogCategory cat) const;

    /// Parse "debug", "INFO", "warning", ... into a LogLevel.
    [[nodiscard]] static ServiceResult<LogLevel> parseLevel(std::string_view name);

    ServiceResult<void> flush();

    /// Process-wide logger used by the TMAUTH_LOG_* macros.
    static ServiceLogger& instance();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace tmauth::foundation

/// @name TMAUTH_LOG macros
/// Define TMAUTH_MIN_LOG_LEVEL (0=Trace ... 6=Off) before including this
/// header to compile out calls below the threshold.
/// @{

#ifndef TMAUTH_MIN_LOG_LEVEL
    #define TMAUTH_MIN_LOG_LEVEL 0
#endif

#define TMAUTH_LOG(level, cat, msg)                                                   \
    do {                                                                              \
        _Pragma("GCC diagnostic push")                                                \
        _Pragma("GCC diagnostic ignored \"-Wtype-limits\"")                           \
        if (static_cast<int>(level) >= TMAUTH_MIN_LOG_LEVEL &&                        \
            ::tmauth::foundation::ServiceLogger::instance().isEnabled((level), (cat))) \
        {                                                                             \
            ::tmauth::foundation::ServiceLogger::instance().log((level), (cat), (msg)); \
        }                                                                             \
        _Pragma("GCC diagnostic pop")                                                 \
    } while (0)

#define TMAUTH_LOG_DEBUG(cat, msg) \
    TMAUTH_LOG(::tmauth::foundation::LogLevel::Debug, (cat), (msg))

#define TMAUTH_LOG_INFO(cat, msg) \
    TMAUTH_LOG(::tmauth::foundation::LogLevel::Info, (cat), (msg))

#define TMAUTH_LOG_WARN(cat, msg) \
    TMAUTH_LOG(::tmauth::foundation::LogLevel::Warning, (cat), (msg))

#define TMAUTH_LOG_ERROR(cat, msg) \
    TMAUTH_LOG(::tmauth::foundation::LogLevel::Error, (cat), (msg))

/// @}
