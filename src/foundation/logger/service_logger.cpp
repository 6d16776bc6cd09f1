/// @file service_logger.cpp
/// @brief ServiceLogger implementation over kcenon common_system.

#include "tmauth/foundation/service_logger.hpp"

#include <kcenon/common/interfaces/global_logger_registry.h>
#include <kcenon/common/interfaces/logger_interface.h>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <sstream>
#include <string>

namespace tmauth::foundation {

namespace kci = kcenon::common::interfaces;

namespace {

kci::log_level toBackendLevel(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:    return kci::log_level::trace;
        case LogLevel::Debug:    return kci::log_level::debug;
        case LogLevel::Info:     return kci::log_level::info;
        case LogLevel::Warning:  return kci::log_level::warning;
        case LogLevel::Error:    return kci::log_level::error;
        case LogLevel::Critical: return kci::log_level::critical;
        case LogLevel::Off:      return kci::log_level::off;
    }
    return kci::log_level::info;
}

constexpr std::array<LogLevel, kLogCategoryCount> kDefaultCategoryLevels = {
    LogLevel::Info,     // Core
    LogLevel::Info,     // Auth
    LogLevel::Warning,  // Crypto
    LogLevel::Info,     // Storage
    LogLevel::Info,     // Http
    LogLevel::Info      // Config
};

std::string formatContext(const LogContext& ctx) {
    std::ostringstream oss;
    bool first = true;
    auto append = [&](std::string_view key, std::string_view val) {
        if (!first) {
            oss << ", ";
        }
        oss << key << '=' << val;
        first = false;
    };

    if (ctx.requestId && !ctx.requestId->empty()) {
        append("request_id", *ctx.requestId);
    }
    if (ctx.username && !ctx.username->empty()) {
        append("username", *ctx.username);
    }
    for (const auto& [key, val] : ctx.extra) {
        append(key, val);
    }
    return oss.str();
}

std::string formatLine(LogCategory cat, std::string_view msg, std::string_view ctx) {
    std::string line;
    line.reserve(msg.size() + ctx.size() + 16);
    line += '[';
    line += logCategoryName(cat);
    line += "] ";
    line += msg;
    if (!ctx.empty()) {
        line += " {";
        line += ctx;
        line += '}';
    }
    return line;
}

} // namespace

struct ServiceLogger::Impl {
    std::array<std::atomic<LogLevel>, kLogCategoryCount> levels;
    std::array<std::string, kLogCategoryCount> loggerNames;

    Impl() {
        for (std::size_t i = 0; i < kLogCategoryCount; ++i) {
            levels[i].store(kDefaultCategoryLevels[i], std::memory_order_relaxed);
            loggerNames[i] = "tmauth." +
                std::string(logCategoryName(static_cast<LogCategory>(i)));
        }
    }

    /// Named category logger if one was registered, else the default logger.
    std::shared_ptr<kci::ILogger> backendFor(LogCategory cat) const {
        auto& registry = kci::GlobalLoggerRegistry::instance();
        auto named = registry.get_logger(loggerNames[static_cast<std::size_t>(cat)]);
        if (named && named != kci::GlobalLoggerRegistry::null_logger()) {
            return named;
        }
        return registry.get_default_logger();
    }

    void emit(LogLevel level, LogCategory cat, const std::string& line) const {
        auto backend = backendFor(cat);
        if (!backend) {
            return;
        }
        // Logging must never fail the caller; a rejected line is dropped.
        auto result = backend->log(toBackendLevel(level), line);
        (void)result;
    }
};

ServiceLogger::ServiceLogger() : impl_(std::make_unique<Impl>()) {}

ServiceLogger::~ServiceLogger() = default;

ServiceLogger::ServiceLogger(ServiceLogger&&) noexcept = default;
ServiceLogger& ServiceLogger::operator=(ServiceLogger&&) noexcept = default;

void ServiceLogger::log(LogLevel level, LogCategory cat, std::string_view msg) {
    if (!isEnabled(level, cat)) {
        return;
    }
    impl_->emit(level, cat, formatLine(cat, msg, {}));
}

void ServiceLogger::logWithContext(LogLevel level, LogCategory cat,
                                   std::string_view msg, const LogContext& ctx) {
    if (!isEnabled(level, cat)) {
        return;
    }
    impl_->emit(level, cat, formatLine(cat, msg, formatContext(ctx)));
}

void ServiceLogger::setCategoryLevel(LogCategory cat, LogLevel minLevel) {
    auto idx = static_cast<std::size_t>(cat);
    if (idx < kLogCategoryCount) {
        impl_->levels[idx].store(minLevel, std::memory_order_release);
    }
}

LogLevel ServiceLogger::getCategoryLevel(LogCategory cat) const {
    auto idx = static_cast<std::size_t>(cat);
    if (idx < kLogCategoryCount) {
        return impl_->levels[idx].load(std::memory_order_acquire);
    }
    return LogLevel::Off;
}

bool ServiceLogger::isEnabled(LogLevel level, LogCategory cat) const {
    auto idx = static_cast<std::size_t>(cat);
    if (idx >= kLogCategoryCount || level == LogLevel::Off) {
        return false;
    }
    auto minLevel = impl_->levels[idx].load(std::memory_order_acquire);
    return static_cast<uint8_t>(level) >= static_cast<uint8_t>(minLevel);
}

ServiceResult<LogLevel> ServiceLogger::parseLevel(std::string_view name) {
    std::string lowered(name);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    for (uint8_t i = 0; i <= static_cast<uint8_t>(LogLevel::Off); ++i) {
        auto level = static_cast<LogLevel>(i);
        std::string candidate(logLevelName(level));
        std::transform(candidate.begin(), candidate.end(), candidate.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (candidate == lowered) {
            return ServiceResult<LogLevel>::ok(level);
        }
    }
    if (lowered == "warn") {
        return ServiceResult<LogLevel>::ok(LogLevel::Warning);
    }
    return ServiceResult<LogLevel>::err(
        ServiceError(ErrorCode::ConfigTypeMismatch,
                     "unknown log level: " + std::string(name)));
}

ServiceResult<void> ServiceLogger::flush() {
    auto logger = kci::GlobalLoggerRegistry::instance().get_default_logger();
    if (!logger) {
        return ServiceResult<void>::ok();
    }
    auto result = logger->flush();
    if (result.is_err()) {
        return ServiceResult<void>::err(
            ServiceError(ErrorCode::LoggerFlushFailed, "failed to flush logger"));
    }
    return ServiceResult<void>::ok();
}

ServiceLogger& ServiceLogger::instance() {
    static ServiceLogger inst;
    return inst;
}

} // namespace tmauth::foundation
