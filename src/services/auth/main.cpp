/// @file main.cpp
/// @brief tmauth service entry point.
///
/// Serves /register, /token and /validate over HTTP with an in-memory
/// credential store suitable for development and testing.

#include "tmauth/foundation/config_manager.hpp"
#include "tmauth/foundation/service_logger.hpp"
#include "tmauth/service/auth_config.hpp"
#include "tmauth/service/auth_gateway.hpp"
#include "tmauth/service/credential_store.hpp"
#include "tmauth/service/http_server.hpp"
#include "tmauth/service/router.hpp"
#include "tmauth/service/service_runner.hpp"
#include "tmauth/version.hpp"

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>

namespace {

using tmauth::foundation::ConfigManager;
using tmauth::foundation::LogCategory;
using tmauth::foundation::ServiceLogger;
using tmauth::foundation::ServiceResult;

ServiceResult<tmauth::service::HttpServerConfig> buildHttpConfig(const ConfigManager& config) {
    tmauth::service::HttpServerConfig cfg;

    auto port = config.getOr<uint16_t>("http.port", cfg.port);
    if (!port) {
        return ServiceResult<tmauth::service::HttpServerConfig>::err(port.error());
    }
    cfg.port = port.value();

    auto maxBytes = config.getOr<std::size_t>("http.max_request_bytes", cfg.maxRequestBytes);
    if (!maxBytes) {
        return ServiceResult<tmauth::service::HttpServerConfig>::err(maxBytes.error());
    }
    cfg.maxRequestBytes = maxBytes.value();

    auto workers = config.getOr<std::size_t>("http.worker_threads", cfg.workerThreads);
    if (!workers) {
        return ServiceResult<tmauth::service::HttpServerConfig>::err(workers.error());
    }
    cfg.workerThreads = workers.value();

    auto pending = config.getOr<std::size_t>("http.max_pending_connections",
                                             cfg.maxPendingConnections);
    if (!pending) {
        return ServiceResult<tmauth::service::HttpServerConfig>::err(pending.error());
    }
    cfg.maxPendingConnections = pending.value();

    return ServiceResult<tmauth::service::HttpServerConfig>::ok(cfg);
}

/// "log.level" applies to every category when present.
ServiceResult<void> applyLogLevel(const ConfigManager& config) {
    auto name = config.get<std::string>("log.level");
    if (!name) {
        return ServiceResult<void>::ok();
    }
    auto level = ServiceLogger::parseLevel(name.value());
    if (!level) {
        return ServiceResult<void>::err(level.error());
    }
    for (std::size_t i = 0; i < tmauth::foundation::kLogCategoryCount; ++i) {
        ServiceLogger::instance().setCategoryLevel(static_cast<LogCategory>(i), level.value());
    }
    return ServiceResult<void>::ok();
}

}  // namespace

int main(int argc, char* argv[]) {
    tmauth::service::SignalHandler signals;

    // Resolve config path: --config flag > TMAUTH_CONFIG_PATH env > default.
    auto cliPath = tmauth::service::parseConfigArg(argc, argv);
    auto configPath = tmauth::service::resolveConfigPath(cliPath);
    bool explicitPath =
        configPath != std::filesystem::path(tmauth::service::kDefaultConfigPath);

    ConfigManager config;
    auto loadResult = tmauth::service::loadConfig(config, configPath, explicitPath);
    if (!loadResult) {
        std::cerr << "Failed to load config: " << loadResult.error().message() << "\n";
        return EXIT_FAILURE;
    }

    auto logResult = applyLogLevel(config);
    if (!logResult) {
        std::cerr << "Invalid log level: " << logResult.error().message() << "\n";
        return EXIT_FAILURE;
    }

    auto authConfig = tmauth::service::loadAuthConfig(config);
    if (!authConfig) {
        std::cerr << "Invalid auth configuration: " << authConfig.error().message() << "\n";
        return EXIT_FAILURE;
    }

    auto httpConfig = buildHttpConfig(config);
    if (!httpConfig) {
        std::cerr << "Invalid http configuration: " << httpConfig.error().message() << "\n";
        return EXIT_FAILURE;
    }

    // In-memory backend for standalone development mode.
    auto store = std::make_shared<tmauth::service::InMemoryCredentialStore>();
    tmauth::service::AuthGateway gateway(std::move(authConfig).value(), store);

    tmauth::service::Router router;
    gateway.registerRoutes(router);

    tmauth::service::HttpServer server(
        httpConfig.value(),
        [&router](const tmauth::service::HttpRequest& req) { return router.dispatch(req); });

    auto startResult = server.start();
    if (!startResult) {
        std::cerr << "Failed to start http server: " << startResult.error().message() << "\n";
        return EXIT_FAILURE;
    }

    tmauth::service::GracefulShutdown shutdown;
    shutdown.addHook("http", [&server]() { server.stop(); });
    shutdown.addHook("logger", []() {
        auto flushed = ServiceLogger::instance().flush();
        if (!flushed) {
            std::cerr << "Failed to flush logger: " << flushed.error().message() << "\n";
        }
    });

    std::cout << "tmauth " << tmauth::Version::string << " started (config: "
              << configPath.string() << ", port: " << server.port() << ")\n";

    signals.waitForShutdown();

    shutdown.execute();
    std::cout << "tmauth stopped\n";
    return EXIT_SUCCESS;
}
