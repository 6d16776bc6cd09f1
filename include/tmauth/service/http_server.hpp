#pragma once

/// @file http_server.hpp
/// @brief Minimal HTTP/1.1 server over POSIX sockets.
///
/// One request per connection, Content-Length bodies only, responses are
/// always sent with "Connection: close". Enough to carry the auth routes
/// behind a reverse proxy; TLS termination happens in front of it.

#include "tmauth/foundation/service_result.hpp"
#include "tmauth/service/http_types.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>

namespace tmauth::service {

/// Configuration for the HttpServer.
struct HttpServerConfig {
    /// TCP port to listen on. 0 binds an ephemeral port, see HttpServer::port().
    uint16_t port = 8080;

    /// Upper bound on request head and body, each. Larger bodies get 413.
    std::size_t maxRequestBytes = 65536;

    /// Pool workers, i.e. connections handled in parallel.
    std::size_t workerThreads = 4;

    /// Connections queued or in service at once. Beyond this, new
    /// connections get 503 and are closed straight away.
    std::size_t maxPendingConnections = 256;

    /// A client that sends nothing for this long is dropped.
    std::chrono::milliseconds readTimeout{5000};
};

/// Poll-based HTTP responder.
///
/// An acceptor thread submits each connection as a job to a kcenon
/// thread_pool; the job reads one request, calls the handler and closes
/// the socket.
///
/// @code
///   Router router;
///   gateway.registerRoutes(router);
///   HttpServer server({.port = 8080},
///                     [&router](const HttpRequest& req) { return router.dispatch(req); });
///   server.start();
///   // ... serve until shutdown ...
///   server.stop();
/// @endcode
class HttpServer {
public:
    HttpServer(HttpServerConfig config, HttpHandler handler);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    /// Bind, listen and start serving. ListenFailed or NetworkError on failure.
    [[nodiscard]] foundation::ServiceResult<void> start();

    /// Stop accepting, let running jobs finish and stop the pool.
    void stop();

    [[nodiscard]] bool isRunning() const;

    /// Bound port; the kernel-assigned one when configured with port 0.
    [[nodiscard]] uint16_t port() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace tmauth::service
