/// @file http_server.cpp
/// @brief HTTP/1.1 server implementation.
///
/// POSIX sockets with poll(): the acceptor wakes every 500ms to observe
/// shutdown and hands each connection to a kcenon thread_pool job; jobs
/// bound every read by the configured timeout.

#include "tmauth/service/http_server.hpp"

#include "tmauth/foundation/error_code.hpp"
#include "tmauth/foundation/service_error.hpp"
#include "tmauth/foundation/service_logger.hpp"
#include "tmauth/service/form_codec.hpp"

#include "../auth/json_utils.hpp"

// kcenon thread_system headers (hidden behind PIMPL)
#include <kcenon/thread/core/job_builder.h>
#include <kcenon/thread/core/thread_pool.h>
#include <kcenon/thread/core/thread_worker.h>

#include <algorithm>
#include <array>
#include <atomic>
#include <cctype>
#include <charconv>
#include <exception>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <thread>
#include <variant>
#include <vector>

// POSIX socket headers
#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace tmauth::service {

using foundation::ErrorCode;
using foundation::LogCategory;
using foundation::ServiceError;
using foundation::ServiceResult;

namespace {

constexpr std::string_view kHeadTerminator = "\r\n\r\n";

/// Serialize a response with Content-Length and Connection: close.
std::string serialize(const HttpResponse& response) {
    std::ostringstream out;
    out << "HTTP/1.1 " << response.status << ' ' << httpReasonPhrase(response.status)
        << "\r\n";
    for (const auto& [name, value] : response.headers) {
        out << name << ": " << value << "\r\n";
    }
    out << "Content-Length: " << response.body.size()
        << "\r\nConnection: close"
        << "\r\n\r\n"
        << response.body;
    return out.str();
}

HttpResponse plainError(int status, std::string_view error, std::string_view message) {
    return HttpResponse::json(status, "{\"error\":" + detail::jsonQuote(error) +
                                          ",\"message\":" + detail::jsonQuote(message) + "}");
}

std::string_view trim(std::string_view s) {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) {
        s.remove_prefix(1);
    }
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t' || s.back() == '\r')) {
        s.remove_suffix(1);
    }
    return s;
}

bool isToken(std::string_view s) {
    return !s.empty() && std::all_of(s.begin(), s.end(), [](unsigned char c) {
        return std::isalnum(c) || (c != 0 && std::strchr("!#$%&'*+-.^_`|~", c) != nullptr);
    });
}

/// Outcome of reading a request: either a request or a ready-made error response.
struct ParsedRequest {
    std::optional<HttpRequest> request;
    HttpResponse error;
};

ParsedRequest badRequest(std::string_view message) {
    return ParsedRequest{std::nullopt, plainError(400, "bad_request", message)};
}

/// Parse the request line and headers. @p head excludes the blank line.
ParsedRequest parseHead(std::string_view head) {
    auto lineEnd = head.find("\r\n");
    auto requestLine = head.substr(0, lineEnd);

    auto sp1 = requestLine.find(' ');
    auto sp2 = sp1 == std::string_view::npos ? sp1 : requestLine.find(' ', sp1 + 1);
    if (sp2 == std::string_view::npos) {
        return badRequest("malformed request line");
    }
    auto method = requestLine.substr(0, sp1);
    auto target = requestLine.substr(sp1 + 1, sp2 - sp1 - 1);
    auto version = requestLine.substr(sp2 + 1);
    if (!isToken(method) || version.substr(0, 7) != "HTTP/1.") {
        return badRequest("malformed request line");
    }

    auto parsedTarget = parseRequestTarget(target);
    if (!parsedTarget) {
        return badRequest(parsedTarget.error().message());
    }

    HttpRequest request;
    request.method = std::string(method);
    request.path = std::move(parsedTarget.value().path);
    request.query = std::move(parsedTarget.value().query);

    std::size_t pos = lineEnd == std::string_view::npos ? head.size() : lineEnd + 2;
    while (pos < head.size()) {
        auto next = head.find("\r\n", pos);
        auto line = head.substr(pos, next == std::string_view::npos ? next : next - pos);
        pos = next == std::string_view::npos ? head.size() : next + 2;

        auto colon = line.find(':');
        if (colon == std::string_view::npos || !isToken(line.substr(0, colon))) {
            return badRequest("malformed header line");
        }
        auto name = line.substr(0, colon);
        auto value = std::string(trim(line.substr(colon + 1)));
        // Authorization is single-valued; a repeat must not silently override.
        if (request.header(name).has_value()) {
            return badRequest("duplicate header: " + std::string(name));
        }
        request.setHeader(name, std::move(value));
    }
    return ParsedRequest{std::move(request), {}};
}

}  // namespace

// -- Connection -----------------------------------------------------------------

namespace {

/// One accepted socket and its slot in the in-flight count. release() runs
/// once, from the job that served it or from the destructor of a job the
/// pool never ran.
class Connection {
public:
    Connection(int fd, std::atomic<std::size_t>& inFlight) : fd_(fd), inFlight_(inFlight) {
        inFlight_.fetch_add(1, std::memory_order_acq_rel);
    }
    ~Connection() { release(); }

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    [[nodiscard]] int fd() const { return fd_; }

    void release() {
        if (fd_ < 0) {
            return;
        }
        // Free the slot before the peer can observe the close.
        inFlight_.fetch_sub(1, std::memory_order_acq_rel);
        close(fd_);
        fd_ = -1;
    }

private:
    int fd_;
    std::atomic<std::size_t>& inFlight_;
};

}  // namespace

// -- Impl ---------------------------------------------------------------------

struct HttpServer::Impl {
    HttpServerConfig config;
    HttpHandler handler;
    std::atomic<bool> running{false};
    int listenFd{-1};
    uint16_t boundPort{0};
    std::thread acceptThread;

    // Declared before the pool so queued connections can still release into it.
    std::atomic<std::size_t> inFlight{0};
    std::shared_ptr<kcenon::thread::thread_pool> pool;

    Impl(HttpServerConfig cfg, HttpHandler h)
        : config(std::move(cfg)), handler(std::move(h)) {}

    void acceptLoop() {
        while (running.load(std::memory_order_relaxed)) {
            struct pollfd pfd{};
            pfd.fd = listenFd;
            pfd.events = POLLIN;

            // Poll with 500ms timeout for shutdown responsiveness.
            int ret = poll(&pfd, 1, 500);
            if (ret <= 0 || (pfd.revents & POLLIN) == 0) {
                continue;
            }

            int clientFd = accept(listenFd, nullptr, nullptr);
            if (clientFd < 0) {
                continue;
            }

            auto connection = std::make_shared<Connection>(clientFd, inFlight);
            if (inFlight.load(std::memory_order_acquire) > config.maxPendingConnections) {
                TMAUTH_LOG_WARN(LogCategory::Http, "connection limit reached, rejecting with 503");
                writeAll(clientFd,
                         serialize(plainError(503, "server_busy", "too many connections")));
                continue;
            }
            dispatch(std::move(connection));
        }
    }

    /// Hand a connection to the pool. A job that fails to enqueue drops the
    /// connection, which closes the socket.
    void dispatch(std::shared_ptr<Connection> connection) {
        auto job = kcenon::thread::job_builder()
            .name("tmauth_http_connection")
            .work([this, connection]() -> kcenon::common::VoidResult {
                try {
                    handleClient(connection->fd());
                } catch (const std::exception& e) {
                    TMAUTH_LOG_ERROR(LogCategory::Http,
                                     std::string("connection failed: ") + e.what());
                }
                connection->release();
                return kcenon::common::VoidResult::ok(std::monostate{});
            })
            .build();

        auto enqueued = pool->enqueue(std::move(job));
        if (enqueued.is_err()) {
            TMAUTH_LOG_WARN(LogCategory::Http, "failed to enqueue connection, dropping it");
        }
    }

    /// Wait for readable data; false on timeout, error or hangup without data.
    bool waitReadable(int fd) const {
        struct pollfd pfd{};
        pfd.fd = fd;
        pfd.events = POLLIN;
        int ret = poll(&pfd, 1, static_cast<int>(config.readTimeout.count()));
        return ret > 0 && (pfd.revents & (POLLIN | POLLHUP)) != 0;
    }

    /// Append up to @p want bytes; returns bytes read, 0 on EOF/timeout/error.
    std::size_t readSome(int fd, std::string& buffer, std::size_t want) const {
        if (!waitReadable(fd)) {
            return 0;
        }
        std::array<char, 4096> chunk{};
        for (;;) {
            auto n = read(fd, chunk.data(), std::min(want, chunk.size()));
            if (n < 0 && errno == EINTR) {
                continue;
            }
            if (n <= 0) {
                return 0;
            }
            buffer.append(chunk.data(), static_cast<std::size_t>(n));
            return static_cast<std::size_t>(n);
        }
    }

    void writeAll(int fd, std::string_view data) const {
        while (!data.empty()) {
            auto n = send(fd, data.data(), data.size(), MSG_NOSIGNAL);
            if (n < 0 && errno == EINTR) {
                continue;
            }
            if (n <= 0) {
                TMAUTH_LOG_DEBUG(LogCategory::Http,
                                 std::string("response write failed: ") + std::strerror(errno));
                return;
            }
            data.remove_prefix(static_cast<std::size_t>(n));
        }
    }

    void handleClient(int clientFd) {
        auto response = readAndDispatch(clientFd);
        if (response) {
            writeAll(clientFd, serialize(*response));
        }
    }

    /// std::nullopt when the client went away before a full request arrived.
    std::optional<HttpResponse> readAndDispatch(int clientFd) {
        std::string buffer;
        std::size_t headEnd = std::string::npos;
        while ((headEnd = buffer.find(kHeadTerminator)) == std::string::npos) {
            if (buffer.size() > config.maxRequestBytes) {
                return plainError(431, "bad_request", "request head too large");
            }
            if (readSome(clientFd, buffer, config.maxRequestBytes + 1 - buffer.size() +
                                               kHeadTerminator.size()) == 0) {
                return std::nullopt;
            }
        }

        auto parsed = parseHead(std::string_view(buffer).substr(0, headEnd));
        if (!parsed.request) {
            return parsed.error;
        }
        auto& request = *parsed.request;

        if (request.header("Transfer-Encoding").has_value()) {
            return plainError(411, "bad_request", "Content-Length required");
        }

        std::size_t contentLength = 0;
        if (auto cl = request.header("Content-Length")) {
            auto [ptr, ec] = std::from_chars(cl->data(), cl->data() + cl->size(), contentLength);
            if (cl->empty() || ec != std::errc{} || ptr != cl->data() + cl->size()) {
                return badRequest("invalid Content-Length").error;
            }
        }
        if (contentLength > config.maxRequestBytes) {
            return plainError(413, "payload_too_large", "request body too large");
        }

        std::string body = buffer.substr(headEnd + kHeadTerminator.size());
        while (body.size() < contentLength) {
            if (readSome(clientFd, body, contentLength - body.size()) == 0) {
                return std::nullopt;
            }
        }
        body.resize(contentLength);
        request.body = std::move(body);

        try {
            return handler(request);
        } catch (const std::exception& e) {
            TMAUTH_LOG_ERROR(LogCategory::Http, request.method + " " + request.path +
                                                    " failed: " + e.what());
            return plainError(500, "server_error", "internal server error");
        }
    }
};

// -- Public API ---------------------------------------------------------------

HttpServer::HttpServer(HttpServerConfig config, HttpHandler handler)
    : impl_(std::make_unique<Impl>(std::move(config), std::move(handler))) {}

HttpServer::~HttpServer() {
    stop();
}

ServiceResult<void> HttpServer::start() {
    if (impl_->running.load()) {
        return ServiceResult<void>::ok();
    }

    impl_->listenFd = socket(AF_INET, SOCK_STREAM, 0);
    if (impl_->listenFd < 0) {
        return ServiceResult<void>::err(
            ServiceError(ErrorCode::NetworkError,
                         std::string("failed to create socket: ") + std::strerror(errno)));
    }

    int optval = 1;
    if (setsockopt(impl_->listenFd, SOL_SOCKET, SO_REUSEADDR, &optval, sizeof(optval)) < 0) {
        TMAUTH_LOG_WARN(LogCategory::Http,
                        std::string("SO_REUSEADDR failed: ") + std::strerror(errno));
    }

    struct sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_ANY);
    addr.sin_port = htons(impl_->config.port);

    if (bind(impl_->listenFd,
             reinterpret_cast<struct sockaddr*>(&addr),  // NOLINT
             sizeof(addr)) < 0) {
        std::string reason = std::strerror(errno);
        close(impl_->listenFd);
        impl_->listenFd = -1;
        return ServiceResult<void>::err(
            ServiceError(ErrorCode::ListenFailed,
                         "failed to bind port " + std::to_string(impl_->config.port) + ": " +
                             reason));
    }

    if (listen(impl_->listenFd, SOMAXCONN) < 0) {
        std::string reason = std::strerror(errno);
        close(impl_->listenFd);
        impl_->listenFd = -1;
        return ServiceResult<void>::err(
            ServiceError(ErrorCode::ListenFailed, "failed to listen: " + reason));
    }

    struct sockaddr_in bound{};
    socklen_t boundLen = sizeof(bound);
    if (getsockname(impl_->listenFd,
                    reinterpret_cast<struct sockaddr*>(&bound),  // NOLINT
                    &boundLen) == 0) {
        impl_->boundPort = ntohs(bound.sin_port);
    } else {
        impl_->boundPort = impl_->config.port;
    }

    impl_->pool = std::make_shared<kcenon::thread::thread_pool>("tmauth_http");

    auto workerCount = std::max<std::size_t>(1, impl_->config.workerThreads);
    std::vector<std::unique_ptr<kcenon::thread::thread_worker>> workers;
    workers.reserve(workerCount);
    for (std::size_t i = 0; i < workerCount; ++i) {
        workers.push_back(std::make_unique<kcenon::thread::thread_worker>());
    }
    if (impl_->pool->enqueue_batch(std::move(workers)).is_err() ||
        impl_->pool->start().is_err()) {
        impl_->pool.reset();
        close(impl_->listenFd);
        impl_->listenFd = -1;
        return ServiceResult<void>::err(
            ServiceError(ErrorCode::NetworkError, "failed to start the worker pool"));
    }

    impl_->running.store(true, std::memory_order_relaxed);
    impl_->acceptThread = std::thread([this]() { impl_->acceptLoop(); });

    TMAUTH_LOG_INFO(LogCategory::Http,
                    "listening on port " + std::to_string(impl_->boundPort));
    return ServiceResult<void>::ok();
}

void HttpServer::stop() {
    if (!impl_->running.load(std::memory_order_relaxed)) {
        return;
    }

    impl_->running.store(false, std::memory_order_relaxed);
    if (impl_->acceptThread.joinable()) {
        impl_->acceptThread.join();
    }

    if (impl_->pool) {
        auto stopped = impl_->pool->stop(false);  // graceful: finish running jobs
        if (stopped.is_err()) {
            TMAUTH_LOG_WARN(LogCategory::Http, "worker pool did not stop cleanly");
        }
        impl_->pool.reset();
    }

    if (impl_->listenFd >= 0) {
        close(impl_->listenFd);
        impl_->listenFd = -1;
    }
    TMAUTH_LOG_INFO(LogCategory::Http, "stopped");
}

bool HttpServer::isRunning() const {
    return impl_->running.load(std::memory_order_relaxed);
}

uint16_t HttpServer::port() const {
    return impl_->boundPort != 0 ? impl_->boundPort : impl_->config.port;
}

}  // namespace tmauth::service
