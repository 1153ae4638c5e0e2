/// @file admission_http_server.cpp
/// @brief Poll-based HTTP front end.
///
/// Single-threaded POSIX responder: one request per connection, handled
/// on the server thread, `Connection: close` on every response.

#include "agw/service/admission_http_server.hpp"

#include "agw/foundation/gateway_error.hpp"
#include "agw/foundation/gateway_logger.hpp"
#include "agw/foundation/gateway_metrics.hpp"

#include <array>
#include <atomic>
#include <map>
#include <mutex>
#include <optional>
#include <sstream>
#include <string_view>
#include <thread>
#include <vector>

// POSIX socket headers
#include <cerrno>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace agw::service {

using foundation::ErrorCode;
using foundation::GatewayError;
using foundation::GatewayResult;
using foundation::LogCategory;
using http::HttpRequest;
using http::HttpResponse;

namespace {

constexpr std::size_t kMaxRequestBytes = 8192;

std::string healthToJson(const foundation::HealthCheckResult& result,
                         std::chrono::seconds uptime) {
    std::ostringstream out;
    out << R"({"status":")" << foundation::healthStatusName(result.status)
        << R"(","service":")" << result.serviceName
        << R"(","uptime_seconds":)" << uptime.count();

    if (!result.components.empty()) {
        out << R"(,"components":{)";
        bool first = true;
        for (const auto& [name, status] : result.components) {
            if (!first) { out << ","; }
            first = false;
            out << R"(")" << name << R"(":")" << foundation::healthStatusName(status) << R"(")";
        }
        out << "}";
    }

    out << "}";
    return out.str();
}

// Reads until the end of the header block, the size cap or the deadline.
std::string readRequest(int fd, std::chrono::milliseconds timeout) {
    std::string request;
    std::array<char, 2048> buf{};
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (request.size() < kMaxRequestBytes) {
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (left.count() <= 0) {
            return {};
        }

        struct pollfd pfd{};
        pfd.fd = fd;
        pfd.events = POLLIN;
        int ret = poll(&pfd, 1, static_cast<int>(left.count()));
        if (ret < 0 && errno == EINTR) {
            continue;
        }
        if (ret <= 0) {
            return {};
        }

        auto n = ::read(fd, buf.data(), buf.size());
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n <= 0) {
            break;
        }
        request.append(buf.data(), static_cast<std::size_t>(n));
        if (request.find("\r\n\r\n") != std::string::npos ||
            request.find("\n\n") != std::string::npos) {
            break;
        }
    }
    return request;
}

void writeAll(int fd, std::string_view data) {
    while (!data.empty()) {
        auto n = ::write(fd, data.data(), data.size());
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n <= 0) {
            return;
        }
        data.remove_prefix(static_cast<std::size_t>(n));
    }
}

}  // namespace

// ── Impl ────────────────────────────────────────────────────────────────────

struct AdmissionHttpServer::Impl {
    struct Ticket {
        AdmissionDecision decision;
        std::chrono::system_clock::time_point deadline;
    };

    AdmissionServerConfig config;
    GatewayRuntime& runtime;
    foundation::GatewayMetrics& metrics;
    std::atomic<bool> running{false};
    std::atomic<bool> ready{false};
    std::thread serverThread;
    int listenFd{-1};
    std::chrono::steady_clock::time_point startTime{std::chrono::steady_clock::now()};

    mutable std::mutex ticketMutex;
    std::map<uint64_t, Ticket> tickets;
    uint64_t nextTicket{1};

    Impl(AdmissionServerConfig cfg, GatewayRuntime& rt, foundation::GatewayMetrics& m)
        : config(std::move(cfg)), runtime(rt), metrics(m) {}

    void run() {
        auto lastPurge = std::chrono::steady_clock::now();
        while (running.load(std::memory_order_relaxed)) {
            struct pollfd pfd{};
            pfd.fd = listenFd;
            pfd.events = POLLIN;

            // 200ms keeps shutdown and ticket expiry responsive.
            int ret = poll(&pfd, 1, 200);
            if (ret > 0 && (pfd.revents & POLLIN) != 0) {
                int clientFd = accept(listenFd, nullptr, nullptr);
                if (clientFd >= 0) {
                    handleClient(clientFd);
                    close(clientFd);
                }
            }

            expire();
            auto now = std::chrono::steady_clock::now();
            if (now - lastPurge >= std::chrono::seconds(1)) {
                runtime.purgeExpired();
                lastPurge = now;
            }
        }
    }

    void handleClient(int clientFd) {
        auto raw = readRequest(clientFd, config.readTimeout);
        if (raw.empty()) {
            return;
        }

        HttpResponse response;
        auto request = http::parseRequest(raw);
        if (!request) {
            response = http::errorResponse(400, "InvalidRequest", request.error().message());
        } else {
            response = dispatch(request.value());
        }
        writeAll(clientFd, response.serialize());
    }

    HttpResponse dispatch(const HttpRequest& request) {
        const auto& path = request.path;
        const auto& method = request.method;

        if (path == "/admit") {
            return method == "GET" ? admit(request) : methodNotAllowed();
        }
        if (path == "/complete") {
            return method == "POST" ? complete(request) : methodNotAllowed();
        }
        if (path == "/overrides") {
            if (method == "POST") {
                return createOverride(request);
            }
            if (method == "DELETE") {
                return expireOverride(request);
            }
            return methodNotAllowed();
        }
        if (path == "/healthz") {
            return health(200);
        }
        if (path == "/readyz") {
            if (ready.load(std::memory_order_relaxed)) {
                return health(200);
            }
            HttpResponse r;
            r.status = 503;
            r.body = R"({"status":"not_ready","service":")" + config.serviceName + R"("})";
            return r;
        }
        if (path == "/metrics") {
            HttpResponse r;
            r.contentType = "text/plain; version=0.0.4; charset=utf-8";
            r.body = metrics.scrape();
            return r;
        }
        return http::errorResponse(404, "NotFound", "no such endpoint");
    }

    static HttpResponse methodNotAllowed() {
        return http::errorResponse(405, "MethodNotAllowed", "method not allowed");
    }

    HttpResponse health(int status) {
        auto result = metrics.healthCheck();
        result.serviceName = config.serviceName;
        auto uptime = std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::steady_clock::now() - startTime);
        HttpResponse r;
        r.status = status;
        r.body = healthToJson(result, uptime);
        return r;
    }

    // ── /admit ──

    HttpResponse admit(const HttpRequest& request) {
        auto parsed = http::admissionRequestFromQuery(request.query);
        if (!parsed) {
            return http::errorResponse(400, "InvalidRequest", parsed.error().message());
        }

        auto decision = runtime.gateway().admit(parsed.value());
        if (!decision.allowed) {
            return http::admissionResponse(decision, std::nullopt);
        }

        std::lock_guard lock(ticketMutex);
        const auto ticket = nextTicket++;
        auto response = http::admissionResponse(decision, ticket);
        tickets.emplace(ticket, Ticket{std::move(decision),
                                       runtime.clock().now() + config.leaseTimeout});
        return response;
    }

    // ── /complete ──

    HttpResponse complete(const HttpRequest& request) {
        const auto* ticketText = http::findParam(request.query, "ticket");
        auto ticket = ticketText ? http::parseUnsigned(*ticketText) : std::nullopt;
        if (!ticket) {
            return http::errorResponse(400, "InvalidRequest", "ticket is required");
        }

        bool success = true;
        if (const auto* s = http::findParam(request.query, "success")) {
            if (*s == "true" || *s == "1") {
                success = true;
            } else if (*s == "false" || *s == "0") {
                success = false;
            } else {
                return http::errorResponse(400, "InvalidRequest", "success must be true or false");
            }
        }

        std::chrono::milliseconds latency{0};
        if (const auto* l = http::findParam(request.query, "latency_ms")) {
            auto ms = http::parseSigned(*l);
            if (!ms || *ms < 0) {
                return http::errorResponse(400, "InvalidRequest",
                                           "latency_ms must be a non-negative integer");
            }
            latency = std::chrono::milliseconds(*ms);
        }

        std::optional<Ticket> held;
        {
            std::lock_guard lock(ticketMutex);
            auto it = tickets.find(*ticket);
            if (it != tickets.end()) {
                held = std::move(it->second);
                tickets.erase(it);
            }
        }
        if (!held) {
            return http::errorResponse(404, "UnknownTicket", "ticket unknown or expired");
        }

        runtime.gateway().reportOutcome(held->decision, success, latency);
        HttpResponse r;
        r.body = R"({"completed":true})";
        return r;
    }

    // ── /overrides ──

    HttpResponse createOverride(const HttpRequest& request) {
        auto parsed = http::overrideRequestFromQuery(request.query, runtime.clock().now(),
                                                     runtime.overrides().maxLifetime());
        if (!parsed) {
            return http::errorResponse(400, "InvalidRequest", parsed.error().message());
        }
        auto created = runtime.gateway().createOverride(std::move(parsed).value());
        if (!created) {
            return http::errorResponse(400, "InvalidOverride", created.error().message());
        }
        HttpResponse r;
        r.body = http::overrideToJson(created.value());
        return r;
    }

    HttpResponse expireOverride(const HttpRequest& request) {
        const auto* idText = http::findParam(request.query, "id");
        auto id = idText ? http::parseUnsigned(*idText) : std::nullopt;
        if (!id) {
            return http::errorResponse(400, "InvalidRequest", "id is required");
        }
        const auto* by = http::findParam(request.query, "issued_by");
        auto expired = runtime.gateway().expireOverride(foundation::OverrideId(*id),
                                                        by ? *by : std::string("operator"));
        if (!expired) {
            return http::errorResponse(404, "OverrideNotFound", expired.error().message());
        }
        HttpResponse r;
        r.body = R"({"expired":true})";
        return r;
    }

    // ── Tickets ──

    std::size_t expire() {
        std::vector<Ticket> dropped;
        const auto now = runtime.clock().now();
        {
            std::lock_guard lock(ticketMutex);
            for (auto it = tickets.begin(); it != tickets.end();) {
                if (it->second.deadline <= now) {
                    dropped.push_back(std::move(it->second));
                    it = tickets.erase(it);
                } else {
                    ++it;
                }
            }
        }
        for (auto& t : dropped) {
            if (t.decision.lease) {
                t.decision.lease->release();
            }
        }
        if (!dropped.empty()) {
            AGW_LOG_WARN(LogCategory::Admission,
                         std::to_string(dropped.size()) + " tickets expired without completion");
        }
        return dropped.size();
    }
};

// ── Public API ──────────────────────────────────────────────────────────────

AdmissionHttpServer::AdmissionHttpServer(AdmissionServerConfig config, GatewayRuntime& runtime,
                                         foundation::GatewayMetrics& metrics)
    : impl_(std::make_unique<Impl>(std::move(config), runtime, metrics)) {}

AdmissionHttpServer::~AdmissionHttpServer() {
    stop();
}

GatewayResult<void> AdmissionHttpServer::start() {
    if (impl_->running.load()) {
        return GatewayResult<void>::err(
            GatewayError(ErrorCode::ServerAlreadyStarted, "admission server already running"));
    }

    impl_->listenFd = socket(AF_INET, SOCK_STREAM, 0);
    if (impl_->listenFd < 0) {
        return GatewayResult<void>::err(
            GatewayError(ErrorCode::ListenFailed, "failed to create admission server socket"));
    }

    int optval = 1;
    setsockopt(impl_->listenFd, SOL_SOCKET, SO_REUSEADDR, &optval, sizeof(optval));

    struct sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = INADDR_ANY;
    addr.sin_port = htons(impl_->config.port);

    if (bind(impl_->listenFd,
             reinterpret_cast<struct sockaddr*>(&addr),  // NOLINT
             sizeof(addr)) < 0) {
        close(impl_->listenFd);
        impl_->listenFd = -1;
        return GatewayResult<void>::err(
            GatewayError(ErrorCode::ListenFailed,
                         "failed to bind admission server on port " +
                             std::to_string(impl_->config.port)));
    }

    if (listen(impl_->listenFd, 128) < 0) {
        close(impl_->listenFd);
        impl_->listenFd = -1;
        return GatewayResult<void>::err(
            GatewayError(ErrorCode::ListenFailed, "failed to listen on admission server socket"));
    }

    // Port 0 asks the kernel for one; report what it picked.
    socklen_t addrLen = sizeof(addr);
    if (getsockname(impl_->listenFd,
                    reinterpret_cast<struct sockaddr*>(&addr),  // NOLINT
                    &addrLen) == 0) {
        impl_->config.port = ntohs(addr.sin_port);
    }

    impl_->startTime = std::chrono::steady_clock::now();
    impl_->running.store(true, std::memory_order_relaxed);
    impl_->serverThread = std::thread([this]() { impl_->run(); });

    AGW_LOG_INFO(LogCategory::Core,
                 "admission server listening on port " + std::to_string(impl_->config.port));
    return GatewayResult<void>::ok();
}

void AdmissionHttpServer::stop() {
    if (!impl_->running.load(std::memory_order_relaxed)) {
        return;
    }

    impl_->running.store(false, std::memory_order_relaxed);

    if (impl_->serverThread.joinable()) {
        impl_->serverThread.join();
    }
    if (impl_->listenFd >= 0) {
        close(impl_->listenFd);
        impl_->listenFd = -1;
    }
}

void AdmissionHttpServer::setReady(bool ready) {
    impl_->ready.store(ready, std::memory_order_relaxed);
    impl_->metrics.setGauge("agw_ready", ready ? 1.0 : 0.0);
}

bool AdmissionHttpServer::isRunning() const {
    return impl_->running.load(std::memory_order_relaxed);
}

uint16_t AdmissionHttpServer::port() const {
    return impl_->config.port;
}

http::HttpResponse AdmissionHttpServer::dispatch(const http::HttpRequest& request) {
    return impl_->dispatch(request);
}

std::size_t AdmissionHttpServer::expireTickets() {
    return impl_->expire();
}

std::size_t AdmissionHttpServer::openTickets() const {
    std::lock_guard lock(impl_->ticketMutex);
    return impl_->tickets.size();
}

}  // namespace agw::service
