#pragma once

/// @file admission_http_server.hpp
/// @brief Poll-based HTTP/1.1 front end for the admission gateway.
///
/// Endpoints:
///   - GET    /admit      -> AdmissionDecision JSON (200/429/503/500/403/400)
///   - POST   /complete   -> release a ticket and record the upstream outcome
///   - POST   /overrides  -> create an emergency override
///   - DELETE /overrides  -> expire an override
///   - GET    /healthz, /readyz, /metrics

#include "agw/foundation/gateway_result.hpp"
#include "agw/service/gateway_runtime.hpp"
#include "agw/service/http_codec.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

namespace agw::foundation {
class GatewayMetrics;
}

namespace agw::service {

struct AdmissionServerConfig {
    uint16_t port = 8080;

    std::string serviceName = "agw";

    /// Tickets not completed within this time lose their lease silently.
    std::chrono::seconds leaseTimeout{30};

    /// Connections that have not sent a full header block by then are dropped.
    std::chrono::milliseconds readTimeout{2000};
};

/// HTTP responder owning the ticket table that maps `/admit` responses
/// to their upstream leases.
///
/// @code
///   AdmissionHttpServer server({.port = 8080, .serviceName = "agw"}, *runtime, metrics);
///   server.start();
///   server.setReady(true);
///   // ...
///   server.stop();
/// @endcode
///
/// Runs one background thread. dispatch() may also be called directly.
class AdmissionHttpServer {
public:
    AdmissionHttpServer(AdmissionServerConfig config, GatewayRuntime& runtime,
                        foundation::GatewayMetrics& metrics);
    ~AdmissionHttpServer();

    AdmissionHttpServer(const AdmissionHttpServer&) = delete;
    AdmissionHttpServer& operator=(const AdmissionHttpServer&) = delete;

    /// @return ServerAlreadyStarted, or ListenFailed when the port is unusable.
    [[nodiscard]] foundation::GatewayResult<void> start();

    void stop();

    /// When false, /readyz returns 503.
    void setReady(bool ready);

    [[nodiscard]] bool isRunning() const;

    /// Listening port; after start() with port 0, the one the kernel picked.
    [[nodiscard]] uint16_t port() const;

    /// Route one parsed request.
    [[nodiscard]] http::HttpResponse dispatch(const http::HttpRequest& request);

    /// Release leases of tickets past the lease timeout.
    /// @return Number of tickets dropped.
    std::size_t expireTickets();

    [[nodiscard]] std::size_t openTickets() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace agw::service
