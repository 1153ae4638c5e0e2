#pragma once

/// @file health_probe.hpp
/// @brief Active health probes run by the HealthMonitor sampler.

#include "agw/foundation/gateway_result.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

namespace agw::service {

struct ProbeResult {
    bool success = false;
    std::chrono::milliseconds latency{0};
};

/// A probe is any callable returning a ProbeResult. Exceptions thrown by
/// a probe are recorded as failures.
using HealthProbe = std::function<ProbeResult()>;

/// `host:port` split. IPv6 literals use brackets: `[::1]:8443`.
struct ProbeAddress {
    std::string host;
    uint16_t port = 0;

    [[nodiscard]] static foundation::GatewayResult<ProbeAddress> parse(std::string_view text);
};

/// Probe that succeeds when a TCP connection to the address completes
/// within the timeout. Uses a non-blocking connect and poll().
class TcpConnectProbe {
public:
    TcpConnectProbe(ProbeAddress address, std::chrono::milliseconds timeout);

    ProbeResult operator()() const;

    [[nodiscard]] const ProbeAddress& address() const noexcept { return address_; }

private:
    ProbeAddress address_;
    std::chrono::milliseconds timeout_;
};

}  // namespace agw::service
