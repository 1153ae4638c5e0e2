/// @file health_probe.cpp
/// @brief ProbeAddress parsing and TcpConnectProbe.
///
/// Uses POSIX sockets: non-blocking connect, then poll() for writability
/// up to the probe timeout.

#include "agw/service/health_probe.hpp"

#include <charconv>

// POSIX socket headers
#include <cerrno>
#include <fcntl.h>
#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace agw::service {

using foundation::ErrorCode;
using foundation::GatewayError;
using foundation::GatewayResult;

GatewayResult<ProbeAddress> ProbeAddress::parse(std::string_view text) {
    auto bad = [&](std::string_view why) {
        return GatewayResult<ProbeAddress>::err(
            GatewayError(ErrorCode::InvalidArgument,
                         "probe address '" + std::string(text) + "': " + std::string(why)));
    };

    std::string_view host;
    std::string_view portText;
    if (!text.empty() && text.front() == '[') {
        auto closing = text.find(']');
        if (closing == std::string_view::npos || closing + 1 >= text.size() ||
            text[closing + 1] != ':') {
            return bad("expected [host]:port");
        }
        host = text.substr(1, closing - 1);
        portText = text.substr(closing + 2);
    } else {
        auto colon = text.rfind(':');
        if (colon == std::string_view::npos) {
            return bad("expected host:port");
        }
        host = text.substr(0, colon);
        portText = text.substr(colon + 1);
    }

    unsigned port = 0;
    auto [ptr, ec] = std::from_chars(portText.data(), portText.data() + portText.size(), port);
    if (host.empty() || ec != std::errc{} || ptr != portText.data() + portText.size() ||
        port == 0 || port > 65535) {
        return bad("invalid host or port");
    }
    return GatewayResult<ProbeAddress>::ok(ProbeAddress{std::string(host),
                                                        static_cast<uint16_t>(port)});
}

TcpConnectProbe::TcpConnectProbe(ProbeAddress address, std::chrono::milliseconds timeout)
    : address_(std::move(address)), timeout_(timeout) {}

ProbeResult TcpConnectProbe::operator()() const {
    const auto start = std::chrono::steady_clock::now();
    auto elapsed = [&] {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start);
    };

    struct addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    struct addrinfo* resolved = nullptr;
    auto port = std::to_string(address_.port);
    if (getaddrinfo(address_.host.c_str(), port.c_str(), &hints, &resolved) != 0 ||
        resolved == nullptr) {
        return ProbeResult{false, elapsed()};
    }

    bool connected = false;
    for (auto* ai = resolved; ai != nullptr && !connected; ai = ai->ai_next) {
        int fd = socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (fd < 0) {
            continue;
        }
        int flags = fcntl(fd, F_GETFL, 0);
        fcntl(fd, F_SETFL, flags | O_NONBLOCK);

        int rc = connect(fd, ai->ai_addr, ai->ai_addrlen);
        if (rc == 0) {
            connected = true;
        } else if (errno == EINPROGRESS) {
            auto remaining = timeout_ - elapsed();
            struct pollfd pfd{};
            pfd.fd = fd;
            pfd.events = POLLOUT;
            if (remaining.count() > 0 &&
                poll(&pfd, 1, static_cast<int>(remaining.count())) == 1) {
                int soError = 0;
                socklen_t len = sizeof(soError);
                if (getsockopt(fd, SOL_SOCKET, SO_ERROR, &soError, &len) == 0 && soError == 0) {
                    connected = true;
                }
            }
        }
        close(fd);
    }
    freeaddrinfo(resolved);

    return ProbeResult{connected, elapsed()};
}

}  // namespace agw::service
