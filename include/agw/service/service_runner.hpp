#pragma once

/// @file service_runner.hpp
/// @brief Signal handling, config resolution and ordered shutdown for the
///        gateway daemon.

#include <atomic>
#include <chrono>
#include <filesystem>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

#include "agw/foundation/config_manager.hpp"
#include "agw/foundation/gateway_result.hpp"

namespace agw::service {

/// Installs SIGINT and SIGTERM handlers and exposes a shutdown flag.
///
/// Only one SignalHandler instance should exist per process. After
/// destruction the default handlers are restored, so a second signal
/// terminates the process immediately.
class SignalHandler {
public:
    SignalHandler();
    ~SignalHandler();

    SignalHandler(const SignalHandler&) = delete;
    SignalHandler& operator=(const SignalHandler&) = delete;

    [[nodiscard]] bool shutdownRequested() const noexcept;

    /// Block the calling thread until a shutdown signal arrives.
    void waitForShutdown() const;

    /// Raise the flag without a signal (tests, admin endpoints).
    static void requestShutdown() noexcept;

private:
    static std::atomic<bool> shutdownFlag_;
    static void handler(int signal);
};

using ShutdownHook = std::function<void()>;

/// Runs named hooks in registration order.
///
/// The gateway registers: readiness off, stop HTTP, stop health monitor,
/// flush logger.
///
/// @code
///   GracefulShutdown shutdown;
///   shutdown.addHook("readiness", [&]() { server.setReady(false); });
///   shutdown.addHook("http",      [&]() { server.stop(); });
///   shutdown.addHook("health",    [&]() { runtime->stop(); });
///   shutdown.execute();
/// @endcode
class GracefulShutdown {
public:
    void addHook(std::string name, ShutdownHook hook);

    /// Execute all hooks in order. A throwing hook is logged and the
    /// remaining hooks still run.
    void execute();

    [[nodiscard]] std::size_t hookCount() const;

    /// Hooks that finished, in execution order (for diagnostics).
    [[nodiscard]] const std::vector<std::string>& completed() const noexcept {
        return completed_;
    }

private:
    struct Hook {
        std::string name;
        ShutdownHook callback;
    };
    std::vector<Hook> hooks_;
    std::vector<std::string> completed_;
};

/// Default configuration path when neither CLI nor environment names one.
inline constexpr std::string_view kDefaultConfigPath = "/etc/agw/gateway.yaml";

/// Pick the config path: @p cliPath, else AGW_CONFIG_PATH, else the default.
[[nodiscard]] std::filesystem::path resolveConfigPath(const std::filesystem::path& cliPath);

/// Load the YAML file chosen by resolveConfigPath() into @p config.
/// @return Success or ConfigLoadFailed.
[[nodiscard]] foundation::GatewayResult<void>
loadConfig(foundation::ConfigManager& config, const std::filesystem::path& cliPath);

/// Parse `--config <path>` from command-line arguments.
/// @return The path, or empty if not given.
[[nodiscard]] std::filesystem::path parseConfigArg(int argc, char* argv[]);

}  // namespace agw::service
