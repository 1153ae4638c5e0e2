/// @file service_runner.cpp
/// @brief Daemon entry-point utilities.

#include "agw/service/service_runner.hpp"

#include "agw/foundation/gateway_logger.hpp"

#include <chrono>
#include <csignal>
#include <cstdlib>
#include <exception>
#include <thread>

namespace agw::service {

using foundation::LogCategory;

// -- SignalHandler -----------------------------------------------------------

std::atomic<bool> SignalHandler::shutdownFlag_{false};

void SignalHandler::handler(int /*signal*/) {
    // async-signal-safe: relaxed store on a lock-free atomic.
    shutdownFlag_.store(true, std::memory_order_relaxed);
}

SignalHandler::SignalHandler() {
    shutdownFlag_.store(false, std::memory_order_relaxed);
    std::signal(SIGINT, &SignalHandler::handler);
    std::signal(SIGTERM, &SignalHandler::handler);
}

SignalHandler::~SignalHandler() {
#if defined(__GNUC__) || defined(__clang__)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wold-style-cast"
#endif
    std::signal(SIGINT, SIG_DFL);
    std::signal(SIGTERM, SIG_DFL);
#if defined(__GNUC__) || defined(__clang__)
#pragma GCC diagnostic pop
#endif
}

bool SignalHandler::shutdownRequested() const noexcept {
    return shutdownFlag_.load(std::memory_order_relaxed);
}

void SignalHandler::waitForShutdown() const {
    using namespace std::chrono_literals;
    while (!shutdownFlag_.load(std::memory_order_relaxed)) {
        std::this_thread::sleep_for(100ms);
    }
}

void SignalHandler::requestShutdown() noexcept {
    shutdownFlag_.store(true, std::memory_order_relaxed);
}

// -- GracefulShutdown --------------------------------------------------------

void GracefulShutdown::addHook(std::string name, ShutdownHook hook) {
    hooks_.push_back(Hook{std::move(name), std::move(hook)});
}

void GracefulShutdown::execute() {
    for (const auto& hook : hooks_) {
        AGW_LOG_INFO(LogCategory::Core, "shutdown: " + hook.name);
        try {
            hook.callback();
            completed_.push_back(hook.name);
        } catch (const std::exception& e) {
            AGW_LOG_ERROR(LogCategory::Core,
                          "shutdown hook '" + hook.name + "' failed: " + e.what());
        }
    }
}

std::size_t GracefulShutdown::hookCount() const {
    return hooks_.size();
}

// -- Config loading ----------------------------------------------------------

std::filesystem::path resolveConfigPath(const std::filesystem::path& cliPath) {
    if (!cliPath.empty()) {
        return cliPath;
    }
    const char* envPath = std::getenv("AGW_CONFIG_PATH");
    if (envPath != nullptr && *envPath != '\0') {
        return envPath;
    }
    return std::filesystem::path(kDefaultConfigPath);
}

foundation::GatewayResult<void> loadConfig(foundation::ConfigManager& config,
                                           const std::filesystem::path& cliPath) {
    return config.load(resolveConfigPath(cliPath));
}

// -- CLI argument parsing ----------------------------------------------------

std::filesystem::path parseConfigArg(int argc, char* argv[]) {
    for (int i = 1; i < argc - 1; ++i) {
        if (std::string_view(argv[i]) == "--config") {  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
            return argv[i + 1];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        }
    }
    return {};
}

}  // namespace agw::service
