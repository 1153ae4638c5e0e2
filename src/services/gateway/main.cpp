/// @file main.cpp
/// @brief Admission gateway daemon entry point.
///
/// Loads and validates the configuration, assembles the components,
/// starts health monitoring and the HTTP front end, then waits for
/// SIGINT/SIGTERM and shuts down in order.

#include <cstdlib>
#include <iostream>
#include <memory>

#include "agw/foundation/clock.hpp"
#include "agw/foundation/config_manager.hpp"
#include "agw/foundation/gateway_logger.hpp"
#include "agw/foundation/gateway_metrics.hpp"
#include "agw/service/admission_http_server.hpp"
#include "agw/service/gateway_runtime.hpp"
#include "agw/service/gateway_settings.hpp"
#include "agw/service/service_runner.hpp"
#include "agw/version.hpp"

int main(int argc, char* argv[]) {
    agw::service::SignalHandler signals;

    agw::foundation::ConfigManager config;
    auto loadResult = agw::service::loadConfig(config, agw::service::parseConfigArg(argc, argv));
    if (!loadResult) {
        std::cerr << "Failed to load config: " << loadResult.error().message() << "\n";
        return EXIT_FAILURE;
    }

    auto settings = agw::service::loadGatewaySettings(config);
    if (!settings) {
        std::cerr << "Rejected config: " << settings.error().message() << "\n";
        return EXIT_FAILURE;
    }

    agw::foundation::SystemClock clock;
    auto& metrics = agw::foundation::GatewayMetrics::instance();
    metrics.setServiceName(settings.value().serviceName);

    auto runtime = agw::service::GatewayRuntime::create(settings.value(), clock, metrics);
    if (!runtime) {
        std::cerr << "Failed to assemble gateway: " << runtime.error().message() << "\n";
        return EXIT_FAILURE;
    }
    auto& rt = *runtime.value();

    auto monitorResult = rt.start();
    if (!monitorResult) {
        std::cerr << "Failed to start health monitor: " << monitorResult.error().message()
                  << "\n";
        return EXIT_FAILURE;
    }

    agw::service::AdmissionHttpServer server(
        {.port = settings.value().httpPort,
         .serviceName = settings.value().serviceName,
         .leaseTimeout = settings.value().leaseTimeout,
         .readTimeout = settings.value().readTimeout},
        rt, metrics);

    auto startResult = server.start();
    if (!startResult) {
        std::cerr << "Failed to start admission server: " << startResult.error().message()
                  << "\n";
        rt.stop();
        return EXIT_FAILURE;
    }
    server.setReady(true);

    std::cout << "Admission gateway " << agw::Version::string << " listening on port "
              << server.port() << "\n";

    signals.waitForShutdown();

    agw::service::GracefulShutdown shutdown;
    shutdown.addHook("readiness", [&]() { server.setReady(false); });
    shutdown.addHook("http", [&]() { server.stop(); });
    shutdown.addHook("health", [&]() { rt.stop(); });
    shutdown.addHook("logger", []() {
        auto flushed = agw::foundation::GatewayLogger::instance().flush();
        if (!flushed) {
            std::cerr << "Logger flush failed: " << flushed.error().message() << "\n";
        }
    });
    shutdown.execute();

    std::cout << "Admission gateway stopped\n";
    return EXIT_SUCCESS;
}
