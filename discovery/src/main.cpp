#include "config.hpp"
#include "service_catalog.hpp"
#include "service_discovery.hpp"
#include "status_server.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <csignal>
#include <condition_variable>
#include <memory>
#include <mutex>

// For graceful shutdown
std::mutex shutdown_mutex;
std::condition_variable shutdown_cv;
bool shutdown_requested = false;

void signal_handler(int signum) {
    {
        std::lock_guard<std::mutex> lock(shutdown_mutex);
        if (shutdown_requested) return;
        shutdown_requested = true;
    }
    shutdown_cv.notify_one();
    spdlog::warn("Signal {} received, initiating graceful shutdown.", signum);
}

int main() {
    // Setup logging
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>("discovery", console_sink);
    spdlog::set_default_logger(logger);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [tid %t] %v");

    try {
        // 1. Load configuration
        Config config = Config::from_env();
        spdlog::set_level(spdlog::level::from_str(config.log_level));
        spdlog::flush_on(spdlog::level::info);
        config.validate();
        spdlog::info("Starting {}...", config.service_name);

        // 2. Build the endpoint set and the registry
        auto definitions = ServiceCatalog::load(config);
        ServiceDiscovery discovery(config, definitions);

        for (const auto& def : definitions) {
            spdlog::info("  {:<16} {} ({})", def.name, def.health_url(), def.required ? "required" : "optional");
        }

        // 3. Register signal handlers for graceful shutdown
        signal(SIGINT, signal_handler);
        signal(SIGTERM, signal_handler);

        // 4. Optionally block until the required services answer
        if (config.wait_for_core_on_start) {
            auto [ready, services] = discovery.wait_for_core_services();
            if (!ready) {
                spdlog::warn("Continuing with {} of the required services healthy", services.size());
            }
        }

        // 5. Start monitoring and the status endpoint
        discovery.start_health_monitoring();

        StatusServer status_server(config, discovery);
        if (!status_server.start()) {
            spdlog::warn("Status endpoint unavailable, continuing without it");
        }

        {
            std::unique_lock<std::mutex> lock(shutdown_mutex);
            shutdown_cv.wait(lock, [] { return shutdown_requested; });
        }

        status_server.stop();
        discovery.stop_health_monitoring();

    } catch (const std::exception& e) {
        spdlog::critical("A critical error occurred: {}", e.what());
        return 1;
    }

    spdlog::info("Service discovery has shut down gracefully.");
    return 0;
}
