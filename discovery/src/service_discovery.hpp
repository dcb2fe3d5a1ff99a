#pragma once

#include "circuit_breaker.hpp"
#include "config.hpp"
#include "health_check_strategy.hpp"
#include "health_monitor.hpp"
#include "service_registry.hpp"
#include "types.hpp"
#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

// Resolves service addresses and tracks their health.
//
// Construct one instance at startup and hand it to every consumer by
// reference. Nothing is monitored until start_health_monitoring() is called.
class ServiceDiscovery {
public:
    ServiceDiscovery(const Config& config, const std::vector<EndpointDefinition>& definitions);
    ServiceDiscovery(const Config& config, const std::vector<EndpointDefinition>& definitions,
                     CheckerFactory checker_factory);
    ~ServiceDiscovery();

    // Adds or replaces an endpoint. Not allowed while monitoring runs.
    void register_service(const EndpointDefinition& definition);

    // Probes one service now, subject to the circuit breaker.
    // Returns Unknown for unregistered names.
    ServiceStatus check_service_health(const std::string& name);
    std::map<std::string, ServiceStatus> check_all_services();

    std::vector<std::string> get_healthy_services() const;
    std::optional<std::string> get_service_url(const std::string& name) const;
    StatusSummary get_service_status_summary() const;

    bool wait_for_service(const std::string& name);
    bool wait_for_service(const std::string& name, std::chrono::milliseconds timeout);
    std::pair<bool, std::vector<std::string>> wait_for_core_services();
    std::pair<bool, std::vector<std::string>> wait_for_core_services(std::chrono::milliseconds timeout);

    void start_health_monitoring();
    // Cancels checks in progress, then joins the monitor thread.
    void stop_health_monitoring();
    bool is_monitoring() const;
    const HealthMonitor& monitor() const { return *monitor_; }

    const ServiceRegistry& registry() const { return registry_; }
    const CircuitBreaker& circuit_breaker() const { return breaker_; }
    const Config& config() const { return config_; }

    // Non-copyable
    ServiceDiscovery(const ServiceDiscovery&) = delete;
    ServiceDiscovery& operator=(const ServiceDiscovery&) = delete;

private:
    // `budget` caps the probe timeout so readiness waits keep their deadline.
    ServiceStatus run_check(const std::string& name, std::optional<std::chrono::milliseconds> budget);
    std::map<std::string, ServiceStatus> run_sweep(std::optional<std::chrono::milliseconds> budget);
    std::vector<std::string> required_services() const;
    void cancel_checks();
    void resume_checks();

    Config config_;
    ServiceRegistry registry_;
    CircuitBreaker breaker_;
    CheckerFactory checker_factory_;
    std::unique_ptr<HealthMonitor> monitor_;
    std::atomic<bool> stopping_{false};
};
