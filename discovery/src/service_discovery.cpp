#include "service_discovery.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <future>
#include <stdexcept>
#include <thread>

namespace {

std::chrono::milliseconds remaining_until(std::chrono::steady_clock::time_point deadline) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
}

// Clears the in-flight mark of a probe that never reached apply_result().
class InFlightGuard {
public:
    InFlightGuard(ServiceRegistry& registry, const std::string& name) : registry_(registry), name_(name) {}
    ~InFlightGuard() {
        if (!released_) {
            registry_.abort_check(name_);
        }
    }

    InFlightGuard(const InFlightGuard&) = delete;
    InFlightGuard& operator=(const InFlightGuard&) = delete;

    void release() { released_ = true; }

private:
    ServiceRegistry& registry_;
    const std::string& name_;
    bool released_ = false;
};

std::string join_names(const std::vector<std::string>& names) {
    std::string out;
    for (const auto& name : names) {
        if (!out.empty()) out += ", ";
        out += name;
    }
    return out;
}

} // namespace

ServiceDiscovery::ServiceDiscovery(const Config& config, const std::vector<EndpointDefinition>& definitions)
    : ServiceDiscovery(config, definitions, default_checker_factory(config)) {
}

ServiceDiscovery::ServiceDiscovery(const Config& config, const std::vector<EndpointDefinition>& definitions,
                                   CheckerFactory checker_factory)
    : config_(config),
      breaker_(static_cast<unsigned int>(config.circuit_breaker_threshold),
               config.health_check_interval(),
               config.circuit_breaker_check_multiplier),
      checker_factory_(std::move(checker_factory)) {

    if (!checker_factory_) {
        throw std::invalid_argument("Checker factory must be set");
    }

    for (const auto& definition : definitions) {
        register_service(definition);
    }

    monitor_ = std::make_unique<HealthMonitor>(
        [this]() { run_sweep(std::nullopt); },
        config_.health_check_interval(),
        config_.error_recovery_delay(),
        [this]() { cancel_checks(); });

    spdlog::info("Service discovery initialized with {} services", registry_.size());
}

ServiceDiscovery::~ServiceDiscovery() {
    if (monitor_) {
        monitor_->stop();
    }
}

void ServiceDiscovery::register_service(const EndpointDefinition& definition) {
    if (is_monitoring()) {
        throw std::logic_error("Cannot register " + definition.name + " while health monitoring is running");
    }

    registry_.register_endpoint(definition, checker_factory_(definition));
}

ServiceStatus ServiceDiscovery::check_service_health(const std::string& name) {
    return run_check(name, std::nullopt);
}

std::map<std::string, ServiceStatus> ServiceDiscovery::check_all_services() {
    return run_sweep(std::nullopt);
}

ServiceStatus ServiceDiscovery::run_check(const std::string& name,
                                          std::optional<std::chrono::milliseconds> budget) {
    auto view = registry_.read(name);
    if (!view) {
        spdlog::warn("Unknown service: {}", name);
        return ServiceStatus::Unknown;
    }

    if (auto retained = breaker_.should_skip(*view, std::chrono::steady_clock::now())) {
        spdlog::debug("Circuit open for {} ({} consecutive failures), keeping status {}",
                      name, view->consecutive_failures, to_string(*retained));
        return *retained;
    }

    if (stopping_) {
        return view->status;
    }

    auto checker = registry_.checker_for(name);
    if (!checker || !registry_.begin_check(name)) {
        // Another caller is probing this endpoint right now
        spdlog::debug("Health check for {} already in flight", name);
        return view->status;
    }
    InFlightGuard in_flight(registry_, name);

    if (budget && *budget < view->definition.timeout) {
        view->definition.timeout = std::max(*budget, std::chrono::milliseconds(1));
    }

    CheckOutcome outcome;
    try {
        outcome = checker->check(*view);
    } catch (const std::exception& e) {
        spdlog::error("Health check error for {}: {}", name, e.what());
        outcome = CheckOutcome::unhealthy(e.what());
    } catch (...) {
        spdlog::error("Health check error for {}: unknown error", name);
        outcome = CheckOutcome::unhealthy("unknown error");
    }

    if (outcome.cancelled) {
        spdlog::debug("Health check for {} cancelled", name);
        return view->status;
    }

    registry_.apply_result(name, outcome);
    in_flight.release();
    return outcome.status;
}

std::map<std::string, ServiceStatus> ServiceDiscovery::run_sweep(std::optional<std::chrono::milliseconds> budget) {
    std::map<std::string, ServiceStatus> results;
    std::vector<std::pair<std::string, std::future<ServiceStatus>>> tasks;

    for (const auto& name : registry_.snapshot()) {
        if (stopping_) {
            break;
        }
        try {
            tasks.emplace_back(name, std::async(std::launch::async, [this, name, budget]() {
                return run_check(name, budget);
            }));
        } catch (const std::exception& e) {
            spdlog::error("Failed to schedule health check for {}: {}", name, e.what());
            registry_.apply_result(name, CheckOutcome::unhealthy(e.what()));
            results[name] = ServiceStatus::Unhealthy;
        }
    }

    for (auto& [name, task] : tasks) {
        try {
            results[name] = task.get();
        } catch (const std::exception& e) {
            spdlog::error("Health check failed for {}: {}", name, e.what());
            registry_.apply_result(name, CheckOutcome::unhealthy(e.what()));
            results[name] = ServiceStatus::Unhealthy;
        } catch (...) {
            spdlog::error("Health check failed for {}: unknown error", name);
            registry_.apply_result(name, CheckOutcome::unhealthy("unknown error"));
            results[name] = ServiceStatus::Unhealthy;
        }
    }

    return results;
}

std::vector<std::string> ServiceDiscovery::get_healthy_services() const {
    std::vector<std::string> healthy;
    for (const auto& entry : registry_.entries()) {
        if (entry.state.status == ServiceStatus::Healthy) {
            healthy.push_back(entry.definition.name);
        }
    }
    return healthy;
}

std::optional<std::string> ServiceDiscovery::get_service_url(const std::string& name) const {
    auto definition = registry_.definition_of(name);
    auto state = registry_.state_of(name);
    if (!definition || !state) {
        return std::nullopt;
    }

    if (!state->is_available() && definition->required) {
        spdlog::warn("Required service {} is not available", name);
    }

    return definition->url();
}

StatusSummary ServiceDiscovery::get_service_status_summary() const {
    StatusSummary summary;
    summary.timestamp = std::chrono::system_clock::now();

    for (const auto& entry : registry_.entries()) {
        const auto& def = entry.definition;
        const auto& state = entry.state;

        ServiceReport report;
        report.status = state.status;
        report.url = def.url();
        report.required = def.required;
        report.last_check = state.last_check_at;
        report.response_time = state.response_time;
        report.consecutive_failures = state.consecutive_failures;
        report.error = state.error_message;
        report.version = state.version;
        report.capabilities = state.capabilities;
        summary.services[def.name] = report;

        switch (state.status) {
            case ServiceStatus::Healthy: summary.healthy++; break;
            case ServiceStatus::Degraded: summary.degraded++; break;
            case ServiceStatus::Unhealthy: summary.unhealthy++; break;
            default: summary.unknown++; break;
        }
    }

    summary.total_services = summary.services.size();
    return summary;
}

bool ServiceDiscovery::wait_for_service(const std::string& name) {
    return wait_for_service(name, config_.default_service_wait_timeout());
}

bool ServiceDiscovery::wait_for_service(const std::string& name, std::chrono::milliseconds timeout) {
    if (!registry_.contains(name)) {
        return false;
    }

    auto deadline = std::chrono::steady_clock::now() + timeout;

    while (remaining_until(deadline).count() > 0) {
        if (run_check(name, remaining_until(deadline)) == ServiceStatus::Healthy) {
            return true;
        }

        auto remaining = remaining_until(deadline);
        if (remaining.count() <= 0) {
            break;
        }
        std::this_thread::sleep_for(std::min(config_.service_wait_interval(), remaining));
    }

    spdlog::warn("Timed out after {} ms waiting for service {}", timeout.count(), name);
    return false;
}

std::pair<bool, std::vector<std::string>> ServiceDiscovery::wait_for_core_services() {
    return wait_for_core_services(config_.core_services_wait_timeout());
}

std::pair<bool, std::vector<std::string>> ServiceDiscovery::wait_for_core_services(std::chrono::milliseconds timeout) {
    auto required = required_services();
    auto deadline = std::chrono::steady_clock::now() + timeout;
    std::vector<std::string> ready;

    while (remaining_until(deadline).count() > 0) {
        run_sweep(remaining_until(deadline));

        ready.clear();
        std::vector<std::string> missing;
        for (const auto& name : required) {
            auto state = registry_.state_of(name);
            if (state && state->status == ServiceStatus::Healthy) {
                ready.push_back(name);
            } else {
                missing.push_back(name);
            }
        }

        if (missing.empty()) {
            spdlog::info("All {} core services are healthy", required.size());
            return {true, ready};
        }

        spdlog::info("Waiting for services: {}", join_names(missing));

        auto remaining = remaining_until(deadline);
        if (remaining.count() <= 0) {
            break;
        }
        std::this_thread::sleep_for(std::min(config_.core_services_wait_interval(), remaining));
    }

    return {false, ready};
}

std::vector<std::string> ServiceDiscovery::required_services() const {
    std::vector<std::string> required;
    for (const auto& entry : registry_.entries()) {
        if (entry.definition.required) {
            required.push_back(entry.definition.name);
        }
    }
    return required;
}

void ServiceDiscovery::start_health_monitoring() {
    monitor_->start();
}

void ServiceDiscovery::stop_health_monitoring() {
    monitor_->stop();
    resume_checks();
}

void ServiceDiscovery::cancel_checks() {
    stopping_ = true;
    for (const auto& checker : registry_.checkers()) {
        checker->cancel();
    }
}

void ServiceDiscovery::resume_checks() {
    for (const auto& checker : registry_.checkers()) {
        checker->resume();
    }
    stopping_ = false;
}

bool ServiceDiscovery::is_monitoring() const {
    return monitor_ && monitor_->is_running();
}
