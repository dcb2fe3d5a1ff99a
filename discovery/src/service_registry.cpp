#include "service_registry.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <chrono>
#include <stdexcept>

void ServiceRegistry::register_endpoint(const EndpointDefinition& definition,
                                        std::shared_ptr<HealthCheckStrategy> checker) {
    if (definition.name.empty()) {
        throw std::invalid_argument("Endpoint name must not be empty");
    }
    if (definition.port < 1 || definition.port > 65535) {
        throw std::invalid_argument("Endpoint " + definition.name + " has invalid port " +
                                    std::to_string(definition.port));
    }
    if (!checker) {
        throw std::invalid_argument("Endpoint " + definition.name + " has no checker");
    }

    std::lock_guard<std::mutex> lock(mutex_);

    Slot slot;
    slot.definition = definition;
    slot.checker = std::move(checker);

    bool replaced = slots_.count(definition.name) > 0;
    slots_[definition.name] = std::move(slot);

    spdlog::debug("{} endpoint {} -> {}", replaced ? "Replaced" : "Registered",
                  definition.name, definition.url());
}

std::vector<std::string> ServiceRegistry::snapshot() const {
    std::vector<std::string> names;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        names.reserve(slots_.size());
        for (const auto& [name, slot] : slots_) {
            names.push_back(name);
        }
    }
    std::sort(names.begin(), names.end());
    return names;
}

std::optional<EndpointView> ServiceRegistry::read(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = slots_.find(name);
    if (it == slots_.end()) {
        return std::nullopt;
    }

    EndpointView view;
    view.definition = it->second.definition;
    view.status = it->second.state.status;
    view.consecutive_failures = it->second.state.consecutive_failures;
    view.last_check_at = it->second.state.last_check_at;
    view.last_check_steady = it->second.state.last_check_steady;
    return view;
}

std::shared_ptr<HealthCheckStrategy> ServiceRegistry::checker_for(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = slots_.find(name);
    return it == slots_.end() ? nullptr : it->second.checker;
}

std::vector<std::shared_ptr<HealthCheckStrategy>> ServiceRegistry::checkers() const {
    std::vector<std::shared_ptr<HealthCheckStrategy>> result;
    std::lock_guard<std::mutex> lock(mutex_);
    result.reserve(slots_.size());
    for (const auto& [name, slot] : slots_) {
        result.push_back(slot.checker);
    }
    return result;
}

bool ServiceRegistry::begin_check(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = slots_.find(name);
    if (it == slots_.end() || it->second.check_in_flight) {
        return false;
    }

    it->second.check_in_flight = true;
    return true;
}

bool ServiceRegistry::apply_result(const std::string& name, const CheckOutcome& outcome) {
    auto now = std::chrono::system_clock::now();
    auto steady_now = std::chrono::steady_clock::now();
    ServiceStatus previous;

    {
        std::lock_guard<std::mutex> lock(mutex_);

        auto it = slots_.find(name);
        if (it == slots_.end()) {
            return false;
        }

        auto& state = it->second.state;
        previous = state.status;

        state.status = outcome.status;
        state.last_check_at = now;
        state.last_check_steady = steady_now;
        state.response_time = outcome.response_time;

        if (outcome.status == ServiceStatus::Healthy) {
            state.consecutive_failures = 0;
            state.last_healthy_at = now;
            state.error_message.reset();
        } else {
            state.consecutive_failures++;
            state.error_message = outcome.error_message;
        }

        if (outcome.version) {
            state.version = outcome.version;
        }
        if (outcome.capabilities) {
            state.capabilities = *outcome.capabilities;
        }

        it->second.check_in_flight = false;
    }

    if (previous != outcome.status) {
        spdlog::info("Service {} changed status {} -> {}", name, to_string(previous), to_string(outcome.status));
    }

    return true;
}

void ServiceRegistry::abort_check(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = slots_.find(name);
    if (it != slots_.end()) {
        it->second.check_in_flight = false;
    }
}

std::optional<std::string> ServiceRegistry::url_for(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = slots_.find(name);
    if (it == slots_.end()) {
        return std::nullopt;
    }
    return it->second.definition.url();
}

std::optional<EndpointDefinition> ServiceRegistry::definition_of(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = slots_.find(name);
    if (it == slots_.end()) {
        return std::nullopt;
    }
    return it->second.definition;
}

std::optional<EndpointState> ServiceRegistry::state_of(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = slots_.find(name);
    if (it == slots_.end()) {
        return std::nullopt;
    }
    return it->second.state;
}

std::vector<ServiceRegistry::Entry> ServiceRegistry::entries() const {
    std::vector<Entry> result;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        result.reserve(slots_.size());
        for (const auto& [name, slot] : slots_) {
            result.push_back({slot.definition, slot.state});
        }
    }
    std::sort(result.begin(), result.end(), [](const Entry& a, const Entry& b) {
        return a.definition.name < b.definition.name;
    });
    return result;
}

bool ServiceRegistry::contains(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return slots_.count(name) > 0;
}

std::size_t ServiceRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return slots_.size();
}
