#include "types.hpp"
#include "util.hpp"
#include <stdexcept>

std::string to_string(ServiceStatus status) {
    switch (status) {
        case ServiceStatus::Unknown: return "unknown";
        case ServiceStatus::Starting: return "starting";
        case ServiceStatus::Healthy: return "healthy";
        case ServiceStatus::Degraded: return "degraded";
        case ServiceStatus::Unhealthy: return "unhealthy";
    }
    return "unknown";
}

std::string to_string(Protocol protocol) {
    switch (protocol) {
        case Protocol::Http: return "http";
        case Protocol::Tcp: return "tcp";
    }
    return "http";
}

Protocol protocol_from_string(const std::string& value) {
    auto v = util::to_lower(util::trim(value));
    if (v == "http") return Protocol::Http;
    if (v == "tcp") return Protocol::Tcp;
    throw std::invalid_argument("Unsupported protocol: " + value);
}

std::string EndpointDefinition::url() const {
    return to_string(protocol) + "://" + host + ":" + std::to_string(port);
}

std::string EndpointDefinition::health_url() const {
    return url() + health_path;
}

CheckOutcome CheckOutcome::unhealthy(const std::string& error, std::chrono::milliseconds elapsed) {
    CheckOutcome outcome;
    outcome.status = ServiceStatus::Unhealthy;
    outcome.response_time = elapsed;
    outcome.error_message = error;
    return outcome;
}

CheckOutcome CheckOutcome::aborted(std::chrono::milliseconds elapsed) {
    CheckOutcome outcome = unhealthy("check cancelled", elapsed);
    outcome.cancelled = true;
    return outcome;
}

nlohmann::json ServiceReport::to_json() const {
    nlohmann::json j = {
        {"status", ::to_string(status)},
        {"url", url},
        {"required", required},
        {"consecutive_failures", consecutive_failures},
        {"capabilities", capabilities}
    };

    // Fields that might be null
    j["last_check"] = last_check ? nlohmann::json(util::format_timestamp(*last_check)) : nlohmann::json();
    j["response_time"] = response_time ? nlohmann::json(util::to_seconds(*response_time)) : nlohmann::json();
    j["error"] = error ? nlohmann::json(*error) : nlohmann::json();
    j["version"] = version ? nlohmann::json(*version) : nlohmann::json();

    return j;
}

nlohmann::json StatusSummary::to_json() const {
    nlohmann::json j = {
        {"timestamp", util::format_timestamp(timestamp)},
        {"total_services", total_services},
        {"healthy", healthy},
        {"degraded", degraded},
        {"unhealthy", unhealthy},
        {"unknown", unknown},
        {"services", nlohmann::json::object()}
    };

    for (const auto& [name, report] : services) {
        j["services"][name] = report.to_json();
    }

    return j;
}
