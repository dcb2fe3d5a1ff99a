#pragma once

#include <string>
#include <vector>
#include <map>
#include <chrono>
#include <optional>
#include <nlohmann/json.hpp>

enum class ServiceStatus {
    Unknown,
    Starting,
    Healthy,
    Degraded,
    Unhealthy
};

enum class Protocol {
    Http,
    Tcp
};

std::string to_string(ServiceStatus status);

std::string to_string(Protocol protocol);
Protocol protocol_from_string(const std::string& value);

// Identity and policy of one named service. Never changes after registration.
struct EndpointDefinition {
    std::string name;
    std::string host;
    int port = 0;
    Protocol protocol = Protocol::Http;
    std::string health_path = "/health";
    std::chrono::milliseconds timeout{5000};
    bool required = true;

    std::string url() const;
    std::string health_url() const;
};

// Runtime health of one service, owned by the registry.
struct EndpointState {
    ServiceStatus status = ServiceStatus::Unknown;
    std::optional<std::chrono::system_clock::time_point> last_check_at;
    std::optional<std::chrono::system_clock::time_point> last_healthy_at;
    // Same instant as last_check_at, for interval arithmetic
    std::optional<std::chrono::steady_clock::time_point> last_check_steady;
    unsigned int consecutive_failures = 0;
    std::optional<std::chrono::milliseconds> response_time;
    std::optional<std::string> error_message;

    // Metadata reported by HTTP health bodies
    std::optional<std::string> version;
    std::vector<std::string> capabilities;

    bool is_available() const {
        return status == ServiceStatus::Healthy || status == ServiceStatus::Degraded;
    }
};

// Value copy handed to checkers and the circuit breaker.
struct EndpointView {
    EndpointDefinition definition;
    ServiceStatus status = ServiceStatus::Unknown;
    unsigned int consecutive_failures = 0;
    std::optional<std::chrono::system_clock::time_point> last_check_at;
    std::optional<std::chrono::steady_clock::time_point> last_check_steady;
};

struct CheckOutcome {
    ServiceStatus status = ServiceStatus::Unknown;
    std::chrono::milliseconds response_time{0};
    std::optional<std::string> error_message;
    std::optional<std::string> version;
    std::optional<std::vector<std::string>> capabilities;

    // Aborted by cancel(); says nothing about the endpoint.
    bool cancelled = false;

    static CheckOutcome unhealthy(const std::string& error, std::chrono::milliseconds elapsed = {});
    static CheckOutcome aborted(std::chrono::milliseconds elapsed = {});
};

struct ServiceReport {
    ServiceStatus status = ServiceStatus::Unknown;
    std::string url;
    bool required = false;
    std::optional<std::chrono::system_clock::time_point> last_check;
    std::optional<std::chrono::milliseconds> response_time;
    unsigned int consecutive_failures = 0;
    std::optional<std::string> error;
    std::optional<std::string> version;
    std::vector<std::string> capabilities;

    nlohmann::json to_json() const;
};

struct StatusSummary {
    std::chrono::system_clock::time_point timestamp;
    std::size_t total_services = 0;
    std::size_t healthy = 0;
    std::size_t degraded = 0;
    std::size_t unhealthy = 0;
    std::size_t unknown = 0;
    std::map<std::string, ServiceReport> services;

    nlohmann::json to_json() const;
};
