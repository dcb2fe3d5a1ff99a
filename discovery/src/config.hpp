#pragma once
#include <string>
#include <vector>
#include <chrono>

class Config {
public:
    // Service info
    std::string service_name = "discovery";
    std::string log_level = "info";

    // Monitor loop
    double health_check_interval_seconds = 30.0;
    double error_recovery_delay_seconds = 5.0;

    // Circuit breaker
    int circuit_breaker_threshold = 3;
    double circuit_breaker_check_multiplier = 3.0;

    // Readiness waits
    double service_wait_interval_seconds = 1.0;
    double core_services_wait_interval_seconds = 2.0;
    double default_service_wait_timeout_seconds = 30.0;
    double core_services_wait_timeout_seconds = 60.0;
    bool wait_for_core_on_start = false;

    // TCP endpoints that answer the Redis PING command
    std::vector<std::string> datastore_services = {"redis"};

    // Optional JSON file with endpoint definitions
    std::string services_file;

    // Status endpoint
    std::string status_host = "0.0.0.0";
    int status_port = 8090;

    std::chrono::milliseconds health_check_interval() const;
    std::chrono::milliseconds error_recovery_delay() const;
    std::chrono::milliseconds service_wait_interval() const;
    std::chrono::milliseconds core_services_wait_interval() const;
    std::chrono::milliseconds default_service_wait_timeout() const;
    std::chrono::milliseconds core_services_wait_timeout() const;

    bool is_datastore_service(const std::string& name) const;

    static Config from_env();
    void validate() const;
};
