#include "config.hpp"
#include "util.hpp"
#include <algorithm>
#include <stdexcept>
#include <spdlog/spdlog.h>

Config Config::from_env() {
    Config config;

    // Service
    config.service_name = util::get_env_var("SERVICE_NAME", "discovery");
    config.log_level = util::get_env_var("LOG_LEVEL", "info");

    // Monitor loop
    config.health_check_interval_seconds = util::get_env_double("HEALTH_CHECK_INTERVAL_SECONDS", 30.0);
    config.error_recovery_delay_seconds = util::get_env_double("ERROR_RECOVERY_DELAY_SECONDS", 5.0);

    // Circuit breaker
    config.circuit_breaker_threshold = util::get_env_int("CIRCUIT_BREAKER_THRESHOLD", 3);
    config.circuit_breaker_check_multiplier = util::get_env_double("CIRCUIT_BREAKER_CHECK_MULTIPLIER", 3.0);

    // Readiness waits
    config.service_wait_interval_seconds = util::get_env_double("SERVICE_WAIT_INTERVAL_SECONDS", 1.0);
    config.core_services_wait_interval_seconds = util::get_env_double("CORE_SERVICES_WAIT_INTERVAL_SECONDS", 2.0);
    config.default_service_wait_timeout_seconds = util::get_env_double("DEFAULT_SERVICE_WAIT_TIMEOUT_SECONDS", 30.0);
    config.core_services_wait_timeout_seconds = util::get_env_double("CORE_SERVICES_WAIT_TIMEOUT_SECONDS", 60.0);
    config.wait_for_core_on_start = util::get_env_bool("WAIT_FOR_CORE_ON_START", false);

    // Data stores (comma-separated)
    config.datastore_services = util::split_string(util::get_env_var("DATASTORE_SERVICES", "redis"), ',');

    config.services_file = util::get_env_var("SERVICES_FILE");

    // Status endpoint
    config.status_host = util::get_env_var("STATUS_HOST", "0.0.0.0");
    config.status_port = util::get_env_int("STATUS_PORT", 8090);

    return config;
}

void Config::validate() const {
    if (health_check_interval_seconds <= 0.0) {
        throw std::runtime_error("Health check interval must be positive");
    }

    if (error_recovery_delay_seconds <= 0.0) {
        throw std::runtime_error("Error recovery delay must be positive");
    }

    if (circuit_breaker_threshold < 1) {
        throw std::runtime_error("Circuit breaker threshold must be at least 1");
    }

    if (circuit_breaker_check_multiplier < 1.0) {
        throw std::runtime_error("Circuit breaker check multiplier must be at least 1");
    }

    if (service_wait_interval_seconds <= 0.0 || core_services_wait_interval_seconds <= 0.0) {
        throw std::runtime_error("Readiness wait intervals must be positive");
    }

    if (status_port < 0 || status_port > 65535) {
        throw std::runtime_error("Status port must be between 0 and 65535");
    }

    spdlog::info("Configuration validated successfully");
}

std::chrono::milliseconds Config::health_check_interval() const {
    return util::seconds_to_ms(health_check_interval_seconds);
}

std::chrono::milliseconds Config::error_recovery_delay() const {
    return util::seconds_to_ms(error_recovery_delay_seconds);
}

std::chrono::milliseconds Config::service_wait_interval() const {
    return util::seconds_to_ms(service_wait_interval_seconds);
}

std::chrono::milliseconds Config::core_services_wait_interval() const {
    return util::seconds_to_ms(core_services_wait_interval_seconds);
}

std::chrono::milliseconds Config::default_service_wait_timeout() const {
    return util::seconds_to_ms(default_service_wait_timeout_seconds);
}

std::chrono::milliseconds Config::core_services_wait_timeout() const {
    return util::seconds_to_ms(core_services_wait_timeout_seconds);
}

bool Config::is_datastore_service(const std::string& name) const {
    return std::find(datastore_services.begin(), datastore_services.end(), name) != datastore_services.end();
}
