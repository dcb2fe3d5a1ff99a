#include "circuit_breaker.hpp"

CircuitBreaker::CircuitBreaker(unsigned int threshold, std::chrono::milliseconds check_interval, double multiplier)
    : threshold_(threshold),
      backoff_window_(std::chrono::milliseconds(
          static_cast<long long>(static_cast<double>(check_interval.count()) * multiplier))) {
}

std::optional<ServiceStatus> CircuitBreaker::should_skip(
    unsigned int consecutive_failures,
    const std::optional<std::chrono::steady_clock::time_point>& last_check_at,
    ServiceStatus current_status,
    std::chrono::steady_clock::time_point now) const {

    if (consecutive_failures < threshold_) {
        return std::nullopt;
    }

    if (!last_check_at) {
        return std::nullopt;
    }

    auto elapsed = now - *last_check_at;
    if (elapsed < backoff_window_) {
        return current_status;
    }

    return std::nullopt;
}

std::optional<ServiceStatus> CircuitBreaker::should_skip(const EndpointView& view,
                                                         std::chrono::steady_clock::time_point now) const {
    return should_skip(view.consecutive_failures, view.last_check_steady, view.status, now);
}
