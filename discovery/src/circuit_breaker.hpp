#pragma once
#include "types.hpp"
#include <chrono>
#include <optional>

// Suppresses redundant probes of an endpoint that keeps failing.
//
// Once an endpoint has failed `threshold` times in a row, it is only probed
// again after `check_interval * multiplier` has passed since its last check.
// Inside that window the caller keeps the last known status. Skipping never
// touches counters or timestamps.
class CircuitBreaker {
public:
    CircuitBreaker(unsigned int threshold, std::chrono::milliseconds check_interval, double multiplier);

    // Returns the status to retain when the check should be skipped, or
    // std::nullopt when the check may go through.
    std::optional<ServiceStatus> should_skip(
        unsigned int consecutive_failures,
        const std::optional<std::chrono::steady_clock::time_point>& last_check_at,
        ServiceStatus current_status,
        std::chrono::steady_clock::time_point now) const;

    std::optional<ServiceStatus> should_skip(const EndpointView& view,
                                             std::chrono::steady_clock::time_point now) const;

    std::chrono::milliseconds backoff_window() const { return backoff_window_; }
    unsigned int threshold() const { return threshold_; }

private:
    unsigned int threshold_;
    std::chrono::milliseconds backoff_window_;
};
