#pragma once
#include "config.hpp"
#include "types.hpp"
#include <functional>
#include <memory>

// One probe per protocol. Implementations must not throw: every failure is
// reported as an Unhealthy outcome.
//
// cancel() may be called from any thread. It aborts a probe in progress and
// makes later probes return a cancelled outcome at once, until resume().
class HealthCheckStrategy {
public:
    virtual ~HealthCheckStrategy() = default;

    virtual CheckOutcome check(const EndpointView& endpoint) = 0;
    virtual const char* name() const = 0;

    virtual void cancel() {}
    virtual void resume() {}
};

using CheckerFactory = std::function<std::shared_ptr<HealthCheckStrategy>(const EndpointDefinition&)>;

// Picks the strategy for a definition's protocol.
std::shared_ptr<HealthCheckStrategy> make_checker(const EndpointDefinition& definition, const Config& config);

CheckerFactory default_checker_factory(const Config& config);
