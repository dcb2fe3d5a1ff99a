#pragma once
#include "health_check_strategy.hpp"
#include "types.hpp"
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

// Name -> endpoint map shared by the monitor loop and query callers.
//
// One mutex guards the map. It is held for a lookup or a small struct update
// only, never while a probe is running, so a slow endpoint cannot stall
// checks of the others.
class ServiceRegistry {
public:
    struct Entry {
        EndpointDefinition definition;
        EndpointState state;
    };

    ServiceRegistry() = default;

    // Adds or replaces an endpoint. Setup-time operation.
    void register_endpoint(const EndpointDefinition& definition,
                           std::shared_ptr<HealthCheckStrategy> checker);

    std::vector<std::string> snapshot() const;
    std::optional<EndpointView> read(const std::string& name) const;
    std::shared_ptr<HealthCheckStrategy> checker_for(const std::string& name) const;
    std::vector<std::shared_ptr<HealthCheckStrategy>> checkers() const;

    // Marks a probe of `name` as in flight. Returns false if the name is
    // unknown or another probe of it has not reported back yet.
    bool begin_check(const std::string& name);

    // Applies a finished probe and clears the in-flight mark.
    bool apply_result(const std::string& name, const CheckOutcome& outcome);

    // Clears the in-flight mark without recording anything.
    void abort_check(const std::string& name);

    std::optional<std::string> url_for(const std::string& name) const;
    std::optional<EndpointDefinition> definition_of(const std::string& name) const;
    std::optional<EndpointState> state_of(const std::string& name) const;
    std::vector<Entry> entries() const;

    bool contains(const std::string& name) const;
    std::size_t size() const;

    // Non-copyable
    ServiceRegistry(const ServiceRegistry&) = delete;
    ServiceRegistry& operator=(const ServiceRegistry&) = delete;

private:
    struct Slot {
        EndpointDefinition definition;
        EndpointState state;
        std::shared_ptr<HealthCheckStrategy> checker;
        bool check_in_flight = false;
    };

    mutable std::mutex mutex_;
    std::unordered_map<std::string, Slot> slots_;
};
