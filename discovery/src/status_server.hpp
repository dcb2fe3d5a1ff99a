#pragma once
#include "config.hpp"
#include "service_discovery.hpp"
#include <memory>

// HTTP view of the discovery state: /health, /ready, /services, /services/<name>.
class StatusServer {
public:
    StatusServer(const Config& config, ServiceDiscovery& discovery);
    ~StatusServer();

    // Returns false if the listening socket could not be bound.
    bool start();
    void stop();
    bool is_running() const;

    // Port actually bound; differs from the configured one when that was 0.
    int port() const;

    // Non-copyable
    StatusServer(const StatusServer&) = delete;
    StatusServer& operator=(const StatusServer&) = delete;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl_;
};
