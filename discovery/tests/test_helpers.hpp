#pragma once

#include "config.hpp"
#include "health_check_strategy.hpp"
#include "types.hpp"
#include <httplib.h>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace test {

// Checker whose answer is controlled by the test.
class FakeChecker : public HealthCheckStrategy {
public:
    explicit FakeChecker(ServiceStatus status = ServiceStatus::Healthy) : status_(status) {}

    CheckOutcome check(const EndpointView& endpoint) override;
    const char* name() const override { return "fake"; }

    // Wakes a delayed check, which then reports itself cancelled.
    void cancel() override;
    void resume() override;

    void set_status(ServiceStatus status) { status_ = status; }
    void set_delay(std::chrono::milliseconds delay) { delay_ms_ = delay.count(); }
    void set_throw(bool enabled) { throw_ = enabled; }
    // Throws an int instead of a std::exception.
    void set_throw_int(int count) { throw_int_ = count; }

    int calls() const { return calls_; }
    int max_concurrent() const { return max_concurrent_; }
    std::chrono::milliseconds last_timeout() const { return std::chrono::milliseconds(last_timeout_ms_.load()); }

private:
    std::atomic<ServiceStatus> status_;
    std::atomic<long long> delay_ms_{0};
    std::atomic<bool> throw_{false};
    std::atomic<int> throw_int_{0};
    std::mutex cancel_mutex_;
    std::condition_variable cancel_cv_;
    bool cancelled_ = false;
    std::atomic<int> calls_{0};
    std::atomic<int> in_flight_{0};
    std::atomic<int> max_concurrent_{0};
    std::atomic<long long> last_timeout_ms_{0};
};

EndpointDefinition make_definition(const std::string& name, bool required = true,
                                   Protocol protocol = Protocol::Http, int port = 8080);

// Short intervals so time-based behaviour fits in a unit test.
Config fast_config();

// httplib server on an ephemeral localhost port, served from a background thread.
class LocalHttpServer {
public:
    LocalHttpServer();
    ~LocalHttpServer();

    httplib::Server& server() { return server_; }

    void start();
    void stop();
    int port() const { return port_; }

private:
    httplib::Server server_;
    std::thread thread_;
    int port_ = -1;
};

// Port on localhost with nothing listening on it.
int unused_port();

} // namespace test
