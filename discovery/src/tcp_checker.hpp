#pragma once
#include "health_check_strategy.hpp"
#include <atomic>
#include <chrono>
#include <string>

// Opens a TCP connection and closes it again. Returns an empty string on
// success, otherwise the reason the connection could not be established.
// A readable `cancel_fd` aborts the wait for the connection.
std::string tcp_connect_probe(const std::string& host, int port, std::chrono::milliseconds timeout,
                              int cancel_fd = -1);

// Raw TCP probe. Data stores get a Redis PING over a fresh, non-pooled
// connection; everything else a bare connect.
class TcpChecker : public HealthCheckStrategy {
public:
    explicit TcpChecker(bool redis_ping = false);
    ~TcpChecker() override;

    CheckOutcome check(const EndpointView& endpoint) override;
    const char* name() const override { return redis_ping_ ? "redis" : "tcp"; }

    // A PING already sent runs to its own socket timeout; connects are woken.
    void cancel() override;
    void resume() override;

    // Non-copyable
    TcpChecker(const TcpChecker&) = delete;
    TcpChecker& operator=(const TcpChecker&) = delete;

private:
    CheckOutcome check_redis(const EndpointView& endpoint);
    CheckOutcome check_connect(const EndpointView& endpoint);

    bool redis_ping_;
    std::atomic<bool> cancelled_{false};
    int wake_fd_;
};
