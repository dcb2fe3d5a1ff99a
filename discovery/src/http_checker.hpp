#pragma once
#include "health_check_strategy.hpp"
#include <mutex>
#include <string>
#include <unordered_set>

namespace httplib {
class Client;
}

// Interprets a health endpoint response. Exposed for reuse by callers that
// already hold a response.
CheckOutcome evaluate_http_response(int status_code, const std::string& body);

// The whole request, connect through last body byte, is bounded by the
// endpoint timeout.
class HttpChecker : public HealthCheckStrategy {
public:
    HttpChecker() = default;

    CheckOutcome check(const EndpointView& endpoint) override;
    const char* name() const override { return "http"; }

    void cancel() override;
    void resume() override;

private:
    bool track(httplib::Client* client);
    void untrack(httplib::Client* client);
    bool cancelled() const;

    mutable std::mutex mutex_;
    bool cancelled_ = false;
    std::unordered_set<httplib::Client*> active_;
};
