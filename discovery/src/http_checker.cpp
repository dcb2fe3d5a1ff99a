#include "http_checker.hpp"
#include "util.hpp"
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <chrono>
#include <unordered_set>

namespace {

const std::unordered_set<std::string> kDegradedStatusFields = {"degraded", "warning"};
const std::unordered_set<int> kServiceUnavailableCodes = {502, 503, 504};

std::pair<time_t, time_t> split_timeout(std::chrono::milliseconds timeout) {
    auto secs = std::chrono::duration_cast<std::chrono::seconds>(timeout);
    auto usecs = std::chrono::duration_cast<std::chrono::microseconds>(timeout - secs);
    return {static_cast<time_t>(secs.count()), static_cast<time_t>(usecs.count())};
}

// Reads optional metadata and the self-reported status from a health body.
void parse_health_body(const nlohmann::json& data, CheckOutcome& outcome) {
    if (data.contains("version") && data["version"].is_string()) {
        outcome.version = data["version"].get<std::string>();
    }

    if (data.contains("capabilities") && data["capabilities"].is_array()) {
        std::vector<std::string> capabilities;
        for (const auto& item : data["capabilities"]) {
            if (item.is_string()) {
                capabilities.push_back(item.get<std::string>());
            }
        }
        outcome.capabilities = std::move(capabilities);
    }

    if (data.contains("status") && data["status"].is_string()) {
        auto status_field = util::to_lower(data["status"].get<std::string>());
        if (kDegradedStatusFields.count(status_field)) {
            outcome.status = ServiceStatus::Degraded;
            outcome.error_message = "Service reports status '" + status_field + "'";
        }
    }
}

} // namespace

CheckOutcome evaluate_http_response(int status_code, const std::string& body) {
    CheckOutcome outcome;

    if (status_code != 200) {
        if (kServiceUnavailableCodes.count(status_code)) {
            // Temporary issue
            outcome.status = ServiceStatus::Degraded;
        } else {
            outcome.status = ServiceStatus::Unhealthy;
        }
        outcome.error_message = "HTTP " + std::to_string(status_code);
        return outcome;
    }

    outcome.status = ServiceStatus::Healthy;

    // A body that is not a JSON object is not an error
    auto data = nlohmann::json::parse(body, nullptr, false);
    if (!data.is_discarded() && data.is_object()) {
        parse_health_body(data, outcome);
    }

    return outcome;
}

CheckOutcome HttpChecker::check(const EndpointView& endpoint) {
    const auto& def = endpoint.definition;
    auto start_time = std::chrono::steady_clock::now();
    auto elapsed = [&start_time]() {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_time);
    };

    try {
        httplib::Client client(def.host, def.port);
        auto [sec, usec] = split_timeout(def.timeout);
        client.set_connection_timeout(sec, usec);
        client.set_read_timeout(sec, usec);
        client.set_write_timeout(sec, usec);
        client.set_max_timeout(def.timeout);

        // Keeps the client reachable from cancel() while the request runs
        struct Tracked {
            HttpChecker& checker;
            httplib::Client* client;
            ~Tracked() { checker.untrack(client); }
        };
        if (!track(&client)) {
            return CheckOutcome::aborted();
        }
        Tracked tracked{*this, &client};

        auto response = client.Get(def.health_path.empty() ? "/" : def.health_path);
        if (cancelled()) {
            return CheckOutcome::aborted(elapsed());
        }
        if (!response) {
            auto error = httplib::to_string(response.error());
            spdlog::debug("HTTP health check for {} failed: {}", def.name, error);
            return CheckOutcome::unhealthy(error, elapsed());
        }

        auto outcome = evaluate_http_response(response->status, response->body);
        outcome.response_time = elapsed();
        spdlog::debug("HTTP health check for {} returned {} in {} ms",
                      def.name, response->status, outcome.response_time.count());
        return outcome;

    } catch (const std::exception& e) {
        spdlog::debug("HTTP health check for {} threw: {}", def.name, e.what());
        return CheckOutcome::unhealthy(e.what(), elapsed());
    }
}

void HttpChecker::cancel() {
    std::lock_guard<std::mutex> lock(mutex_);
    cancelled_ = true;
    for (auto* client : active_) {
        client->stop();
    }
}

void HttpChecker::resume() {
    std::lock_guard<std::mutex> lock(mutex_);
    cancelled_ = false;
}

bool HttpChecker::track(httplib::Client* client) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (cancelled_) {
        return false;
    }
    active_.insert(client);
    return true;
}

void HttpChecker::untrack(httplib::Client* client) {
    std::lock_guard<std::mutex> lock(mutex_);
    active_.erase(client);
}

bool HttpChecker::cancelled() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cancelled_;
}
