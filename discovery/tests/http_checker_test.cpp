#include "http_checker.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>
#include <condition_variable>
#include <mutex>
#include <thread>

using namespace std::chrono_literals;

TEST(EvaluateHttpResponseTest, OkWithoutBodyIsHealthy) {
    auto outcome = evaluate_http_response(200, "");
    EXPECT_EQ(outcome.status, ServiceStatus::Healthy);
    EXPECT_FALSE(outcome.error_message.has_value());
    EXPECT_FALSE(outcome.version.has_value());
}

TEST(EvaluateHttpResponseTest, OkWithPlainTextIsHealthy) {
    auto outcome = evaluate_http_response(200, "<html>ok</html>");
    EXPECT_EQ(outcome.status, ServiceStatus::Healthy);
}

TEST(EvaluateHttpResponseTest, GatewayErrorsAreDegraded) {
    for (int code : {502, 503, 504}) {
        auto outcome = evaluate_http_response(code, "");
        EXPECT_EQ(outcome.status, ServiceStatus::Degraded) << code;
        ASSERT_TRUE(outcome.error_message.has_value());
        EXPECT_EQ(*outcome.error_message, "HTTP " + std::to_string(code));
    }
}

TEST(EvaluateHttpResponseTest, OtherErrorsAreUnhealthy) {
    for (int code : {301, 404, 500}) {
        auto outcome = evaluate_http_response(code, "{\"status\":\"ok\"}");
        EXPECT_EQ(outcome.status, ServiceStatus::Unhealthy) << code;
        EXPECT_EQ(*outcome.error_message, "HTTP " + std::to_string(code));
    }
}

TEST(EvaluateHttpResponseTest, CapturesVersionAndCapabilities) {
    auto outcome = evaluate_http_response(200, R"({"version":"2.4.1","capabilities":["chat","embed",7]})");
    EXPECT_EQ(outcome.status, ServiceStatus::Healthy);
    ASSERT_TRUE(outcome.version.has_value());
    EXPECT_EQ(*outcome.version, "2.4.1");
    ASSERT_TRUE(outcome.capabilities.has_value());
    EXPECT_EQ(*outcome.capabilities, (std::vector<std::string>{"chat", "embed"}));
}

TEST(EvaluateHttpResponseTest, SelfReportedDegradedStatus) {
    auto outcome = evaluate_http_response(200, R"({"status":"Warning"})");
    EXPECT_EQ(outcome.status, ServiceStatus::Degraded);
    ASSERT_TRUE(outcome.error_message.has_value());
    EXPECT_NE(outcome.error_message->find("warning"), std::string::npos);

    outcome = evaluate_http_response(200, R"({"status":"healthy"})");
    EXPECT_EQ(outcome.status, ServiceStatus::Healthy);
}

class HttpCheckerTest : public ::testing::Test {
protected:
    void SetUp() override {
        server_.server().Get("/health", [](const httplib::Request&, httplib::Response& res) {
            res.status = 200;
        });
        server_.server().Get("/busy", [](const httplib::Request&, httplib::Response& res) {
            res.status = 503;
        });
        server_.server().Get("/info", [](const httplib::Request&, httplib::Response& res) {
            res.set_content(R"({"status":"ok","version":"1.0"})", "application/json");
        });
        server_.server().Get("/slow", [](const httplib::Request&, httplib::Response& res) {
            std::this_thread::sleep_for(500ms);
            res.status = 200;
        });
        server_.server().Get("/stall", [this](const httplib::Request&, httplib::Response& res) {
            std::unique_lock<std::mutex> lock(stall_mutex_);
            stall_cv_.wait_for(lock, 3s, [this]() { return released_; });
            res.status = 200;
        });
        server_.server().Get("/trickle", [](const httplib::Request&, httplib::Response& res) {
            res.set_chunked_content_provider("text/plain", [](size_t offset, httplib::DataSink& sink) {
                if (offset >= 30) {
                    sink.done();
                    return true;
                }
                std::this_thread::sleep_for(100ms);
                return sink.write(".", 1);
            });
        });
        server_.start();
    }

    void TearDown() override {
        release_stalled();
        server_.stop();
    }

    void release_stalled() {
        {
            std::lock_guard<std::mutex> lock(stall_mutex_);
            released_ = true;
        }
        stall_cv_.notify_all();
    }

    EndpointView view_for(const std::string& path, std::chrono::milliseconds timeout = 1s) {
        EndpointView view;
        view.definition = test::make_definition("web", true, Protocol::Http, server_.port());
        view.definition.health_path = path;
        view.definition.timeout = timeout;
        return view;
    }

    test::LocalHttpServer server_;
    HttpChecker checker_;

    std::mutex stall_mutex_;
    std::condition_variable stall_cv_;
    bool released_ = false;
};

TEST_F(HttpCheckerTest, EmptyOkResponseIsHealthy) {
    auto outcome = checker_.check(view_for("/health"));
    EXPECT_EQ(outcome.status, ServiceStatus::Healthy);
    EXPECT_FALSE(outcome.error_message.has_value());
}

TEST_F(HttpCheckerTest, ServiceUnavailableIsDegraded) {
    auto outcome = checker_.check(view_for("/busy"));
    EXPECT_EQ(outcome.status, ServiceStatus::Degraded);
    EXPECT_EQ(*outcome.error_message, "HTTP 503");
}

TEST_F(HttpCheckerTest, MissingRouteIsUnhealthy) {
    auto outcome = checker_.check(view_for("/nope"));
    EXPECT_EQ(outcome.status, ServiceStatus::Unhealthy);
    EXPECT_EQ(*outcome.error_message, "HTTP 404");
}

TEST_F(HttpCheckerTest, JsonBodyMetadata) {
    auto outcome = checker_.check(view_for("/info"));
    EXPECT_EQ(outcome.status, ServiceStatus::Healthy);
    EXPECT_EQ(outcome.version.value_or(""), "1.0");
}

TEST_F(HttpCheckerTest, TimeoutIsUnhealthy) {
    auto outcome = checker_.check(view_for("/slow", 100ms));
    EXPECT_EQ(outcome.status, ServiceStatus::Unhealthy);
    EXPECT_TRUE(outcome.error_message.has_value());
}

TEST_F(HttpCheckerTest, SlowBodyBoundedByEndpointTimeout) {
    auto begin = std::chrono::steady_clock::now();
    auto outcome = checker_.check(view_for("/trickle", 500ms));

    EXPECT_EQ(outcome.status, ServiceStatus::Unhealthy);
    EXPECT_LT(std::chrono::steady_clock::now() - begin, 1500ms);
}

TEST_F(HttpCheckerTest, CancelAbortsRequestInProgress) {
    CheckOutcome outcome;
    auto begin = std::chrono::steady_clock::now();
    std::thread request([&]() { outcome = checker_.check(view_for("/stall", 3s)); });

    std::this_thread::sleep_for(100ms);
    checker_.cancel();
    request.join();

    EXPECT_LT(std::chrono::steady_clock::now() - begin, 1s);
    EXPECT_TRUE(outcome.cancelled);
    release_stalled();

    // Stays cancelled until resumed
    EXPECT_TRUE(checker_.check(view_for("/health")).cancelled);
    checker_.resume();
    EXPECT_EQ(checker_.check(view_for("/health")).status, ServiceStatus::Healthy);
}

TEST(HttpCheckerConnectTest, RefusedConnectionIsUnhealthy) {
    EndpointView view;
    view.definition = test::make_definition("gone", true, Protocol::Http, test::unused_port());
    view.definition.timeout = 500ms;

    HttpChecker checker;
    auto outcome = checker.check(view);
    EXPECT_EQ(outcome.status, ServiceStatus::Unhealthy);
    ASSERT_TRUE(outcome.error_message.has_value());
    EXPECT_FALSE(outcome.error_message->empty());
}
