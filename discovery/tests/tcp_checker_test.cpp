#include "tcp_checker.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>

using namespace std::chrono_literals;

class TcpCheckerTest : public ::testing::Test {
protected:
    void SetUp() override {
        server_.start();
    }

    EndpointView view_for(int port, const std::string& name = "queue") {
        EndpointView view;
        view.definition = test::make_definition(name, true, Protocol::Tcp, port);
        view.definition.timeout = 500ms;
        return view;
    }

    // Anything accepting connections will do for a bare connect probe
    test::LocalHttpServer server_;
};

TEST_F(TcpCheckerTest, ConnectProbeSucceedsOnListeningPort) {
    EXPECT_EQ(tcp_connect_probe("127.0.0.1", server_.port(), 500ms), "");
}

TEST_F(TcpCheckerTest, ConnectProbeReportsRefusal) {
    auto error = tcp_connect_probe("127.0.0.1", test::unused_port(), 500ms);
    EXPECT_FALSE(error.empty());
}

TEST_F(TcpCheckerTest, PlainCheckerHealthyOnListeningPort) {
    TcpChecker checker;
    EXPECT_STREQ(checker.name(), "tcp");

    auto outcome = checker.check(view_for(server_.port()));
    EXPECT_EQ(outcome.status, ServiceStatus::Healthy);
    EXPECT_FALSE(outcome.error_message.has_value());
}

TEST_F(TcpCheckerTest, PlainCheckerUnhealthyOnClosedPort) {
    TcpChecker checker;
    auto outcome = checker.check(view_for(test::unused_port()));
    EXPECT_EQ(outcome.status, ServiceStatus::Unhealthy);
    EXPECT_TRUE(outcome.error_message.has_value());
}

TEST_F(TcpCheckerTest, RedisCheckerUnhealthyWhenNothingListens) {
    TcpChecker checker(true);
    EXPECT_STREQ(checker.name(), "redis");

    auto outcome = checker.check(view_for(test::unused_port(), "redis"));
    EXPECT_EQ(outcome.status, ServiceStatus::Unhealthy);
    EXPECT_TRUE(outcome.error_message.has_value());
}

TEST_F(TcpCheckerTest, CancelledCheckerReturnsAtOnceUntilResumed) {
    TcpChecker checker;
    checker.cancel();

    auto outcome = checker.check(view_for(server_.port()));
    EXPECT_TRUE(outcome.cancelled);

    checker.resume();
    outcome = checker.check(view_for(server_.port()));
    EXPECT_FALSE(outcome.cancelled);
    EXPECT_EQ(outcome.status, ServiceStatus::Healthy);
}

TEST(CheckerFactoryTest, PicksStrategyByProtocolAndName) {
    Config config;

    auto http = make_checker(test::make_definition("backend"), config);
    EXPECT_STREQ(http->name(), "http");

    auto redis = make_checker(test::make_definition("redis", true, Protocol::Tcp, 6379), config);
    EXPECT_STREQ(redis->name(), "redis");

    auto tcp = make_checker(test::make_definition("broker", true, Protocol::Tcp, 5672), config);
    EXPECT_STREQ(tcp->name(), "tcp");

    auto factory = default_checker_factory(config);
    EXPECT_STREQ(factory(test::make_definition("redis", true, Protocol::Tcp, 6379))->name(), "redis");
}
