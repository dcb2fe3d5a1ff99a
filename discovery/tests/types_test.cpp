#include "types.hpp"
#include <gtest/gtest.h>
#include <stdexcept>

using namespace std::chrono_literals;

TEST(TypesTest, StatusStrings) {
    EXPECT_EQ(to_string(ServiceStatus::Unknown), "unknown");
    EXPECT_EQ(to_string(ServiceStatus::Starting), "starting");
    EXPECT_EQ(to_string(ServiceStatus::Healthy), "healthy");
    EXPECT_EQ(to_string(ServiceStatus::Degraded), "degraded");
    EXPECT_EQ(to_string(ServiceStatus::Unhealthy), "unhealthy");
}

TEST(TypesTest, ProtocolParsing) {
    EXPECT_EQ(protocol_from_string("HTTP"), Protocol::Http);
    EXPECT_EQ(protocol_from_string("tcp"), Protocol::Tcp);
    EXPECT_THROW(protocol_from_string("udp"), std::invalid_argument);
}

TEST(TypesTest, DefinitionUrls) {
    EndpointDefinition def;
    def.name = "backend";
    def.host = "localhost";
    def.port = 8001;
    def.health_path = "/api/health";

    EXPECT_EQ(def.url(), "http://localhost:8001");
    EXPECT_EQ(def.health_url(), "http://localhost:8001/api/health");
    EXPECT_EQ(def.timeout, 5s);
    EXPECT_TRUE(def.required);
}

TEST(TypesTest, AvailabilityCoversDegraded) {
    EndpointState state;
    EXPECT_FALSE(state.is_available());
    state.status = ServiceStatus::Degraded;
    EXPECT_TRUE(state.is_available());
    state.status = ServiceStatus::Starting;
    EXPECT_FALSE(state.is_available());
}

TEST(TypesTest, ReportJsonUsesNullForMissingFields) {
    ServiceReport report;
    report.status = ServiceStatus::Healthy;
    report.url = "http://localhost:8001";
    report.required = true;
    report.response_time = 250ms;

    auto j = report.to_json();
    EXPECT_EQ(j["status"], "healthy");
    EXPECT_DOUBLE_EQ(j["response_time"].get<double>(), 0.25);
    EXPECT_TRUE(j["last_check"].is_null());
    EXPECT_TRUE(j["error"].is_null());
    EXPECT_TRUE(j["version"].is_null());
    EXPECT_TRUE(j["capabilities"].is_array());
}

TEST(TypesTest, AbortedOutcomeIsMarkedCancelled) {
    auto outcome = CheckOutcome::aborted(5ms);
    EXPECT_TRUE(outcome.cancelled);
    EXPECT_EQ(outcome.status, ServiceStatus::Unhealthy);
    EXPECT_FALSE(CheckOutcome::unhealthy("refused").cancelled);
}

TEST(TypesTest, UnhealthyOutcomeFactory) {
    auto outcome = CheckOutcome::unhealthy("refused", 40ms);
    EXPECT_EQ(outcome.status, ServiceStatus::Unhealthy);
    EXPECT_EQ(outcome.error_message.value_or(""), "refused");
    EXPECT_EQ(outcome.response_time, 40ms);
}
