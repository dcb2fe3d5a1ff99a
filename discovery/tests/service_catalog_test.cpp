#include "service_catalog.hpp"
#include <gtest/gtest.h>
#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <stdexcept>

using namespace std::chrono_literals;

namespace {

const EndpointDefinition* find(const std::vector<EndpointDefinition>& defs, const std::string& name) {
    auto it = std::find_if(defs.begin(), defs.end(), [&name](const EndpointDefinition& d) {
        return d.name == name;
    });
    return it == defs.end() ? nullptr : &*it;
}

} // namespace

TEST(ServiceCatalogTest, DefaultsCoverPlatformServices) {
    auto defs = ServiceCatalog::defaults();
    ASSERT_EQ(defs.size(), 7u);

    auto redis = find(defs, "redis");
    ASSERT_NE(redis, nullptr);
    EXPECT_EQ(redis->protocol, Protocol::Tcp);
    EXPECT_EQ(redis->port, 6379);
    EXPECT_EQ(redis->timeout, 3s);
    EXPECT_TRUE(redis->required);

    auto ollama = find(defs, "ollama");
    ASSERT_NE(ollama, nullptr);
    EXPECT_EQ(ollama->health_url(), "http://localhost:11434/api/tags");

    auto npu = find(defs, "npu_worker");
    ASSERT_NE(npu, nullptr);
    EXPECT_FALSE(npu->required);
    EXPECT_EQ(npu->timeout, 10s);
}

TEST(ServiceCatalogTest, JsonOverridesAndAddsServices) {
    auto doc = nlohmann::json::parse(R"({
        "services": {
            "backend": {"host": "10.0.0.5", "port": 9001, "health_endpoint": "/healthz", "timeout": 2.5},
            "metrics": {"host": "10.0.0.9", "port": 9100, "protocol": "tcp", "required": false}
        }
    })");

    auto defs = ServiceCatalog::from_json(doc);
    ASSERT_EQ(defs.size(), 8u);

    auto backend = find(defs, "backend");
    ASSERT_NE(backend, nullptr);
    EXPECT_EQ(backend->url(), "http://10.0.0.5:9001");
    EXPECT_EQ(backend->health_path, "/healthz");
    EXPECT_EQ(backend->timeout, 2500ms);
    EXPECT_TRUE(backend->required);

    auto metrics = find(defs, "metrics");
    ASSERT_NE(metrics, nullptr);
    EXPECT_EQ(metrics->protocol, Protocol::Tcp);
    EXPECT_FALSE(metrics->required);
}

TEST(ServiceCatalogTest, IncompleteEntries) {
    auto doc = nlohmann::json::parse(R"({
        "services": {
            "frontend": {"port": 4000},
            "orphan": {"host": "10.0.0.1"}
        }
    })");

    auto defs = ServiceCatalog::from_json(doc);
    EXPECT_EQ(find(defs, "orphan"), nullptr);

    auto frontend = find(defs, "frontend");
    ASSERT_NE(frontend, nullptr);
    EXPECT_EQ(frontend->host, "172.16.168.21");
    EXPECT_EQ(frontend->port, 4000);
}

TEST(ServiceCatalogTest, InvalidFieldsThrow) {
    auto doc = nlohmann::json::parse(R"({"services": {"backend": {"host": "h", "port": 1, "protocol": "udp"}}})");
    EXPECT_THROW(ServiceCatalog::from_json(doc), std::runtime_error);

    doc = nlohmann::json::parse(R"({"services": {"backend": {"host": "h", "port": "eighty"}}})");
    EXPECT_THROW(ServiceCatalog::from_json(doc), std::runtime_error);
}

TEST(ServiceCatalogTest, LoadFileErrors) {
    EXPECT_THROW(ServiceCatalog::load_file("/nonexistent/services.json"), std::runtime_error);

    std::string path = ::testing::TempDir() + "catalog_broken.json";
    {
        std::ofstream out(path);
        out << "{ not json";
    }
    EXPECT_THROW(ServiceCatalog::load_file(path), std::runtime_error);
    std::remove(path.c_str());
}

TEST(ServiceCatalogTest, LoadFileReadsDefinitions) {
    std::string path = ::testing::TempDir() + "catalog_ok.json";
    {
        std::ofstream out(path);
        out << R"({"services": {"redis": {"host": "cache.local", "port": 6380}}})";
    }

    auto defs = ServiceCatalog::load_file(path);
    std::remove(path.c_str());

    auto redis = find(defs, "redis");
    ASSERT_NE(redis, nullptr);
    EXPECT_EQ(redis->url(), "tcp://cache.local:6380");
}

TEST(ServiceCatalogTest, EnvironmentOverridesAddress) {
    setenv("OLLAMA_HOST", "gpu-box", 1);
    setenv("OLLAMA_PORT", "12000", 1);

    auto defs = ServiceCatalog::defaults();
    ServiceCatalog::apply_env_overrides(defs);

    unsetenv("OLLAMA_HOST");
    unsetenv("OLLAMA_PORT");

    auto ollama = find(defs, "ollama");
    ASSERT_NE(ollama, nullptr);
    EXPECT_EQ(ollama->url(), "http://gpu-box:12000");
    EXPECT_EQ(find(defs, "backend")->url(), "http://localhost:8001");
}
