#include "status_server.hpp"
#include "util.hpp"
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <atomic>
#include <thread>

class StatusServer::Impl {
public:
    Impl(const Config& config, ServiceDiscovery& discovery)
        : config_(config), discovery_(discovery), running_(false), port_(0) {
        register_routes();
    }

    ~Impl() {
        stop();
    }

    bool start() {
        if (running_) {
            spdlog::warn("Status server already running");
            return true;
        }

        if (config_.status_port == 0) {
            port_ = server_.bind_to_any_port(config_.status_host);
        } else {
            port_ = server_.bind_to_port(config_.status_host, config_.status_port) ? config_.status_port : -1;
        }

        if (port_ <= 0) {
            spdlog::error("Failed to bind status server on {}:{}", config_.status_host, config_.status_port);
            return false;
        }

        running_ = true;
        server_thread_ = std::thread([this]() {
            if (!server_.listen_after_bind()) {
                spdlog::error("Status server on {}:{} stopped unexpectedly", config_.status_host, port_);
            }
        });
        server_.wait_until_ready();

        spdlog::info("Status server listening on {}:{}", config_.status_host, port_);
        return true;
    }

    void stop() {
        if (!running_) return;

        running_ = false;
        server_.stop();
        if (server_thread_.joinable()) {
            server_thread_.join();
        }
        spdlog::info("Status server stopped");
    }

    bool is_running() const {
        return running_;
    }

    int port() const {
        return port_;
    }

private:
    void register_routes() {
        server_.Get("/health", [this](const httplib::Request&, httplib::Response& res) {
            nlohmann::json body;
            body["service"] = config_.service_name;
            body["status"] = "healthy";
            body["monitoring"] = discovery_.is_monitoring();
            body["sweeps"] = {
                {"completed", discovery_.monitor().completed_sweeps()},
                {"failed", discovery_.monitor().failed_sweeps()}
            };
            body["timestamp"] = util::current_iso8601();
            res.set_content(body.dump(), "application/json");
        });

        server_.Get("/ready", [this](const httplib::Request&, httplib::Response& res) {
            auto summary = discovery_.get_service_status_summary();

            nlohmann::json body;
            body["service"] = config_.service_name;
            body["missing"] = nlohmann::json::array();
            for (const auto& [name, report] : summary.services) {
                if (report.required && report.status != ServiceStatus::Healthy) {
                    body["missing"].push_back(name);
                }
            }
            bool ready = body["missing"].empty();
            body["status"] = ready ? "ready" : "not_ready";

            res.status = ready ? 200 : 503;
            res.set_content(body.dump(), "application/json");
        });

        server_.Get("/services", [this](const httplib::Request&, httplib::Response& res) {
            res.set_content(discovery_.get_service_status_summary().to_json().dump(2), "application/json");
        });

        server_.Get(R"(/services/([A-Za-z0-9_.\-]+))", [this](const httplib::Request& req, httplib::Response& res) {
            std::string name = req.matches[1];
            auto summary = discovery_.get_service_status_summary();

            auto it = summary.services.find(name);
            if (it == summary.services.end()) {
                res.status = 404;
                res.set_content(nlohmann::json{{"error", "unknown service"}, {"name", name}}.dump(),
                                "application/json");
                return;
            }

            auto body = it->second.to_json();
            body["name"] = name;
            res.set_content(body.dump(2), "application/json");
        });
    }

    Config config_;
    ServiceDiscovery& discovery_;
    httplib::Server server_;
    std::atomic<bool> running_;
    int port_;
    std::thread server_thread_;
};

StatusServer::StatusServer(const Config& config, ServiceDiscovery& discovery)
    : pImpl_(std::make_unique<Impl>(config, discovery)) {}

StatusServer::~StatusServer() = default;

bool StatusServer::start() {
    return pImpl_->start();
}

void StatusServer::stop() {
    pImpl_->stop();
}

bool StatusServer::is_running() const {
    return pImpl_->is_running();
}

int StatusServer::port() const {
    return pImpl_->port();
}
