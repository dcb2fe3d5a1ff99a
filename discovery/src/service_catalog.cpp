#include "service_catalog.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <fstream>
#include <stdexcept>

namespace {

EndpointDefinition make_definition(const std::string& name, const std::string& host, int port,
                                   Protocol protocol, const std::string& health_path,
                                   double timeout_seconds, bool required) {
    EndpointDefinition def;
    def.name = name;
    def.host = host;
    def.port = port;
    def.protocol = protocol;
    def.health_path = health_path;
    def.timeout = util::seconds_to_ms(timeout_seconds);
    def.required = required;
    return def;
}

std::vector<EndpointDefinition>::iterator find_by_name(std::vector<EndpointDefinition>& defs,
                                                       const std::string& name) {
    return std::find_if(defs.begin(), defs.end(),
                        [&name](const EndpointDefinition& d) { return d.name == name; });
}

} // namespace

std::vector<EndpointDefinition> ServiceCatalog::defaults() {
    return {
        make_definition("frontend", "172.16.168.21", 5173, Protocol::Http, "/", 5.0, true),
        make_definition("npu_worker", "172.16.168.22", 8081, Protocol::Http, "/health", 10.0, false),
        make_definition("redis", "172.16.168.23", 6379, Protocol::Tcp, "", 3.0, true),
        make_definition("ai_stack", "172.16.168.24", 8080, Protocol::Http, "/health", 10.0, false),
        make_definition("browser_service", "172.16.168.25", 3000, Protocol::Http, "/health", 10.0, false),
        make_definition("backend", "localhost", 8001, Protocol::Http, "/api/health", 5.0, true),
        make_definition("ollama", "localhost", 11434, Protocol::Http, "/api/tags", 10.0, true),
    };
}

std::vector<EndpointDefinition> ServiceCatalog::from_json(const nlohmann::json& doc) {
    auto definitions = defaults();

    if (!doc.is_object() || !doc.contains("services")) {
        return definitions;
    }

    const auto& services = doc["services"];
    if (!services.is_object()) {
        throw std::runtime_error("'services' must be an object");
    }

    for (const auto& [name, item] : services.items()) {
        if (!item.is_object()) {
            spdlog::error("Service {} definition is not an object, skipping", name);
            continue;
        }

        auto existing = find_by_name(definitions, name);
        bool has_default = existing != definitions.end();

        EndpointDefinition def;
        if (has_default) {
            def = *existing;
        } else {
            def.name = name;
        }

        std::string host;
        int port = 0;
        try {
            host = item.value("host", "");
            port = item.value("port", 0);
        } catch (const nlohmann::json::exception& e) {
            throw std::runtime_error("Invalid address for service " + name + ": " + e.what());
        }
        if (host.empty() || port == 0) {
            if (!has_default) {
                spdlog::error("Service {} missing required 'host' or 'port' in configuration, skipping", name);
                continue;
            }
            spdlog::error("Service {} missing required 'host' or 'port' in configuration, using defaults", name);
        }
        if (!host.empty()) def.host = host;
        if (port != 0) def.port = port;

        try {
            if (item.contains("protocol")) {
                def.protocol = protocol_from_string(item["protocol"].get<std::string>());
            }
            if (item.contains("health_endpoint")) {
                def.health_path = item["health_endpoint"].get<std::string>();
            } else if (item.contains("health_path")) {
                def.health_path = item["health_path"].get<std::string>();
            }
            if (item.contains("timeout")) {
                def.timeout = util::seconds_to_ms(item["timeout"].get<double>());
            }
            if (item.contains("required")) {
                def.required = item["required"].get<bool>();
            }
        } catch (const std::exception& e) {
            throw std::runtime_error("Invalid definition for service " + name + ": " + e.what());
        }

        if (has_default) {
            *existing = def;
        } else {
            definitions.push_back(def);
        }
    }

    return definitions;
}

std::vector<EndpointDefinition> ServiceCatalog::load_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("Cannot open services file " + path);
    }

    nlohmann::json doc;
    try {
        doc = nlohmann::json::parse(in);
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("Failed to parse services file " + path + ": " + e.what());
    }

    spdlog::info("Loaded service definitions from {}", path);
    return from_json(doc);
}

void ServiceCatalog::apply_env_overrides(std::vector<EndpointDefinition>& definitions) {
    for (auto& def : definitions) {
        auto prefix = util::to_upper(def.name);

        auto host = util::get_env_var(prefix + "_HOST");
        if (!host.empty()) {
            def.host = host;
        }

        def.port = util::get_env_int(prefix + "_PORT", def.port);
    }
}

std::vector<EndpointDefinition> ServiceCatalog::load(const Config& config) {
    auto definitions = config.services_file.empty() ? defaults() : load_file(config.services_file);
    apply_env_overrides(definitions);
    return definitions;
}
