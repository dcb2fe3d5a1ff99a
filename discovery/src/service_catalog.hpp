#pragma once
#include "config.hpp"
#include "types.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

// Builds the endpoint definitions handed to ServiceDiscovery at startup.
class ServiceCatalog {
public:
    // Platform services with their stock addresses and policies.
    static std::vector<EndpointDefinition> defaults();

    // Overlays {"services": {"<name>": {...}}} on top of the defaults.
    // Entries without host or port fall back to the default of the same name,
    // or are dropped when there is none.
    static std::vector<EndpointDefinition> from_json(const nlohmann::json& doc);

    // Throws std::runtime_error if the file cannot be read or parsed.
    static std::vector<EndpointDefinition> load_file(const std::string& path);

    // <NAME>_HOST / <NAME>_PORT environment overrides.
    static void apply_env_overrides(std::vector<EndpointDefinition>& definitions);

    static std::vector<EndpointDefinition> load(const Config& config);
};
