#include "health_check_strategy.hpp"
#include "http_checker.hpp"
#include "tcp_checker.hpp"

std::shared_ptr<HealthCheckStrategy> make_checker(const EndpointDefinition& definition, const Config& config) {
    switch (definition.protocol) {
        case Protocol::Tcp:
            return std::make_shared<TcpChecker>(config.is_datastore_service(definition.name));
        case Protocol::Http:
            return std::make_shared<HttpChecker>();
    }
    return std::make_shared<HttpChecker>();
}

CheckerFactory default_checker_factory(const Config& config) {
    return [config](const EndpointDefinition& definition) {
        return make_checker(definition, config);
    };
}
