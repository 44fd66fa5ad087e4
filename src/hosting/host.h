#pragma once

#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "hosting/configuration.h"
#include "hosting/service_collection.h"

// Managed service container: owns configuration, services and the lifetime of
// hosted services.
class Host {
public:
    Host(Configuration configuration, const ServiceCollection& services);
    ~Host();

    Host(const Host&) = delete;
    Host& operator=(const Host&) = delete;

    // Starts hosted services in registration order.
    void start();

    // Stops started hosted services in reverse order. Every service gets its
    // stop() call; the first failure is rethrown afterwards.
    void stop();

    bool is_running() const { return running_; }
    const Configuration& configuration() const { return *configuration_; }
    ServiceProvider& services() { return *services_; }

private:
    std::shared_ptr<Configuration> configuration_;
    std::unique_ptr<ServiceProvider> services_;
    std::vector<std::shared_ptr<HostedService>> started_;
    bool running_ = false;
};

class HostBuilder {
public:
    using ConfigureAppConfiguration = std::function<void(ConfigurationBuilder&)>;
    using ConfigureServices = std::function<void(const Configuration&, ServiceCollection&)>;

    HostBuilder() = default;

    // Environment variables starting with env_prefix, then whatever the
    // application contributes.
    static HostBuilder create_default(const std::string& env_prefix = "COBALT_");

    HostBuilder& configure_app_configuration(ConfigureAppConfiguration configure);
    HostBuilder& configure_services(ConfigureServices configure);

    std::unique_ptr<Host> build();

private:
    ConfigurationBuilder configuration_builder_;
    std::vector<ConfigureAppConfiguration> configuration_actions_;
    std::vector<ConfigureServices> service_actions_;
    bool built_ = false;
};
