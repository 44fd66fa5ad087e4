#include "hosting/host.h"

#include <iostream>

#include "core/errors.h"

Host::Host(Configuration configuration, const ServiceCollection& services)
    : configuration_(std::make_shared<Configuration>(std::move(configuration)))
{
    ServiceCollection all = services;
    if (!all.contains<Configuration>()) {
        all.add_singleton<Configuration>(configuration_);
    }
    services_ = std::make_unique<ServiceProvider>(all);
}

Host::~Host() {
    if (!running_) {
        return;
    }
    try {
        stop();
    } catch (const std::exception& e) {
        std::cerr << "⚠️  Host: error while stopping during destruction: " << e.what() << std::endl;
    }
}

void Host::start() {
    if (running_) {
        throw InvalidStateError("Host is already running");
    }

    std::cout << "🔧 Host: Starting hosted services..." << std::endl;
    auto hosted = services_->create_hosted_services();
    for (const auto& service : hosted) {
        try {
            service->start();
        } catch (...) {
            std::cerr << "❌ Host: " << service->name() << " failed to start" << std::endl;
            running_ = true;
            try {
                stop();
            } catch (const std::exception& e) {
                std::cerr << "⚠️  Host: rollback stop failed: " << e.what() << std::endl;
            }
            throw;
        }
        started_.push_back(service);
        std::cout << "✅ Host: " << service->name() << " started" << std::endl;
    }
    running_ = true;
    std::cout << "✅ Host started" << std::endl;
}

void Host::stop() {
    if (!running_) {
        return;
    }

    std::cout << "🔧 Host: Stopping hosted services..." << std::endl;
    std::exception_ptr first_error;
    for (auto it = started_.rbegin(); it != started_.rend(); ++it) {
        try {
            (*it)->stop();
            std::cout << "✅ Host: " << (*it)->name() << " stopped" << std::endl;
        } catch (...) {
            std::cerr << "❌ Host: " << (*it)->name() << " failed to stop" << std::endl;
            if (!first_error) {
                first_error = std::current_exception();
            }
        }
    }
    started_.clear();
    running_ = false;

    if (first_error) {
        std::rethrow_exception(first_error);
    }
    std::cout << "✅ Host stopped" << std::endl;
}

HostBuilder HostBuilder::create_default(const std::string& env_prefix) {
    HostBuilder builder;
    if (!env_prefix.empty()) {
        builder.configuration_builder_.add_environment_variables(env_prefix);
    }
    return builder;
}

HostBuilder& HostBuilder::configure_app_configuration(ConfigureAppConfiguration configure) {
    if (configure) {
        configuration_actions_.push_back(std::move(configure));
    }
    return *this;
}

HostBuilder& HostBuilder::configure_services(ConfigureServices configure) {
    if (configure) {
        service_actions_.push_back(std::move(configure));
    }
    return *this;
}

std::unique_ptr<Host> HostBuilder::build() {
    if (built_) {
        throw InvalidStateError("Build can only be called once");
    }
    built_ = true;

    for (const auto& action : configuration_actions_) {
        action(configuration_builder_);
    }
    auto configuration = configuration_builder_.build();

    ServiceCollection services;
    for (const auto& action : service_actions_) {
        action(configuration, services);
    }

    return std::make_unique<Host>(std::move(configuration), services);
}
