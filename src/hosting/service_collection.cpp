#include "hosting/service_collection.h"

ServiceProvider::ServiceProvider(const ServiceCollection& services)
    : hosted_factories_(services.hosted_services())
{
    for (const auto& descriptor : services.descriptors()) {
        descriptors_.erase(descriptor.type);
        descriptors_.emplace(descriptor.type, descriptor);
    }
}

std::shared_ptr<void> ServiceProvider::resolve(std::type_index type) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);

    auto it = descriptors_.find(type);
    if (it == descriptors_.end()) {
        return nullptr;
    }
    const auto& descriptor = it->second;

    if (descriptor.lifetime == ServiceLifetime::Singleton) {
        auto cached = singletons_.find(type);
        if (cached != singletons_.end()) {
            return cached->second;
        }
    }

    if (resolving_.count(type)) {
        throw InvalidStateError("Circular dependency detected while resolving: " + descriptor.type_name);
    }

    resolving_.insert(type);
    std::shared_ptr<void> instance;
    try {
        instance = descriptor.factory(*this);
    } catch (...) {
        resolving_.erase(type);
        throw;
    }
    resolving_.erase(type);

    if (descriptor.lifetime == ServiceLifetime::Singleton) {
        singletons_[type] = instance;
    }
    return instance;
}

std::vector<std::shared_ptr<HostedService>> ServiceProvider::create_hosted_services() {
    std::vector<std::shared_ptr<HostedService>> services;
    services.reserve(hosted_factories_.size());
    for (const auto& factory : hosted_factories_) {
        services.push_back(factory(*this));
    }
    return services;
}
