#pragma once

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <type_traits>
#include <typeindex>
#include <vector>

#include "core/errors.h"

class ServiceProvider;

// Background service whose lifetime follows the host.
class HostedService {
public:
    virtual ~HostedService() = default;

    virtual void start() = 0;
    virtual void stop() = 0;
    virtual std::string name() const { return "hosted service"; }
};

enum class ServiceLifetime {
    Singleton,
    Transient
};

struct ServiceDescriptor {
    std::type_index type;
    std::string type_name;
    ServiceLifetime lifetime;
    std::function<std::shared_ptr<void>(ServiceProvider&)> factory;
};

using HostedServiceFactory = std::function<std::shared_ptr<HostedService>(ServiceProvider&)>;

class ServiceCollection {
public:
    template <typename T>
    using Factory = std::function<std::shared_ptr<T>(ServiceProvider&)>;

    template <typename T>
    ServiceCollection& add_singleton(Factory<T> factory) {
        return add<T>(ServiceLifetime::Singleton, std::move(factory));
    }

    template <typename T>
    ServiceCollection& add_singleton(std::shared_ptr<T> instance) {
        return add<T>(ServiceLifetime::Singleton, [instance](ServiceProvider&) { return instance; });
    }

    template <typename T>
    ServiceCollection& add_singleton() {
        return add<T>(ServiceLifetime::Singleton, [](ServiceProvider&) { return std::make_shared<T>(); });
    }

    template <typename T>
    ServiceCollection& add_transient(Factory<T> factory) {
        return add<T>(ServiceLifetime::Transient, std::move(factory));
    }

    // Registers T as a singleton and starts/stops it with the host.
    template <typename T>
    ServiceCollection& add_hosted_service(Factory<T> factory);

    template <typename T>
    bool contains() const {
        for (const auto& descriptor : descriptors_) {
            if (descriptor.type == std::type_index(typeid(T))) {
                return true;
            }
        }
        return false;
    }

    const std::vector<ServiceDescriptor>& descriptors() const { return descriptors_; }
    const std::vector<HostedServiceFactory>& hosted_services() const { return hosted_services_; }
    std::size_t size() const { return descriptors_.size(); }

private:
    template <typename T>
    ServiceCollection& add(ServiceLifetime lifetime, Factory<T> factory) {
        if (!factory) {
            throw std::invalid_argument(std::string("Empty factory for service: ") + typeid(T).name());
        }
        descriptors_.push_back(ServiceDescriptor{
            std::type_index(typeid(T)),
            typeid(T).name(),
            lifetime,
            [factory = std::move(factory)](ServiceProvider& provider) -> std::shared_ptr<void> {
                return factory(provider);
            }});
        return *this;
    }

    std::vector<ServiceDescriptor> descriptors_;
    std::vector<HostedServiceFactory> hosted_services_;
};

// Resolves services registered in a ServiceCollection. The last registration
// for a type wins. Singletons are created lazily, once.
class ServiceProvider {
public:
    explicit ServiceProvider(const ServiceCollection& services);
    ServiceProvider(const ServiceProvider&) = delete;
    ServiceProvider& operator=(const ServiceProvider&) = delete;

    template <typename T>
    std::shared_ptr<T> get_service() {
        return std::static_pointer_cast<T>(resolve(std::type_index(typeid(T))));
    }

    template <typename T>
    std::shared_ptr<T> get_required_service() {
        auto service = get_service<T>();
        if (!service) {
            throw InvalidStateError(std::string("No service registered for type: ") + typeid(T).name());
        }
        return service;
    }

    template <typename T>
    bool is_registered() const {
        return descriptors_.count(std::type_index(typeid(T))) > 0;
    }

    std::vector<std::shared_ptr<HostedService>> create_hosted_services();

private:
    std::shared_ptr<void> resolve(std::type_index type);

    std::map<std::type_index, ServiceDescriptor> descriptors_;
    std::vector<HostedServiceFactory> hosted_factories_;
    std::map<std::type_index, std::shared_ptr<void>> singletons_;
    std::set<std::type_index> resolving_;
    std::recursive_mutex mutex_;
};

template <typename T>
ServiceCollection& ServiceCollection::add_hosted_service(Factory<T> factory) {
    static_assert(std::is_base_of<HostedService, T>::value, "T must derive from HostedService");
    add_singleton<T>(std::move(factory));
    hosted_services_.push_back([](ServiceProvider& provider) -> std::shared_ptr<HostedService> {
        return provider.get_required_service<T>();
    });
    return *this;
}
