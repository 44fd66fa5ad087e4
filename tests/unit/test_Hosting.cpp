#include <doctest/doctest.h>

#include "core/errors.h"
#include "hosting/host.h"

#include <stdexcept>
#include <string>
#include <vector>

namespace {
struct Counter {
    int value = 0;
};

struct Greeter {
    explicit Greeter(std::shared_ptr<Counter> counter) : counter(std::move(counter)) {}
    std::shared_ptr<Counter> counter;
};

struct LoggingService : HostedService {
    LoggingService(std::vector<std::string>& log, std::string id, bool fail_start = false, bool fail_stop = false)
        : log(log), id(std::move(id)), fail_start(fail_start), fail_stop(fail_stop) {}

    void start() override {
        if (fail_start) {
            throw std::runtime_error(id + " start");
        }
        log.push_back(id + ".start");
    }
    void stop() override {
        log.push_back(id + ".stop");
        if (fail_stop) {
            throw std::runtime_error(id + " stop");
        }
    }
    std::string name() const override { return id; }

    std::vector<std::string>& log;
    std::string id;
    bool fail_start;
    bool fail_stop;
};

struct FirstService : LoggingService { using LoggingService::LoggingService; };
struct SecondService : LoggingService { using LoggingService::LoggingService; };
struct ThirdService : LoggingService { using LoggingService::LoggingService; };

struct Cyclic {};
}

TEST_SUITE("ServiceProvider") {
    TEST_CASE("Singletons are created once, lazily") {
        int created = 0;
        ServiceCollection services;
        services.add_singleton<Counter>([&created](ServiceProvider&) {
            ++created;
            return std::make_shared<Counter>();
        });
        ServiceProvider provider(services);
        CHECK(created == 0);

        auto first = provider.get_required_service<Counter>();
        auto second = provider.get_required_service<Counter>();
        CHECK(first == second);
        CHECK(created == 1);
    }

    TEST_CASE("Transients are created per request and can depend on singletons") {
        ServiceCollection services;
        services.add_singleton<Counter>();
        services.add_transient<Greeter>([](ServiceProvider& provider) {
            return std::make_shared<Greeter>(provider.get_required_service<Counter>());
        });
        ServiceProvider provider(services);

        auto a = provider.get_required_service<Greeter>();
        auto b = provider.get_required_service<Greeter>();
        CHECK(a != b);
        CHECK(a->counter == b->counter);
    }

    TEST_CASE("The last registration wins") {
        auto first = std::make_shared<Counter>();
        auto second = std::make_shared<Counter>();
        ServiceCollection services;
        services.add_singleton(first).add_singleton(second);
        ServiceProvider provider(services);
        CHECK(provider.get_service<Counter>() == second);
    }

    TEST_CASE("Missing services") {
        ServiceCollection services;
        ServiceProvider provider(services);
        CHECK(provider.get_service<Counter>() == nullptr);
        CHECK_FALSE(provider.is_registered<Counter>());
        CHECK_THROWS_AS(provider.get_required_service<Counter>(), InvalidStateError);
    }

    TEST_CASE("Circular dependencies are detected") {
        ServiceCollection services;
        services.add_singleton<Cyclic>([](ServiceProvider& provider) {
            return provider.get_required_service<Cyclic>();
        });
        ServiceProvider provider(services);
        CHECK_THROWS_AS(provider.get_service<Cyclic>(), InvalidStateError);
    }
}

TEST_SUITE("Host") {
    TEST_CASE("Hosted services start in order and stop in reverse") {
        std::vector<std::string> log;
        ServiceCollection services;
        services.add_hosted_service<FirstService>([&log](ServiceProvider&) {
            return std::make_shared<FirstService>(log, "first");
        });
        services.add_hosted_service<SecondService>([&log](ServiceProvider&) {
            return std::make_shared<SecondService>(log, "second");
        });

        Host host(Configuration(), services);
        host.start();
        CHECK(host.is_running());
        CHECK_THROWS_AS(host.start(), InvalidStateError);
        host.stop();
        CHECK_FALSE(host.is_running());

        std::vector<std::string> expected{"first.start", "second.start", "second.stop", "first.stop"};
        CHECK(log == expected);
    }

    TEST_CASE("A failed start rolls back the services already started") {
        std::vector<std::string> log;
        ServiceCollection services;
        services.add_hosted_service<FirstService>([&log](ServiceProvider&) {
            return std::make_shared<FirstService>(log, "first");
        });
        services.add_hosted_service<SecondService>([&log](ServiceProvider&) {
            return std::make_shared<SecondService>(log, "second", true);
        });

        Host host(Configuration(), services);
        CHECK_THROWS_WITH(host.start(), "second start");
        CHECK_FALSE(host.is_running());
        std::vector<std::string> expected{"first.start", "first.stop"};
        CHECK(log == expected);
    }

    TEST_CASE("Every service is stopped even when one fails") {
        std::vector<std::string> log;
        ServiceCollection services;
        services.add_hosted_service<FirstService>([&log](ServiceProvider&) {
            return std::make_shared<FirstService>(log, "first");
        });
        services.add_hosted_service<SecondService>([&log](ServiceProvider&) {
            return std::make_shared<SecondService>(log, "second", false, true);
        });
        services.add_hosted_service<ThirdService>([&log](ServiceProvider&) {
            return std::make_shared<ThirdService>(log, "third", false, true);
        });

        Host host(Configuration(), services);
        host.start();
        CHECK_THROWS_WITH(host.stop(), "third stop");
        std::vector<std::string> expected{"first.start", "second.start", "third.start",
                                          "third.stop", "second.stop", "first.stop"};
        CHECK(log == expected);
    }

    TEST_CASE("Configuration is available as a service") {
        Host host(Configuration({{"Key", "Value"}}), ServiceCollection());
        auto configuration = host.services().get_required_service<Configuration>();
        CHECK(configuration->get("Key") == std::string("Value"));
    }

    TEST_CASE("HostBuilder applies configuration before services and builds once") {
        HostBuilder builder;
        std::string seen;
        builder.configure_app_configuration([](ConfigurationBuilder& configuration) {
                   configuration.add_values({{"Name", "cobalt"}});
               })
               .configure_services([&seen](const Configuration& configuration, ServiceCollection&) {
                   seen = configuration.get_or("Name", "");
               })
               .configure_services(nullptr);

        auto host = builder.build();
        REQUIRE(host);
        CHECK(seen == "cobalt");
        CHECK_THROWS_AS(builder.build(), InvalidStateError);
    }
}
