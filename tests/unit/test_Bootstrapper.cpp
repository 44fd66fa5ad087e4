#include <doctest/doctest.h>

#include "core/bootstrapper.h"
#include "core/errors.h"
#include "core/fault_channel.h"
#include "core/fault_source.h"

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace {
struct RecordingService : HostedService {
    explicit RecordingService(std::vector<std::string>& log, bool fail_stop = false)
        : log(log), fail_stop(fail_stop) {}

    void start() override { log.push_back("hosted.start"); }
    void stop() override {
        log.push_back("hosted.stop");
        if (fail_stop) {
            throw std::runtime_error("stop failed");
        }
    }
    std::string name() const override { return "recording"; }

    std::vector<std::string>& log;
    bool fail_stop;
};

BootstrapperOptions quiet_options() {
    BootstrapperOptions options;
    options.host_builder_factory = []() { return HostBuilder(); };
    return options;
}

struct FaultRecorder {
    explicit FaultRecorder(FaultChannel& channel) {
        subscription = channel.subscribe([this](std::exception_ptr error) {
            faults.push_back(describe_exception(error));
        });
    }
    ~FaultRecorder() { subscription.disconnect(); }

    std::vector<std::string> faults;
    FaultChannel::Subscription subscription;
};

struct RecordingFaultSource : FaultSource {
    void attach(std::shared_ptr<FaultChannel> target) override {
        ++attach_count;
        channel = std::move(target);
    }
    void detach() override {
        ++detach_count;
        channel.reset();
    }

    void raise(const std::string& message) {
        if (channel) {
            channel->publish(std::make_exception_ptr(std::runtime_error(message)));
        }
    }

    int attach_count = 0;
    int detach_count = 0;
    std::shared_ptr<FaultChannel> channel;
};
}

TEST_SUITE("Bootstrapper") {
    TEST_CASE("Start and stop walk through every state") {
        Bootstrapper bootstrapper(quiet_options());
        std::vector<BootstrapperState> seen;
        bootstrapper.signal_starting().connect([&]() { seen.push_back(bootstrapper.state()); });
        bootstrapper.signal_started().connect([&]() { seen.push_back(bootstrapper.state()); });
        bootstrapper.signal_stopping().connect([&]() { seen.push_back(bootstrapper.state()); });
        bootstrapper.signal_stopped().connect([&]() { seen.push_back(bootstrapper.state()); });

        CHECK(bootstrapper.state() == BootstrapperState::NotStarted);
        bootstrapper.start();
        CHECK(bootstrapper.state() == BootstrapperState::Started);
        CHECK(bootstrapper.host() != nullptr);
        bootstrapper.stop();
        CHECK(bootstrapper.state() == BootstrapperState::Stopped);
        CHECK(bootstrapper.is_disposed());
        CHECK(bootstrapper.host() == nullptr);

        REQUIRE(seen.size() == 4);
        CHECK(seen[0] == BootstrapperState::Starting);
        CHECK(seen[1] == BootstrapperState::Started);
        CHECK(seen[2] == BootstrapperState::Stopping);
        CHECK(seen[3] == BootstrapperState::Stopped);
    }

    TEST_CASE("Extension points run in a fixed order") {
        std::vector<std::string> log;
        auto options = quiet_options();
        options.configure_app_configuration = [&](ConfigurationBuilder& builder) {
            log.push_back("configuration");
            builder.add_values({{"Answer", "42"}});
        };
        options.configure_services = [&](const Configuration& configuration, ServiceCollection& services) {
            log.push_back("services");
            CHECK(configuration.get_int("Answer") == 42);
            services.add_hosted_service<RecordingService>([&log](ServiceProvider&) {
                return std::make_shared<RecordingService>(log);
            });
        };
        options.startup_hook = [&](Bootstrapper& bootstrapper) {
            log.push_back("startup");
            CHECK(bootstrapper.state() == BootstrapperState::Starting);
            CHECK(bootstrapper.host()->is_running());
        };

        Bootstrapper bootstrapper(options);
        bootstrapper.signal_started().connect([&]() { log.push_back("started"); });
        bootstrapper.start();
        bootstrapper.stop();

        std::vector<std::string> expected{"configuration", "services", "hosted.start", "startup", "started", "hosted.stop"};
        CHECK(log == expected);
    }

    TEST_CASE("Starting twice is rejected") {
        Bootstrapper bootstrapper(quiet_options());
        FaultRecorder recorder(*bootstrapper.fault_channel());
        bootstrapper.start();
        CHECK_THROWS_AS(bootstrapper.start(), InvalidStateError);
        CHECK(bootstrapper.state() == BootstrapperState::Started);
        CHECK(recorder.faults.empty());
        bootstrapper.stop();
    }

    TEST_CASE("A failed start returns to NotStarted and publishes one fault") {
        auto options = quiet_options();
        options.configure_services = [](const Configuration&, ServiceCollection&) {
            throw std::runtime_error("cannot configure");
        };
        Bootstrapper bootstrapper(options);
        FaultRecorder recorder(*bootstrapper.fault_channel());

        CHECK_THROWS_WITH_AS(bootstrapper.start(), "cannot configure", std::runtime_error);
        CHECK(bootstrapper.state() == BootstrapperState::NotStarted);
        CHECK_FALSE(bootstrapper.is_disposed());
        REQUIRE(recorder.faults.size() == 1);
        CHECK(recorder.faults[0] == "cannot configure");
    }

    TEST_CASE("A failing startup hook fails the start") {
        auto options = quiet_options();
        options.startup_hook = [](Bootstrapper&) { throw std::runtime_error("hook"); };
        Bootstrapper bootstrapper(options);
        FaultRecorder recorder(*bootstrapper.fault_channel());

        CHECK_THROWS_AS(bootstrapper.start(), std::runtime_error);
        CHECK(bootstrapper.state() == BootstrapperState::NotStarted);
        CHECK(recorder.faults.size() == 1);
    }

    TEST_CASE("Stop before start is allowed and disposes") {
        Bootstrapper bootstrapper(quiet_options());
        bootstrapper.stop();
        CHECK(bootstrapper.state() == BootstrapperState::Stopped);
        CHECK(bootstrapper.is_disposed());
    }

    TEST_CASE("Operations after dispose throw DisposedError") {
        Bootstrapper bootstrapper(quiet_options());
        bootstrapper.dispose();
        CHECK_NOTHROW(bootstrapper.dispose());
        CHECK_THROWS_AS(bootstrapper.start(), DisposedError);
        CHECK_THROWS_AS(bootstrapper.stop(), DisposedError);
        CHECK_THROWS_WITH(bootstrapper.start(), "Cannot access a disposed object: Bootstrapper");
    }

    TEST_CASE("Starting after stop throws DisposedError") {
        Bootstrapper bootstrapper(quiet_options());
        bootstrapper.start();
        bootstrapper.stop();
        CHECK_THROWS_AS(bootstrapper.start(), DisposedError);
    }

    TEST_CASE("A failing host stop publishes, rethrows and still disposes") {
        std::vector<std::string> log;
        auto options = quiet_options();
        options.configure_services = [&log](const Configuration&, ServiceCollection& services) {
            services.add_hosted_service<RecordingService>([&log](ServiceProvider&) {
                return std::make_shared<RecordingService>(log, true);
            });
        };
        Bootstrapper bootstrapper(options);
        FaultRecorder recorder(*bootstrapper.fault_channel());

        bootstrapper.start();
        CHECK_THROWS_WITH(bootstrapper.stop(), "stop failed");
        CHECK(bootstrapper.is_disposed());
        CHECK(recorder.faults.size() == 1);
    }

    TEST_CASE("Faults are routed to an injected channel") {
        auto channel = std::make_shared<FaultChannel>();
        FaultRecorder recorder(*channel);
        auto options = quiet_options();
        options.fault_channel = channel;

        Bootstrapper bootstrapper(options);
        CHECK(bootstrapper.fault_channel() == channel);
        bootstrapper.raise_unhandled_exception(std::make_exception_ptr(std::runtime_error("boom")));
        bootstrapper.raise_unhandled_exception(nullptr);
        REQUIRE(recorder.faults.size() == 1);
        CHECK(recorder.faults[0] == "boom");
    }

    TEST_CASE("Fault sources are attached on start and detached on dispose") {
        auto source = std::make_shared<RecordingFaultSource>();
        auto options = quiet_options();
        options.fault_sources.push_back(source);
        Bootstrapper bootstrapper(options);

        CHECK(source->attach_count == 0);
        bootstrapper.start();
        CHECK(source->attach_count == 1);
        CHECK(source->channel == bootstrapper.fault_channel());
        CHECK(source->detach_count == 0);

        bootstrapper.stop();
        CHECK(source->detach_count == 1);
        CHECK_FALSE(source->channel);

        bootstrapper.dispose();
        CHECK(source->detach_count == 1);
    }

    TEST_CASE("A fault raised by a source reaches the channel subscribers") {
        auto source = std::make_shared<RecordingFaultSource>();
        auto options = quiet_options();
        options.fault_sources.push_back(source);
        Bootstrapper bootstrapper(options);
        FaultRecorder recorder(*bootstrapper.fault_channel());

        bootstrapper.start();
        source->raise("from a source");
        REQUIRE(recorder.faults.size() == 1);
        CHECK(recorder.faults[0] == "from a source");
        bootstrapper.stop();
    }

    TEST_CASE("With capture off no source is attached") {
        auto source = std::make_shared<RecordingFaultSource>();
        auto options = quiet_options();
        options.capture_unhandled_exceptions = false;
        options.fault_sources.push_back(source);
        Bootstrapper bootstrapper(options);
        FaultRecorder recorder(*bootstrapper.fault_channel());

        bootstrapper.start();
        CHECK(source->attach_count == 0);
        source->raise("ignored");
        CHECK(recorder.faults.empty());

        bootstrapper.stop();
        CHECK(source->detach_count == 0);
    }

    TEST_CASE("Disposing a started bootstrapper detaches its sources") {
        auto source = std::make_shared<RecordingFaultSource>();
        auto options = quiet_options();
        options.fault_sources.push_back(source);
        {
            Bootstrapper bootstrapper(options);
            bootstrapper.start();
            CHECK(source->attach_count == 1);
        }
        CHECK(source->detach_count == 1);
    }

    TEST_CASE("State names") {
        CHECK(to_string(BootstrapperState::NotStarted) == "NotStarted");
        CHECK(to_string(BootstrapperState::Stopping) == "Stopping");
    }
}
