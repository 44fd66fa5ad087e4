#pragma once

#include <sigc++/sigc++.h>
#include <exception>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "hosting/host.h"

class FaultChannel;
class FaultSource;

// NotStarted -> Starting -> Started -> Stopping -> Stopped.
// A failed start goes back from Starting to NotStarted.
enum class BootstrapperState {
    NotStarted,
    Starting,
    Started,
    Stopping,
    Stopped
};

std::string to_string(BootstrapperState state);

class Bootstrapper;

struct BootstrapperOptions {
    bool capture_unhandled_exceptions = true;

    // Extension points, called at fixed points of start(). Empty means no-op.
    HostBuilder::ConfigureAppConfiguration configure_app_configuration;
    HostBuilder::ConfigureServices configure_services;
    std::function<void(Bootstrapper&)> startup_hook;

    // Defaults to HostBuilder::create_default().
    std::function<HostBuilder()> host_builder_factory;

    // Attached on start when capture_unhandled_exceptions is set, in addition
    // to a TerminateFaultSource.
    std::vector<std::shared_ptr<FaultSource>> fault_sources;

    // Created when empty.
    std::shared_ptr<FaultChannel> fault_channel;
};

// Drives application startup and shutdown through a single non-reentrant state
// machine. Lifecycle faults are published on the fault channel and rethrown to
// the caller. Not thread safe: start/stop/dispose belong to one thread.
class Bootstrapper {
public:
    explicit Bootstrapper(BootstrapperOptions options = {});
    virtual ~Bootstrapper();

    Bootstrapper(const Bootstrapper&) = delete;
    Bootstrapper& operator=(const Bootstrapper&) = delete;

    void start();
    void stop();
    void dispose();

    BootstrapperState state() const { return state_; }
    bool is_disposed() const { return disposed_; }

    // Null before start() and after dispose().
    Host* host() { return host_.get(); }

    const std::shared_ptr<FaultChannel>& fault_channel() const { return fault_channel_; }

    sigc::signal<void()>& signal_starting() { return signal_starting_; }
    sigc::signal<void()>& signal_started() { return signal_started_; }
    sigc::signal<void()>& signal_stopping() { return signal_stopping_; }
    sigc::signal<void()>& signal_stopped() { return signal_stopped_; }

    void raise_unhandled_exception(std::exception_ptr error);

private:
    void register_unhandled_exceptions();
    void unregister_unhandled_exceptions();
    void throw_if_disposed() const;

    BootstrapperOptions options_;
    std::shared_ptr<FaultChannel> fault_channel_;
    std::vector<std::shared_ptr<FaultSource>> attached_sources_;
    std::unique_ptr<Host> host_;
    BootstrapperState state_ = BootstrapperState::NotStarted;
    bool disposed_ = false;

    sigc::signal<void()> signal_starting_;
    sigc::signal<void()> signal_started_;
    sigc::signal<void()> signal_stopping_;
    sigc::signal<void()> signal_stopped_;
};
