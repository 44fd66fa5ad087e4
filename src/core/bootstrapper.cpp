#include "core/bootstrapper.h"

#include <iostream>

#include "core/errors.h"
#include "core/fault_channel.h"
#include "core/fault_source.h"

std::string to_string(BootstrapperState state) {
    switch (state) {
        case BootstrapperState::NotStarted: return "NotStarted";
        case BootstrapperState::Starting: return "Starting";
        case BootstrapperState::Started: return "Started";
        case BootstrapperState::Stopping: return "Stopping";
        case BootstrapperState::Stopped: return "Stopped";
    }
    return "Unknown";
}

Bootstrapper::Bootstrapper(BootstrapperOptions options)
    : options_(std::move(options))
    , fault_channel_(options_.fault_channel ? options_.fault_channel : std::make_shared<FaultChannel>())
{
}

Bootstrapper::~Bootstrapper() {
    dispose();
}

void Bootstrapper::start() {
    throw_if_disposed();

    if (state_ != BootstrapperState::NotStarted) {
        throw InvalidStateError("Cannot start bootstrapper in state: " + to_string(state_));
    }

    try {
        state_ = BootstrapperState::Starting;
        std::cout << "🔧 Bootstrapper: Starting..." << std::endl;
        signal_starting_.emit();

        if (options_.capture_unhandled_exceptions) {
            register_unhandled_exceptions();
        }

        auto builder = options_.host_builder_factory ? options_.host_builder_factory() : HostBuilder::create_default();
        builder.configure_app_configuration(options_.configure_app_configuration)
               .configure_services(options_.configure_services);

        host_ = builder.build();
        host_->start();

        if (options_.startup_hook) {
            options_.startup_hook(*this);
        }

        state_ = BootstrapperState::Started;
        std::cout << "✅ Bootstrapper started" << std::endl;
        signal_started_.emit();
    } catch (...) {
        state_ = BootstrapperState::NotStarted;
        std::cerr << "❌ Bootstrapper: start failed" << std::endl;
        raise_unhandled_exception(std::current_exception());
        throw;
    }
}

void Bootstrapper::stop() {
    throw_if_disposed();

    try {
        state_ = BootstrapperState::Stopping;
        std::cout << "🔧 Bootstrapper: Stopping..." << std::endl;
        signal_stopping_.emit();

        if (host_) {
            host_->stop();
        }

        state_ = BootstrapperState::Stopped;
        std::cout << "✅ Bootstrapper stopped" << std::endl;
        signal_stopped_.emit();
    } catch (...) {
        std::cerr << "❌ Bootstrapper: stop failed" << std::endl;
        raise_unhandled_exception(std::current_exception());
        dispose();
        throw;
    }

    dispose();
}

void Bootstrapper::dispose() {
    if (disposed_) {
        return;
    }

    unregister_unhandled_exceptions();
    host_.reset();
    disposed_ = true;
}

void Bootstrapper::raise_unhandled_exception(std::exception_ptr error) {
    fault_channel_->publish(error);
}

void Bootstrapper::register_unhandled_exceptions() {
    if (!attached_sources_.empty()) {
        return;
    }

    attached_sources_.push_back(std::make_shared<TerminateFaultSource>());
    for (const auto& source : options_.fault_sources) {
        if (source) {
            attached_sources_.push_back(source);
        }
    }
    for (const auto& source : attached_sources_) {
        source->attach(fault_channel_);
    }
}

void Bootstrapper::unregister_unhandled_exceptions() {
    for (auto it = attached_sources_.rbegin(); it != attached_sources_.rend(); ++it) {
        (*it)->detach();
    }
    attached_sources_.clear();
}

void Bootstrapper::throw_if_disposed() const {
    if (disposed_) {
        throw DisposedError("Bootstrapper");
    }
}
