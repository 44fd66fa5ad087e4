#pragma once

#include <memory>
#include <string>

#include "core/fault_channel.h"
#include "ui/gtk_bootstrapper.h"

class MessageCollector;

class AppBootstrapper {
public:
    AppBootstrapper();
    ~AppBootstrapper();

    int run(int argc, char* argv[]);

private:
    GtkBootstrapperOptions make_options();
    void on_fault(std::exception_ptr error);

    static std::string default_settings_path();
    static void configure_services(const Configuration& configuration, ServiceCollection& services);
    static void load_data(ProgressReporter& progress);

    std::shared_ptr<FaultChannel> faults_;
    std::shared_ptr<MessageCollector> messages_;
    FaultChannel::Subscription fault_subscription_;
    std::unique_ptr<GtkBootstrapper> bootstrapper_;
};
