#include "services/info_bar_service.h"

#include <iostream>

InfoBarService::InfoBarService(std::shared_ptr<UiDispatcher> dispatcher)
    : slot_(std::move(dispatcher), "info bar") {}

void InfoBarService::set_info_bar_host(std::shared_ptr<ContentHost<Gtk::Widget>> host) {
    slot_.set_host(std::move(host));
}

void InfoBarService::show(InfoBarSeverity severity, const std::string& message, bool is_closable) {
    slot_.ensure_host();

    std::shared_ptr<InfoBar> info_bar;
    std::weak_ptr<ContentHost<Gtk::Widget>> weak_host = slot_.host();
    slot_.dispatcher()->invoke([&]() {
        info_bar = std::make_shared<InfoBar>(severity, message, is_closable);

        // Closing from the bar itself empties the slot, unless it was replaced.
        // Holds no reference to the service, which the host may outlive.
        std::weak_ptr<InfoBar> weak = info_bar;
        info_bar->signal_closed().connect([weak_host, weak]() {
            auto host = weak_host.lock();
            auto closed = weak.lock();
            if (host && closed && host->get_content() == closed) {
                host->set_content(nullptr);
            }
        });
    });

    std::cout << "🔧 InfoBar [" << to_string(severity) << "]: " << message << std::endl;
    slot_.show(info_bar);
}

void InfoBarService::hide() {
    slot_.hide();
}

std::shared_ptr<InfoBar> InfoBarService::current() const {
    return std::dynamic_pointer_cast<InfoBar>(slot_.current());
}
