#include "windows/main_window.h"

#include <iostream>

#include "core/errors.h"
#include "pages/home_page.h"
#include "pages/settings_page.h"
#include "services/info_bar_service.h"
#include "services/navigation_page_service.h"
#include "services/overlay_service.h"
#include "services/ui_dispatcher.h"
#include "ui/gtk_bootstrapper.h"
#include "windows/confirm_panel.h"

MainWindow::MainWindow(Dependencies deps)
    : deps_(std::move(deps))
    , info_bar_slot_(std::make_shared<ContentSlot>())
    , overlay_slot_(std::make_shared<ContentSlot>())
{
    set_title("Cobalt Tester");
    set_default_size(960, 680);

    navigation_view_.set_vexpand(true);
    navigation_view_.add_item("home", "Home", "go-home-symbolic", *deps_.home_page);
    navigation_view_.add_footer_item("settings", "Settings", "emblem-system-symbolic", *deps_.settings_page);

    root_.append(*info_bar_slot_);
    root_.append(navigation_view_);
    overlay_.set_child(root_);
    overlay_.add_overlay(*overlay_slot_);
    set_child(overlay_);

    deps_.info_bar->set_info_bar_host(info_bar_slot_);
    deps_.overlay->set_overlay_host(overlay_slot_);
    deps_.navigation->register_navigation_events(navigation_view_);
    navigation_view_.navigate("home");

    signal_close_request().connect(sigc::mem_fun(*this, &MainWindow::on_close_request_confirm), false);
}

MainWindow::~MainWindow() {
    deps_.navigation->unregister_navigation_events(navigation_view_);
    overlay_slot_->set_content(nullptr);
    info_bar_slot_->set_content(nullptr);
    overlay_.remove_overlay(*overlay_slot_);
    root_.remove(*info_bar_slot_);
}

bool MainWindow::on_close_request_confirm() {
    auto state = deps_.bootstrapper->state();
    if (deps_.bootstrapper->core().is_disposed()
        || state == BootstrapperState::Stopping
        || state == BootstrapperState::Stopped) {
        return false;
    }
    if (confirming_close_) {
        return true;
    }

    confirming_close_ = true;
    auto panel = std::make_shared<ConfirmPanel>("Close application", "Do you really want to close the application?");
    panel->signal_response().connect([this](bool confirmed) {
        // The panel goes away with the overlay, so leave its signal first.
        deps_.dispatcher->post([this, confirmed]() {
            on_close_confirmed(confirmed);
        });
    });
    deps_.overlay->show(panel);
    return true;
}

void MainWindow::on_close_confirmed(bool confirmed) {
    deps_.overlay->hide();
    confirming_close_ = false;
    if (!confirmed) {
        return;
    }

    std::cout << "🔧 Close confirmed, shutting down..." << std::endl;
    auto bootstrapper = deps_.bootstrapper;
    bootstrapper->stop();
}
