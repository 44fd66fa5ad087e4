#include "services/navigation_page_service.h"

#include "ui/navigation_view.h"

void NavigationPageService::register_navigation_events(NavigationView& view) {
    unregister_navigation_events(view);

    Connections connections;
    connections.navigating = view.signal_navigating().connect(
        sigc::mem_fun(*this, &NavigationPageService::on_navigating));
    connections.navigated = view.signal_navigated().connect(
        sigc::mem_fun(*this, &NavigationPageService::on_navigated));
    connections_[&view] = connections;
}

void NavigationPageService::unregister_navigation_events(NavigationView& view) {
    auto it = connections_.find(&view);
    if (it == connections_.end()) {
        return;
    }
    it->second.navigating.disconnect();
    it->second.navigated.disconnect();
    connections_.erase(it);
}

void NavigationPageService::on_navigating(NavigatingCancelArgs& args) {
    if (current_page_) {
        current_page_->view_model().on_disappearing(args);
    }
}

void NavigationPageService::on_navigated(NavigationPage* page) {
    current_page_ = page;
    if (current_page_) {
        current_page_->view_model().on_appeared();
    }
}
