#pragma once

#include <sigc++/sigc++.h>
#include <map>

#include "services/navigation_page.h"

class NavigationView;

// Forwards navigation events of a NavigationView to the view models of the
// pages involved.
class NavigationPageService {
public:
    void register_navigation_events(NavigationView& view);
    void unregister_navigation_events(NavigationView& view);

    void on_navigating(NavigatingCancelArgs& args);
    void on_navigated(NavigationPage* page);

    NavigationPage* current_page() const { return current_page_; }

private:
    struct Connections {
        sigc::connection navigating;
        sigc::connection navigated;
    };

    NavigationPage* current_page_ = nullptr;
    std::map<NavigationView*, Connections> connections_;
};
