#pragma once

#include <string>

struct NavigatingCancelArgs {
    std::string target_page;
    bool cancel = false;
};

class NavigationPageViewModel {
public:
    virtual ~NavigationPageViewModel() = default;

    virtual void on_appeared() {}
    virtual void on_disappearing(NavigatingCancelArgs& args) { (void)args; }
};

// Implemented by pages whose view model wants navigation lifecycle callbacks.
class NavigationPage {
public:
    virtual ~NavigationPage() = default;

    virtual NavigationPageViewModel& view_model() = 0;
};
