#include <doctest/doctest.h>

#include "services/navigation_page_service.h"

#include <string>
#include <vector>

namespace {
struct RecordingViewModel : NavigationPageViewModel {
    RecordingViewModel(std::vector<std::string>& log, std::string name, bool block = false)
        : log(log), name(std::move(name)), block(block) {}

    void on_appeared() override { log.push_back(name + ".appeared"); }
    void on_disappearing(NavigatingCancelArgs& args) override {
        log.push_back(name + ".disappearing->" + args.target_page);
        args.cancel = block;
    }

    std::vector<std::string>& log;
    std::string name;
    bool block;
};

struct FakePage : NavigationPage {
    explicit FakePage(RecordingViewModel& model) : model(model) {}
    NavigationPageViewModel& view_model() override { return model; }
    RecordingViewModel& model;
};
}

TEST_SUITE("NavigationPageService") {
    TEST_CASE("Navigation notifies the leaving and the arriving page") {
        std::vector<std::string> log;
        RecordingViewModel home_model(log, "home");
        RecordingViewModel settings_model(log, "settings");
        FakePage home(home_model);
        FakePage settings(settings_model);
        NavigationPageService service;

        NavigatingCancelArgs first{"home"};
        service.on_navigating(first);
        service.on_navigated(&home);
        CHECK(service.current_page() == &home);

        NavigatingCancelArgs second{"settings"};
        service.on_navigating(second);
        CHECK_FALSE(second.cancel);
        service.on_navigated(&settings);

        std::vector<std::string> expected{"home.appeared", "home.disappearing->settings", "settings.appeared"};
        CHECK(log == expected);
    }

    TEST_CASE("The current page can cancel navigation") {
        std::vector<std::string> log;
        RecordingViewModel blocking_model(log, "form", true);
        FakePage form(blocking_model);
        NavigationPageService service;
        service.on_navigated(&form);

        NavigatingCancelArgs args{"elsewhere"};
        service.on_navigating(args);
        CHECK(args.cancel);
        CHECK(service.current_page() == &form);
    }

    TEST_CASE("Pages without view model callbacks are tolerated") {
        NavigationPageService service;
        service.on_navigated(nullptr);
        NavigatingCancelArgs args{"any"};
        CHECK_NOTHROW(service.on_navigating(args));
        CHECK(service.current_page() == nullptr);
    }
}
