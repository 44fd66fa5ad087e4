#pragma once

#include <memory>

#include "services/navigation_page.h"
#include "ui/controls_style.h"

class InfoBarService;
class SettingsDB;

class SettingsViewModel : public NavigationPageViewModel {
public:
    static constexpr const char* THEME_KEY = "Appearance:Theme";

    SettingsViewModel(std::shared_ptr<SettingsDB> settings, std::shared_ptr<InfoBarService> info_bar);

    ApplicationTheme theme() const { return theme_; }
    void set_theme(ApplicationTheme theme);

    // Reads the persisted theme and applies it. Unknown values fall back to System.
    void apply_saved_theme();

    bool keep_page() const { return keep_page_; }
    void set_keep_page(bool keep) { keep_page_ = keep; }

    void on_disappearing(NavigatingCancelArgs& args) override;

private:
    std::shared_ptr<SettingsDB> settings_;
    std::shared_ptr<InfoBarService> info_bar_;
    ApplicationTheme theme_ = ApplicationTheme::System;
    bool keep_page_ = false;
};
