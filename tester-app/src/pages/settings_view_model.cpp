#include "pages/settings_view_model.h"

#include <iostream>

#include "database/settings_db.h"
#include "services/info_bar_service.h"

SettingsViewModel::SettingsViewModel(std::shared_ptr<SettingsDB> settings, std::shared_ptr<InfoBarService> info_bar)
    : settings_(std::move(settings))
    , info_bar_(std::move(info_bar)) {}

void SettingsViewModel::set_theme(ApplicationTheme theme) {
    if (theme == theme_) {
        return;
    }
    theme_ = theme;
    apply_application_theme(theme_);

    if (!settings_->set(THEME_KEY, to_string(theme_))) {
        std::cerr << "⚠️  Could not persist theme" << std::endl;
        info_bar_->show(InfoBarSeverity::Warning, "The theme could not be saved.");
    }
}

void SettingsViewModel::apply_saved_theme() {
    auto saved = settings_->get(THEME_KEY);
    if (saved) {
        auto parsed = parse_application_theme(*saved);
        if (parsed) {
            theme_ = *parsed;
        } else {
            std::cerr << "⚠️  Unknown theme in settings: " << *saved << std::endl;
        }
    }
    apply_application_theme(theme_);
    std::cout << "✅ Theme applied: " << to_string(theme_) << std::endl;
}

void SettingsViewModel::on_disappearing(NavigatingCancelArgs& args) {
    if (!keep_page_) {
        return;
    }
    args.cancel = true;
    info_bar_->show(InfoBarSeverity::Warning, "Uncheck \"Stay on this page\" to leave the settings.");
}
