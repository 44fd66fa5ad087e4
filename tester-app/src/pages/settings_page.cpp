#include "pages/settings_page.h"

#include <vector>

namespace {
const std::vector<ApplicationTheme> THEMES = {
    ApplicationTheme::System,
    ApplicationTheme::Light,
    ApplicationTheme::Dark,
    ApplicationTheme::HighContrast
};

std::vector<Glib::ustring> theme_names() {
    std::vector<Glib::ustring> names;
    for (auto theme : THEMES) {
        names.push_back(to_string(theme));
    }
    return names;
}
}

SettingsPage::SettingsPage(std::shared_ptr<SettingsViewModel> view_model)
    : Gtk::Box(Gtk::Orientation::VERTICAL, 16)
    , view_model_(std::move(view_model))
    , theme_selector_(theme_names())
{
    set_margin(16);

    for (size_t i = 0; i < THEMES.size(); ++i) {
        if (THEMES[i] == view_model_->theme()) {
            theme_selector_.set_selected(static_cast<guint>(i));
        }
    }
    theme_selector_.property_selected().signal_changed().connect([this]() {
        guint selected = theme_selector_.get_selected();
        if (selected < THEMES.size()) {
            view_model_->set_theme(THEMES[selected]);
        }
    });

    appearance_box_.set_margin(8);
    appearance_box_.append(theme_label_);
    appearance_box_.append(theme_selector_);
    appearance_group_.set_content(appearance_box_);

    keep_page_check_.set_margin(8);
    keep_page_check_.signal_toggled().connect([this]() {
        view_model_->set_keep_page(keep_page_check_.get_active());
    });
    navigation_group_.set_content(keep_page_check_);

    append(appearance_group_);
    append(navigation_group_);
}
