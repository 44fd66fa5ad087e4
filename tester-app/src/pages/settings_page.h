#pragma once

#include <gtkmm.h>
#include <memory>

#include "pages/settings_view_model.h"
#include "services/navigation_page.h"
#include "ui/group_box.h"

class SettingsPage : public Gtk::Box, public NavigationPage {
public:
    explicit SettingsPage(std::shared_ptr<SettingsViewModel> view_model);
    virtual ~SettingsPage() = default;

    NavigationPageViewModel& view_model() override { return *view_model_; }

private:
    std::shared_ptr<SettingsViewModel> view_model_;

    GroupBox appearance_group_{"Appearance"};
    Gtk::Box appearance_box_{Gtk::Orientation::HORIZONTAL, 8};
    Gtk::Label theme_label_{"Theme"};
    Gtk::DropDown theme_selector_;

    GroupBox navigation_group_{"Navigation"};
    Gtk::CheckButton keep_page_check_{"Stay on this page"};
};
