#pragma once

#include <gtkmm.h>
#include <memory>

#include "pages/home_view_model.h"
#include "services/navigation_page.h"
#include "ui/editors/data_editor.h"
#include "ui/editors/numeric_editors.h"
#include "ui/editors/path_editor.h"
#include "ui/editors/text_editor.h"
#include "ui/group_box.h"

class HomePage : public Gtk::ScrolledWindow, public NavigationPage {
public:
    explicit HomePage(std::shared_ptr<HomeViewModel> view_model);
    virtual ~HomePage() = default;

    NavigationPageViewModel& view_model() override { return *view_model_; }

private:
    void build_editors();
    void build_feedback();
    void on_validate();
    void on_show_info_bar();

    std::shared_ptr<HomeViewModel> view_model_;

    Gtk::Box content_{Gtk::Orientation::VERTICAL, 16};

    GroupBox editors_group_{"Editors"};
    Gtk::Box editors_box_{Gtk::Orientation::VERTICAL, 8};
    TextEditor name_editor_;
    DoubleEditor length_editor_;
    IntEditor count_editor_;
    UShortEditor port_editor_;
    FloatEditor scale_editor_;
    ShortEditor offset_editor_;
    UIntEditor retries_editor_;
    LongEditor ticks_editor_;
    ULongEditor size_editor_;
    DataEditor data_editor_;
    FileEditor file_editor_;
    FolderEditor folder_editor_;

    GroupBox feedback_group_{"Feedback"};
    Gtk::Box feedback_box_{Gtk::Orientation::VERTICAL, 8};
    Gtk::Box info_bar_row_{Gtk::Orientation::HORIZONTAL, 8};
    Gtk::DropDown severity_selector_;
    Gtk::Entry info_message_entry_;
    Gtk::Button show_info_bar_button_{"Show info bar"};
    Gtk::Button validate_button_{"Validate"};
    Gtk::Button progress_button_{"Run long operation"};
};
