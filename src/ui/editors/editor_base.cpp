#include "ui/editors/editor_base.h"

#include <iostream>

EditorBase::EditorBase()
    : Gtk::Box(Gtk::Orientation::VERTICAL, 2)
{
    add_css_class("editor");

    title_label_.set_xalign(0.0f);
    title_label_.add_css_class("editor-title");
    title_label_.set_visible(false);
    append(title_label_);

    entry_.set_hexpand(true);
    entry_.signal_changed().connect([this]() {
        if (!updating_entry_) {
            on_entry_text_changed(entry_.get_text());
        }
    });
    entry_.signal_activate().connect([this]() {
        on_focus_lost();
    });

    auto focus = Gtk::EventControllerFocus::create();
    focus->signal_enter().connect([this]() {
        // Select everything once the click that focused the entry is done.
        Glib::signal_idle().connect_once([this]() {
            entry_.select_region(0, -1);
        });
    });
    focus->signal_leave().connect([this]() {
        on_focus_lost();
    });
    entry_.add_controller(focus);

    suffix_label_.add_css_class("dim-label");
    suffix_label_.set_visible(false);

    clear_button_.set_icon_name("edit-clear-symbolic");
    clear_button_.set_tooltip_text("Clear");
    clear_button_.add_css_class("flat");
    clear_button_.signal_clicked().connect([this]() {
        if (!read_only_) {
            clear_editor();
        }
    });

    copy_button_.set_icon_name("edit-copy-symbolic");
    copy_button_.set_tooltip_text("Copy");
    copy_button_.add_css_class("flat");
    copy_button_.signal_clicked().connect(sigc::mem_fun(*this, &EditorBase::copy_to_clipboard));

    row_.append(entry_);
    row_.append(suffix_label_);
    row_.append(buttons_);
    row_.append(clear_button_);
    row_.append(copy_button_);
    append(row_);
}

void EditorBase::set_title(const std::string& title) {
    title_label_.set_text(title);
    title_label_.set_visible(!title.empty());
}

void EditorBase::set_suffix(const std::string& suffix) {
    suffix_label_.set_text(suffix);
    suffix_label_.set_visible(!suffix.empty());
}

void EditorBase::set_placeholder(const std::string& placeholder) {
    entry_.set_placeholder_text(placeholder);
}

void EditorBase::set_read_only(bool read_only) {
    read_only_ = read_only;
    entry_.set_editable(!read_only);
    clear_button_.set_sensitive(!read_only);
}

void EditorBase::add_button(Gtk::Widget& button) {
    buttons_.append(button);
}

void EditorBase::set_entry_text(const std::string& text) {
    if (entry_.get_text() == text) {
        return;
    }
    updating_entry_ = true;
    entry_.set_text(text);
    updating_entry_ = false;
}

void EditorBase::show_error(const std::optional<std::string>& error) {
    if (error) {
        entry_.add_css_class("error");
        entry_.set_tooltip_text(*error);
    } else {
        entry_.remove_css_class("error");
        entry_.set_tooltip_text("");
    }
}

void EditorBase::copy_to_clipboard() {
    auto clipboard = get_clipboard();
    if (!clipboard) {
        std::cerr << "⚠️  Editor: no clipboard available" << std::endl;
        return;
    }
    clipboard->set_text(entry_.get_text());
}
