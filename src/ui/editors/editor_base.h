#pragma once

#include <gtkmm.h>
#include <optional>
#include <string>

// Common chrome of every editor: title, entry, suffix, extra buttons and the
// clear/copy buttons. Typed behaviour lives in Editor<T>.
class EditorBase : public Gtk::Box {
public:
    EditorBase();
    virtual ~EditorBase() = default;

    void set_title(const std::string& title);
    std::string get_title() const { return title_label_.get_text(); }

    void set_suffix(const std::string& suffix);
    void set_placeholder(const std::string& placeholder);
    void set_read_only(bool read_only);
    bool is_read_only() const { return read_only_; }

    void set_show_clear_button(bool show) { clear_button_.set_visible(show); }
    void set_show_copy_button(bool show) { copy_button_.set_visible(show); }

    // Extra buttons go between the entry and the clear/copy buttons.
    void add_button(Gtk::Widget& button);

    std::string get_entry_text() const { return entry_.get_text(); }
    Gtk::Entry& entry() { return entry_; }

protected:
    virtual void on_entry_text_changed(const std::string& text) = 0;
    virtual void on_focus_lost() = 0;
    virtual void clear_editor() = 0;

    // Programmatic update that does not feed back into on_entry_text_changed.
    void set_entry_text(const std::string& text);
    void show_error(const std::optional<std::string>& error);

private:
    void copy_to_clipboard();

    Gtk::Label title_label_;
    Gtk::Box row_{Gtk::Orientation::HORIZONTAL, 4};
    Gtk::Entry entry_;
    Gtk::Label suffix_label_;
    Gtk::Box buttons_{Gtk::Orientation::HORIZONTAL, 2};
    Gtk::Button clear_button_;
    Gtk::Button copy_button_;

    bool read_only_ = false;
    bool updating_entry_ = false;
};
