#pragma once

#include <gtkmm.h>
#include <string>

enum class InfoBarSeverity {
    Informational,
    Success,
    Warning,
    Error
};

std::string to_string(InfoBarSeverity severity);

class InfoBar : public Gtk::Box {
public:
    InfoBar(InfoBarSeverity severity, const std::string& message, bool is_closable = true);
    virtual ~InfoBar() = default;

    InfoBarSeverity severity() const { return severity_; }
    std::string message() const { return message_label_.get_text(); }
    bool is_open() const { return is_open_; }
    bool is_closable() const { return is_closable_; }

    void close();

    sigc::signal<void()>& signal_closed() { return signal_closed_; }

private:
    InfoBarSeverity severity_;
    bool is_closable_;
    bool is_open_ = true;

    Gtk::Image icon_;
    Gtk::Label message_label_;
    Gtk::Button close_button_;

    sigc::signal<void()> signal_closed_;
};
