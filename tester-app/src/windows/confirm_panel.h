#pragma once

#include <gtkmm.h>
#include <string>

// Yes/No question shown through the overlay service.
class ConfirmPanel : public Gtk::Box {
public:
    ConfirmPanel(const std::string& title, const std::string& message);
    virtual ~ConfirmPanel() = default;

    // true for Yes.
    sigc::signal<void(bool)>& signal_response() { return signal_response_; }

private:
    Gtk::Label title_label_;
    Gtk::Label message_label_;
    Gtk::Box buttons_{Gtk::Orientation::HORIZONTAL, 8};
    Gtk::Button yes_button_{"_Yes", true};
    Gtk::Button no_button_{"_No", true};

    sigc::signal<void(bool)> signal_response_;
};
