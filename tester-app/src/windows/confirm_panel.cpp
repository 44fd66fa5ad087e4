#include "windows/confirm_panel.h"

ConfirmPanel::ConfirmPanel(const std::string& title, const std::string& message)
    : Gtk::Box(Gtk::Orientation::VERTICAL, 12)
{
    set_margin(12);

    title_label_.set_text(title);
    title_label_.add_css_class("title-3");
    title_label_.set_xalign(0.0f);

    message_label_.set_text(message);
    message_label_.set_wrap(true);
    message_label_.set_xalign(0.0f);

    yes_button_.add_css_class("suggested-action");
    yes_button_.signal_clicked().connect([this]() { signal_response_.emit(true); });
    no_button_.signal_clicked().connect([this]() { signal_response_.emit(false); });

    buttons_.set_halign(Gtk::Align::END);
    buttons_.append(no_button_);
    buttons_.append(yes_button_);

    append(title_label_);
    append(message_label_);
    append(buttons_);
}
