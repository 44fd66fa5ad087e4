#include "ui/info_bar.h"

namespace {
const char* icon_for(InfoBarSeverity severity) {
    switch (severity) {
        case InfoBarSeverity::Informational: return "dialog-information-symbolic";
        case InfoBarSeverity::Success: return "emblem-ok-symbolic";
        case InfoBarSeverity::Warning: return "dialog-warning-symbolic";
        case InfoBarSeverity::Error: return "dialog-error-symbolic";
    }
    return "dialog-information-symbolic";
}
}

std::string to_string(InfoBarSeverity severity) {
    switch (severity) {
        case InfoBarSeverity::Informational: return "informational";
        case InfoBarSeverity::Success: return "success";
        case InfoBarSeverity::Warning: return "warning";
        case InfoBarSeverity::Error: return "error";
    }
    return "informational";
}

InfoBar::InfoBar(InfoBarSeverity severity, const std::string& message, bool is_closable)
    : Gtk::Box(Gtk::Orientation::HORIZONTAL)
    , severity_(severity)
    , is_closable_(is_closable)
{
    add_css_class("info-bar");
    add_css_class("info-bar-" + to_string(severity));
    set_spacing(10);

    icon_.set_from_icon_name(icon_for(severity));
    message_label_.set_text(message);
    message_label_.set_hexpand(true);
    message_label_.set_xalign(0.0f);
    message_label_.set_wrap(true);

    close_button_.set_icon_name("window-close-symbolic");
    close_button_.set_tooltip_text("Close");
    close_button_.add_css_class("flat");
    close_button_.set_visible(is_closable);
    close_button_.signal_clicked().connect(sigc::mem_fun(*this, &InfoBar::close));

    append(icon_);
    append(message_label_);
    append(close_button_);
}

void InfoBar::close() {
    if (!is_open_) {
        return;
    }
    is_open_ = false;
    set_visible(false);
    signal_closed_.emit();
}
