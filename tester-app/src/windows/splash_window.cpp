#include "windows/splash_window.h"

SplashWindow::SplashWindow(std::shared_ptr<Progress> progress)
    : progress_view_(std::move(progress))
{
    set_title("Cobalt Tester");
    set_default_size(420, 200);
    set_decorated(false);
    set_resizable(false);

    title_label_.add_css_class("title-1");
    content_.set_margin(32);
    content_.set_valign(Gtk::Align::CENTER);
    content_.append(title_label_);
    content_.append(progress_view_);
    set_child(content_);
}
