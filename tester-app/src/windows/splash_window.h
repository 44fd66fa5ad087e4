#pragma once

#include <gtkmm.h>
#include <memory>

#include "core/progress.h"
#include "ui/progress_view.h"

class SplashWindow : public Gtk::Window {
public:
    explicit SplashWindow(std::shared_ptr<Progress> progress);
    virtual ~SplashWindow() = default;

private:
    Gtk::Box content_{Gtk::Orientation::VERTICAL, 16};
    Gtk::Label title_label_{"Cobalt Tester"};
    ProgressView progress_view_;
};
