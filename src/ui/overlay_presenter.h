#pragma once

#include <gtkmm.h>
#include <memory>

// Dimmed full-size layer centering a single piece of overlay content.
class OverlayPresenter : public Gtk::Box {
public:
    OverlayPresenter();
    ~OverlayPresenter() override;

    void set_content(std::shared_ptr<Gtk::Widget> content);
    std::shared_ptr<Gtk::Widget> get_content() const { return content_; }

private:
    Gtk::Box card_{Gtk::Orientation::VERTICAL};
    std::shared_ptr<Gtk::Widget> content_;
};
