#pragma once

#include <gtkmm.h>
#include <memory>

#include "services/content_host.h"

// Single-child container the overlay and info bar services present into.
// Hidden while empty so it does not intercept input when stacked in an overlay.
class ContentSlot : public Gtk::Box, public ContentHost<Gtk::Widget> {
public:
    ContentSlot();
    ~ContentSlot() override;

    void set_content(std::shared_ptr<Gtk::Widget> content) override;
    std::shared_ptr<Gtk::Widget> get_content() const override { return content_; }

private:
    std::shared_ptr<Gtk::Widget> content_;
};
