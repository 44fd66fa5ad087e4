#include "ui/content_slot.h"

#include "ui/visibility.h"

ContentSlot::ContentSlot()
    : Gtk::Box(Gtk::Orientation::VERTICAL)
{
    add_css_class("content-slot");
    set_visible(false);
}

ContentSlot::~ContentSlot() {
    if (content_) {
        remove(*content_);
    }
}

void ContentSlot::set_content(std::shared_ptr<Gtk::Widget> content) {
    if (content == content_) {
        return;
    }

    if (content_) {
        remove(*content_);
    }
    content_ = std::move(content);
    if (content_) {
        content_->set_hexpand(true);
        append(*content_);
    }
    apply_visibility(*this, NullToVisibility{}.convert(content_.get()));
}
