#include "ui/overlay_presenter.h"

OverlayPresenter::OverlayPresenter()
    : Gtk::Box(Gtk::Orientation::VERTICAL)
{
    add_css_class("overlay-presenter");
    set_hexpand(true);
    set_vexpand(true);

    card_.add_css_class("overlay-card");
    card_.set_halign(Gtk::Align::CENTER);
    card_.set_valign(Gtk::Align::CENTER);
    card_.set_vexpand(true);
    append(card_);

    // Swallow clicks so nothing underneath the overlay reacts.
    auto click = Gtk::GestureClick::create();
    auto* gesture = click.get();
    click->signal_pressed().connect([gesture](int, double, double) {
        gesture->set_state(Gtk::EventSequenceState::CLAIMED);
    });
    add_controller(click);
}

OverlayPresenter::~OverlayPresenter() {
    if (content_) {
        card_.remove(*content_);
    }
}

void OverlayPresenter::set_content(std::shared_ptr<Gtk::Widget> content) {
    if (content == content_) {
        return;
    }
    if (content_) {
        card_.remove(*content_);
    }
    content_ = std::move(content);
    if (content_) {
        card_.append(*content_);
    }
}
