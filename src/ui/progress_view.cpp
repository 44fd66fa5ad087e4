#include "ui/progress_view.h"

#include <algorithm>

#include "ui/visibility.h"

ProgressView::ProgressView()
    : Gtk::Box(Gtk::Orientation::VERTICAL)
{
    add_css_class("progress-view");
    set_spacing(8);

    message_label_.set_xalign(0.0f);
    message_label_.set_ellipsize(Pango::EllipsizeMode::END);
    progress_bar_.set_hexpand(true);

    append(message_label_);
    append(progress_bar_);
}

ProgressView::ProgressView(std::shared_ptr<Progress> progress) : ProgressView() {
    bind(std::move(progress));
}

ProgressView::~ProgressView() {
    property_connection_.disconnect();
    pulse_connection_.disconnect();
}

void ProgressView::bind(std::shared_ptr<Progress> progress) {
    property_connection_.disconnect();
    progress_ = std::move(progress);
    if (progress_) {
        property_connection_ = progress_->signal_property_changed().connect(
            [this](const std::string&) { refresh(); });
    }
    refresh();
}

void ProgressView::refresh() {
    if (!progress_) {
        message_label_.set_text("");
        progress_bar_.set_fraction(0.0);
        pulse_connection_.disconnect();
        return;
    }

    message_label_.set_text(progress_->message());
    apply_visibility(message_label_, *BoolToVisibility{}.convert(!progress_->message().empty()));

    if (progress_->is_indeterminate()) {
        if (!pulse_connection_.connected()) {
            pulse_connection_ = Glib::signal_timeout().connect(
                sigc::mem_fun(*this, &ProgressView::on_pulse), 100);
        }
        return;
    }

    pulse_connection_.disconnect();
    progress_bar_.set_fraction(std::clamp(progress_->value() / 100.0, 0.0, 1.0));
}

bool ProgressView::on_pulse() {
    progress_bar_.pulse();
    return true;
}
