#pragma once

#include <gtkmm.h>
#include <memory>

#include "core/progress.h"

// Progress bar and message bound to a Progress model.
class ProgressView : public Gtk::Box {
public:
    ProgressView();
    explicit ProgressView(std::shared_ptr<Progress> progress);
    ~ProgressView() override;

    void bind(std::shared_ptr<Progress> progress);
    const std::shared_ptr<Progress>& progress() const { return progress_; }

private:
    void refresh();
    bool on_pulse();

    std::shared_ptr<Progress> progress_;
    sigc::connection property_connection_;
    sigc::connection pulse_connection_;

    Gtk::Label message_label_;
    Gtk::ProgressBar progress_bar_;
};
