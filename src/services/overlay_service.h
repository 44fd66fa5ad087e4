#pragma once

#include <gtkmm.h>
#include <memory>

#include "services/content_host.h"
#include "services/slot_presenter.h"

class OverlayPresenter;

// Shows one modal-looking overlay at a time over the host slot. show() and
// hide() may be called from any thread; the work runs on the UI thread.
class OverlayService {
public:
    explicit OverlayService(std::shared_ptr<UiDispatcher> dispatcher);

    void set_overlay_host(std::shared_ptr<ContentHost<Gtk::Widget>> host);
    bool has_overlay_host() const { return slot_.has_host(); }

    // Replaces any overlay already shown.
    void show(std::shared_ptr<Gtk::Widget> content);
    void hide();

    bool is_showing() const { return static_cast<bool>(slot_.current()); }

private:
    void hide_on_ui_thread();

    SlotPresenter<Gtk::Widget> slot_;
    std::shared_ptr<OverlayPresenter> presenter_;
};
