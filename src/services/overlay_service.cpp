#include "services/overlay_service.h"

#include "ui/overlay_presenter.h"

OverlayService::OverlayService(std::shared_ptr<UiDispatcher> dispatcher)
    : slot_(std::move(dispatcher), "overlay") {}

void OverlayService::set_overlay_host(std::shared_ptr<ContentHost<Gtk::Widget>> host) {
    slot_.set_host(std::move(host));
}

void OverlayService::show(std::shared_ptr<Gtk::Widget> content) {
    slot_.ensure_host();

    // The presenter is only touched on the UI thread, whichever thread calls.
    slot_.dispatcher()->invoke([this, content]() {
        hide_on_ui_thread();

        auto presenter = std::make_shared<OverlayPresenter>();
        presenter->set_content(content);
        presenter_ = presenter;
        slot_.show(presenter);
    });
}

void OverlayService::hide() {
    if (!slot_.has_host()) {
        return;
    }

    slot_.dispatcher()->invoke([this]() { hide_on_ui_thread(); });
}

void OverlayService::hide_on_ui_thread() {
    auto presenter = std::move(presenter_);
    presenter_.reset();
    if (presenter) {
        presenter->set_content(nullptr);
    }
    slot_.hide();
}
