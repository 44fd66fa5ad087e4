#pragma once

#include <gtkmm.h>
#include <memory>
#include <string>

#include "services/content_host.h"
#include "services/slot_presenter.h"
#include "ui/info_bar.h"

class InfoBarService {
public:
    explicit InfoBarService(std::shared_ptr<UiDispatcher> dispatcher);

    void set_info_bar_host(std::shared_ptr<ContentHost<Gtk::Widget>> host);

    void show(InfoBarSeverity severity, const std::string& message, bool is_closable = true);
    void hide();

    std::shared_ptr<InfoBar> current() const;

private:
    SlotPresenter<Gtk::Widget> slot_;
};
