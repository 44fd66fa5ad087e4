#pragma once

#include <gtkmm.h>
#include <memory>

#include "ui/content_slot.h"
#include "ui/navigation_view.h"

class GtkBootstrapper;
class HomePage;
class InfoBarService;
class NavigationPageService;
class OverlayService;
class SettingsPage;
class UiDispatcher;

class MainWindow : public Gtk::Window {
public:
    struct Dependencies {
        std::shared_ptr<GtkBootstrapper> bootstrapper;
        std::shared_ptr<UiDispatcher> dispatcher;
        std::shared_ptr<NavigationPageService> navigation;
        std::shared_ptr<OverlayService> overlay;
        std::shared_ptr<InfoBarService> info_bar;
        std::shared_ptr<HomePage> home_page;
        std::shared_ptr<SettingsPage> settings_page;
    };

    explicit MainWindow(Dependencies deps);
    ~MainWindow() override;

protected:
    bool on_close_request_confirm();
    void on_close_confirmed(bool confirmed);

private:
    // Holds the pages, so it comes before the navigation view.
    Dependencies deps_;
    bool confirming_close_ = false;

    Gtk::Overlay overlay_;
    Gtk::Box root_{Gtk::Orientation::VERTICAL};
    std::shared_ptr<ContentSlot> info_bar_slot_;
    std::shared_ptr<ContentSlot> overlay_slot_;
    NavigationView navigation_view_;
};
