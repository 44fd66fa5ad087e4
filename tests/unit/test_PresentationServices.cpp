#include <doctest/doctest.h>

#include "core/errors.h"
#include "services/info_bar_service.h"
#include "services/overlay_service.h"
#include "services/ui_dispatcher.h"
#include "ui/info_bar.h"

#include <gtkmm.h>
#include <gtkmm/init.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <thread>
#include <vector>

namespace {
// Widgets need a display; the suite is skipped on headless runs.
bool gtk_available() {
    static const bool available = []() {
        if (!gtk_init_check()) {
            return false;
        }
        Gtk::init_gtkmm_internals();
        return true;
    }();
    return available;
}

struct RecordingWidgetHost : ContentHost<Gtk::Widget> {
    void set_content(std::shared_ptr<Gtk::Widget> content) override {
        threads.push_back(std::this_thread::get_id());
        current = std::move(content);
    }
    std::shared_ptr<Gtk::Widget> get_content() const override { return current; }

    std::shared_ptr<Gtk::Widget> current;
    std::vector<std::thread::id> threads;
};

template <typename Predicate>
bool pump_until(const Glib::RefPtr<Glib::MainContext>& context, Predicate predicate) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(1);
    while (!predicate()) {
        if (std::chrono::steady_clock::now() > deadline) {
            return false;
        }
        context->iteration(false);
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    return true;
}
}

TEST_SUITE("OverlayService") {
    TEST_CASE("Show without a host throws") {
        OverlayService overlay(std::make_shared<UiDispatcher>(Glib::MainContext::create()));
        CHECK_FALSE(overlay.has_overlay_host());
        CHECK_THROWS_AS(overlay.show(nullptr), InvalidStateError);
        CHECK_NOTHROW(overlay.hide());
    }

    TEST_CASE("Hide from a worker runs on the UI thread") {
        if (!gtk_available()) {
            MESSAGE("no display, skipped");
            return;
        }

        auto context = Glib::MainContext::get_default();
        auto dispatcher = std::make_shared<UiDispatcher>(context);
        auto host = std::make_shared<RecordingWidgetHost>();
        OverlayService overlay(dispatcher);
        overlay.set_overlay_host(host);

        overlay.show(std::make_shared<Gtk::Label>("busy"));
        CHECK(overlay.is_showing());

        std::atomic<bool> done{false};
        std::thread worker([&]() {
            overlay.hide();
            done = true;
        });
        CHECK(pump_until(context, [&]() { return done.load(); }));
        worker.join();

        CHECK_FALSE(overlay.is_showing());
        auto ui_thread = std::this_thread::get_id();
        for (const auto& id : host->threads) {
            CHECK(id == ui_thread);
        }
    }

    TEST_CASE("Showing replaces the overlay already shown") {
        if (!gtk_available()) {
            MESSAGE("no display, skipped");
            return;
        }

        auto host = std::make_shared<RecordingWidgetHost>();
        OverlayService overlay(std::make_shared<UiDispatcher>(Glib::MainContext::get_default()));
        overlay.set_overlay_host(host);

        overlay.show(std::make_shared<Gtk::Label>("first"));
        auto first = host->get_content();
        overlay.show(std::make_shared<Gtk::Label>("second"));
        CHECK(host->get_content() != first);
        CHECK(overlay.is_showing());

        overlay.hide();
        CHECK(host->get_content() == nullptr);
    }
}

TEST_SUITE("InfoBarService") {
    TEST_CASE("Closing the bar empties the slot") {
        if (!gtk_available()) {
            MESSAGE("no display, skipped");
            return;
        }

        auto host = std::make_shared<RecordingWidgetHost>();
        InfoBarService info_bar(std::make_shared<UiDispatcher>(Glib::MainContext::get_default()));
        info_bar.set_info_bar_host(host);

        info_bar.show(InfoBarSeverity::Warning, "Careful");
        auto shown = info_bar.current();
        REQUIRE(shown);
        CHECK(shown->severity() == InfoBarSeverity::Warning);

        shown->close();
        CHECK(host->get_content() == nullptr);
    }

    TEST_CASE("A bar closed after its service is gone still empties the slot") {
        if (!gtk_available()) {
            MESSAGE("no display, skipped");
            return;
        }

        auto host = std::make_shared<RecordingWidgetHost>();
        std::shared_ptr<InfoBar> shown;
        {
            InfoBarService info_bar(std::make_shared<UiDispatcher>(Glib::MainContext::get_default()));
            info_bar.set_info_bar_host(host);
            info_bar.show(InfoBarSeverity::Error, "Failed");
            shown = info_bar.current();
        }

        REQUIRE(shown);
        shown->close();
        CHECK(host->get_content() == nullptr);
    }

    TEST_CASE("Closing a replaced bar leaves the newer one") {
        if (!gtk_available()) {
            MESSAGE("no display, skipped");
            return;
        }

        auto host = std::make_shared<RecordingWidgetHost>();
        InfoBarService info_bar(std::make_shared<UiDispatcher>(Glib::MainContext::get_default()));
        info_bar.set_info_bar_host(host);

        info_bar.show(InfoBarSeverity::Informational, "old");
        auto old_bar = info_bar.current();
        info_bar.show(InfoBarSeverity::Success, "new");
        auto new_bar = info_bar.current();

        REQUIRE(old_bar);
        old_bar->close();
        CHECK(info_bar.current() == new_bar);
    }
}
