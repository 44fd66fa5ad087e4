#pragma once

#include <gtkmm.h>
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "core/bootstrapper.h"
#include "core/progress.h"

class GtkBootstrapper;
class UiDispatcher;

struct GtkBootstrapperOptions {
    BootstrapperOptions core;
    std::string application_id = "org.cobalt.Application";

    std::function<std::shared_ptr<Gtk::Window>(Host&)> main_window_factory;

    bool show_splash_screen = false;
    std::chrono::milliseconds splash_screen_duration{2000};
    std::function<std::shared_ptr<Gtk::Window>(Host&, std::shared_ptr<Progress>)> splash_screen_window_factory;
    std::function<std::shared_ptr<Progress>()> splash_screen_progress_factory;
    // Runs on a worker thread while the splash screen is up. An exception it
    // throws is published on the fault channel, and the splash screen still
    // closes and the main window still opens once the minimum duration passed.
    std::function<void(ProgressReporter&)> splash_screen_action;

    std::function<void(GtkBootstrapper&)> set_theme;
};

// Bootstrapper bound to a Gtk::Application. The services UiDispatcher,
// BackgroundTasks, FaultChannel, Gtk::Application and GtkBootstrapper are
// registered before the application's own services.
class GtkBootstrapper {
public:
    explicit GtkBootstrapper(GtkBootstrapperOptions options);
    virtual ~GtkBootstrapper();

    GtkBootstrapper(const GtkBootstrapper&) = delete;
    GtkBootstrapper& operator=(const GtkBootstrapper&) = delete;

    // Runs the application until it quits. Arguments after argv[0] feed the
    // configuration. Returns 1 when startup failed.
    int run(int argc, char* argv[]);

    // Needs a registered application, so run() is the usual entry point.
    void start();
    void stop();

    Bootstrapper& core() { return core_; }
    BootstrapperState state() const { return core_.state(); }
    Host* host() { return core_.host(); }

    const std::shared_ptr<UiDispatcher>& dispatcher() const { return dispatcher_; }
    Glib::RefPtr<Gtk::Application> application() const { return app_; }
    std::shared_ptr<Gtk::Window> main_window() const { return main_window_; }
    std::shared_ptr<Gtk::Window> splash_window() const { return splash_window_; }

private:
    BootstrapperOptions make_core_options();
    void on_activate();
    void internal_start();
    void start_splash_screen(const std::shared_ptr<Progress>& progress);
    bool on_splash_poll();
    void show_main_window();
    void release_application();

    GtkBootstrapperOptions options_;
    std::shared_ptr<FaultChannel> fault_channel_;
    std::shared_ptr<UiDispatcher> dispatcher_;
    Bootstrapper core_;

    Glib::RefPtr<Gtk::Application> app_;
    std::vector<std::string> command_line_;
    bool held_ = false;
    bool stopping_ = false;
    int exit_code_ = 0;

    std::shared_ptr<Gtk::Window> main_window_;
    std::shared_ptr<Gtk::Window> splash_window_;
    sigc::connection main_window_hidden_;
    sigc::connection splash_poll_;
    std::chrono::steady_clock::time_point splash_shown_at_;
    std::shared_ptr<std::atomic<bool>> splash_action_done_;
};
