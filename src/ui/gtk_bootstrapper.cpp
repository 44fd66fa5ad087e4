#include "ui/gtk_bootstrapper.h"

#include <iostream>

#include "core/background_tasks.h"
#include "core/errors.h"
#include "core/fault_channel.h"
#include "services/ui_dispatcher.h"
#include "ui/controls_style.h"
#include "ui/glib_fault_source.h"

namespace {
constexpr unsigned int SPLASH_POLL_INTERVAL_MS = 200;
}

GtkBootstrapper::GtkBootstrapper(GtkBootstrapperOptions options)
    : options_(std::move(options))
    , fault_channel_(options_.core.fault_channel ? options_.core.fault_channel : std::make_shared<FaultChannel>())
    , dispatcher_(std::make_shared<UiDispatcher>())
    , core_(make_core_options())
{
    dispatcher_->set_fault_channel(fault_channel_);
}

GtkBootstrapper::~GtkBootstrapper() {
    splash_poll_.disconnect();
    main_window_hidden_.disconnect();
}

BootstrapperOptions GtkBootstrapper::make_core_options() {
    BootstrapperOptions core = options_.core;
    core.fault_channel = fault_channel_;
    core.fault_sources.push_back(std::make_shared<GlibFaultSource>());

    auto user_configuration = options_.core.configure_app_configuration;
    core.configure_app_configuration = [this, user_configuration](ConfigurationBuilder& builder) {
        if (user_configuration) {
            user_configuration(builder);
        }
        builder.add_command_line(command_line_);
    };

    auto user_services = options_.core.configure_services;
    core.configure_services = [this, user_services](const Configuration& configuration, ServiceCollection& services) {
        auto faults = fault_channel_;
        services.add_singleton<FaultChannel>(faults);
        services.add_singleton<UiDispatcher>(dispatcher_);
        services.add_singleton<BackgroundTasks>([faults](ServiceProvider&) {
            return std::make_shared<BackgroundTasks>(faults);
        });
        // Not owned by the container.
        services.add_singleton<GtkBootstrapper>(std::shared_ptr<GtkBootstrapper>(this, [](GtkBootstrapper*) {}));
        if (app_) {
            services.add_singleton<Gtk::Application>(app_);
        }

        if (user_services) {
            user_services(configuration, services);
        }
    };

    auto user_hook = options_.core.startup_hook;
    core.startup_hook = [this, user_hook](Bootstrapper& bootstrapper) {
        internal_start();
        if (user_hook) {
            user_hook(bootstrapper);
        }
    };

    return core;
}

int GtkBootstrapper::run(int argc, char* argv[]) {
    command_line_.clear();
    for (int i = 1; i < argc; ++i) {
        command_line_.emplace_back(argv[i]);
    }

    app_ = Gtk::Application::create(options_.application_id);
    app_->signal_activate().connect(sigc::mem_fun(*this, &GtkBootstrapper::on_activate));

    // Our arguments are configuration, not GApplication options.
    int app_argc = argc > 0 ? 1 : 0;
    int status = app_->run(app_argc, argv);

    if (!core_.is_disposed() && core_.state() == BootstrapperState::Started) {
        try {
            stop();
        } catch (const std::exception& e) {
            std::cerr << "❌ Error stopping application: " << e.what() << std::endl;
            exit_code_ = 1;
        }
    }

    return exit_code_ != 0 ? exit_code_ : status;
}

void GtkBootstrapper::on_activate() {
    if (core_.state() == BootstrapperState::Started) {
        if (main_window_ && main_window_->get_visible()) {
            main_window_->present();
        }
        return;
    }
    if (core_.is_disposed() || core_.state() != BootstrapperState::NotStarted) {
        return;
    }

    app_->hold();
    held_ = true;

    try {
        start();
    } catch (const std::exception& e) {
        std::cerr << "💥 Application failed to start: " << e.what() << std::endl;
        exit_code_ = 1;
        try {
            stop();
        } catch (const std::exception& stop_error) {
            std::cerr << "❌ Error during shutdown: " << stop_error.what() << std::endl;
        }
        app_->quit();
    }
}

void GtkBootstrapper::start() {
    if (!app_) {
        throw InvalidStateError("The application has not been created. Use run() to start a GtkBootstrapper.");
    }
    core_.start();
}

void GtkBootstrapper::internal_start() {
    try {
        load_controls_style();
    } catch (const std::exception& e) {
        std::cerr << "⚠️  Could not load controls style: " << e.what() << std::endl;
        core_.raise_unhandled_exception(std::current_exception());
    }

    if (options_.set_theme) {
        options_.set_theme(*this);
    }

    Host& host = *core_.host();

    if (!options_.main_window_factory) {
        throw InvalidStateError("No main window factory was configured.");
    }
    main_window_ = options_.main_window_factory(host);
    if (!main_window_) {
        throw InvalidStateError("The main window factory returned no window.");
    }
    app_->add_window(*main_window_);

    std::shared_ptr<Progress> splash_progress;
    if (options_.show_splash_screen) {
        if (!options_.splash_screen_window_factory) {
            throw InvalidStateError("The splash screen is enabled but no splash screen window factory was configured.");
        }
        splash_progress = options_.splash_screen_progress_factory
            ? options_.splash_screen_progress_factory()
            : std::make_shared<Progress>();
        splash_window_ = options_.splash_screen_window_factory(host, splash_progress);
        if (!splash_window_) {
            throw InvalidStateError("The splash screen window factory returned no window.");
        }
        app_->add_window(*splash_window_);
    }

    if (splash_window_) {
        start_splash_screen(splash_progress);
    } else {
        show_main_window();
    }
}

void GtkBootstrapper::start_splash_screen(const std::shared_ptr<Progress>& progress) {
    std::cout << "🔧 Showing splash screen..." << std::endl;
    splash_window_->present();
    splash_shown_at_ = std::chrono::steady_clock::now();
    splash_action_done_ = std::make_shared<std::atomic<bool>>(!options_.splash_screen_action);

    if (options_.splash_screen_action) {
        auto tasks = core_.host()->services().get_required_service<BackgroundTasks>();
        auto reporter = std::make_shared<DispatchedProgress>(dispatcher_, progress);
        auto action = options_.splash_screen_action;
        auto done = splash_action_done_;
        tasks->run("splash screen", [action, reporter, done]() {
            try {
                action(*reporter);
            } catch (...) {
                done->store(true);
                throw;
            }
            done->store(true);
        });
    }

    splash_poll_ = Glib::signal_timeout().connect(
        sigc::mem_fun(*this, &GtkBootstrapper::on_splash_poll), SPLASH_POLL_INTERVAL_MS);
}

bool GtkBootstrapper::on_splash_poll() {
    auto elapsed = std::chrono::steady_clock::now() - splash_shown_at_;
    if (!splash_action_done_->load() || elapsed < options_.splash_screen_duration) {
        return true;
    }

    if (splash_window_) {
        splash_window_->hide();
    }
    if (!stopping_) {
        show_main_window();
    }
    return false;
}

void GtkBootstrapper::show_main_window() {
    main_window_hidden_ = main_window_->signal_hide().connect([this]() {
        if (stopping_) {
            return;
        }
        std::cout << "🔧 Main window closed, shutting down..." << std::endl;
        try {
            stop();
        } catch (const std::exception& e) {
            std::cerr << "❌ Error during shutdown: " << e.what() << std::endl;
        }
    });
    main_window_->present();
    std::cout << "✅ Main window shown" << std::endl;
}

void GtkBootstrapper::stop() {
    if (stopping_) {
        return;
    }
    stopping_ = true;
    splash_poll_.disconnect();
    main_window_hidden_.disconnect();

    std::exception_ptr failure;
    if (!core_.is_disposed()) {
        try {
            core_.stop();
        } catch (...) {
            failure = std::current_exception();
        }
    }

    if (splash_window_) {
        splash_window_->hide();
    }
    if (main_window_) {
        main_window_->hide();
    }
    splash_window_.reset();
    main_window_.reset();
    release_application();

    if (failure) {
        std::rethrow_exception(failure);
    }
}

void GtkBootstrapper::release_application() {
    if (!app_) {
        return;
    }
    if (held_) {
        app_->release();
        held_ = false;
    }
    app_->quit();
}
