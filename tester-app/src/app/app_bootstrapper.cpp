#include "app/app_bootstrapper.h"

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <thread>

#include "core/background_tasks.h"
#include "core/errors.h"
#include "core/fault_channel.h"
#include "core/message_collector.h"
#include "database/settings_db.h"
#include "pages/home_page.h"
#include "pages/home_view_model.h"
#include "pages/settings_page.h"
#include "pages/settings_view_model.h"
#include "services/info_bar_service.h"
#include "services/navigation_page_service.h"
#include "services/overlay_service.h"
#include "services/ui_dispatcher.h"
#include "windows/main_window.h"
#include "windows/splash_window.h"

AppBootstrapper::AppBootstrapper()
    : faults_(std::make_shared<FaultChannel>())
    , messages_(std::make_shared<MessageCollector>())
{
    fault_subscription_ = faults_->subscribe(sigc::mem_fun(*this, &AppBootstrapper::on_fault));
    bootstrapper_ = std::make_unique<GtkBootstrapper>(make_options());
}

AppBootstrapper::~AppBootstrapper() {
    bootstrapper_.reset();
    fault_subscription_.disconnect();
}

int AppBootstrapper::run(int argc, char* argv[]) {
    return bootstrapper_->run(argc, argv);
}

GtkBootstrapperOptions AppBootstrapper::make_options() {
    GtkBootstrapperOptions options;
    options.application_id = "org.cobalt.Tester";
    options.core.fault_channel = faults_;

    options.core.configure_app_configuration = [](ConfigurationBuilder& builder) {
        builder.add_values({{"Settings:Path", default_settings_path()}});
        builder.add_settings_db(default_settings_path());
    };

    auto messages = messages_;
    options.core.configure_services = [messages](const Configuration& configuration, ServiceCollection& services) {
        services.add_singleton<MessageCollector>(messages);
        configure_services(configuration, services);
    };

    options.core.startup_hook = [](Bootstrapper&) {
        std::cout << "✅ Tester application ready" << std::endl;
    };

    options.main_window_factory = [](Host& host) -> std::shared_ptr<Gtk::Window> {
        return host.services().get_required_service<MainWindow>();
    };

    options.show_splash_screen = true;
    options.splash_screen_duration = std::chrono::milliseconds(1500);
    options.splash_screen_window_factory = [](Host&, std::shared_ptr<Progress> progress) -> std::shared_ptr<Gtk::Window> {
        return std::make_shared<SplashWindow>(progress);
    };
    options.splash_screen_action = &AppBootstrapper::load_data;

    options.set_theme = [](GtkBootstrapper& bootstrapper) {
        bootstrapper.host()->services().get_required_service<SettingsViewModel>()->apply_saved_theme();
    };

    return options;
}

void AppBootstrapper::configure_services(const Configuration& configuration, ServiceCollection& services) {
    std::string settings_path = configuration.get_or("Settings:Path", default_settings_path());

    services.add_singleton<SettingsDB>([settings_path](ServiceProvider&) {
        auto db = std::make_shared<SettingsDB>(settings_path);
        if (!db->initialize()) {
            throw std::runtime_error("Failed to initialize settings database: " + settings_path);
        }
        return db;
    });
    services.add_singleton<NavigationPageService>();
    services.add_singleton<OverlayService>([](ServiceProvider& provider) {
        return std::make_shared<OverlayService>(provider.get_required_service<UiDispatcher>());
    });
    services.add_singleton<InfoBarService>([](ServiceProvider& provider) {
        return std::make_shared<InfoBarService>(provider.get_required_service<UiDispatcher>());
    });

    services.add_singleton<HomeViewModel>([](ServiceProvider& provider) {
        return std::make_shared<HomeViewModel>(
            provider.get_required_service<OverlayService>(),
            provider.get_required_service<InfoBarService>(),
            provider.get_required_service<MessageCollector>(),
            provider.get_required_service<BackgroundTasks>(),
            provider.get_required_service<UiDispatcher>());
    });
    services.add_singleton<SettingsViewModel>([](ServiceProvider& provider) {
        return std::make_shared<SettingsViewModel>(
            provider.get_required_service<SettingsDB>(),
            provider.get_required_service<InfoBarService>());
    });

    services.add_singleton<HomePage>([](ServiceProvider& provider) {
        return std::make_shared<HomePage>(provider.get_required_service<HomeViewModel>());
    });
    services.add_singleton<SettingsPage>([](ServiceProvider& provider) {
        return std::make_shared<SettingsPage>(provider.get_required_service<SettingsViewModel>());
    });

    services.add_singleton<MainWindow>([](ServiceProvider& provider) {
        MainWindow::Dependencies deps;
        deps.bootstrapper = provider.get_required_service<GtkBootstrapper>();
        deps.dispatcher = provider.get_required_service<UiDispatcher>();
        deps.navigation = provider.get_required_service<NavigationPageService>();
        deps.overlay = provider.get_required_service<OverlayService>();
        deps.info_bar = provider.get_required_service<InfoBarService>();
        deps.home_page = provider.get_required_service<HomePage>();
        deps.settings_page = provider.get_required_service<SettingsPage>();
        return std::make_shared<MainWindow>(deps);
    });
}

void AppBootstrapper::load_data(ProgressReporter& progress) {
    ProgressUpdate update;
    update.message = "Starting...";
    update.is_indeterminate = true;
    progress.update_progress(update);
    std::this_thread::sleep_for(std::chrono::milliseconds(500));

    const char* steps[] = {"Loading settings...", "Preparing pages...", "Warming up editors...", "Almost done..."};
    const int step_count = 4;
    for (int i = 0; i < step_count; ++i) {
        ProgressUpdate step;
        step.is_indeterminate = false;
        step.message = steps[i];
        step.value = 100.0 * (i + 1) / step_count;
        progress.update_progress(step);
        std::this_thread::sleep_for(std::chrono::milliseconds(300));
    }
}

void AppBootstrapper::on_fault(std::exception_ptr error) {
    std::string text = describe_exception(error);
    std::cerr << "💥 Unhandled exception: " << text << std::endl;
    messages_->add_error("Unhandled exception: " + text, error);
}

std::string AppBootstrapper::default_settings_path() {
    const char* home = std::getenv("HOME");
    if (!home) {
        return "cobalt-tester/settings.db";
    }
    return std::string(home) + "/.cobalt-tester/settings.db";
}
