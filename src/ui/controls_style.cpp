#include "ui/controls_style.h"

#include <gtkmm.h>
#include <iostream>
#include <stdexcept>

namespace {
Glib::RefPtr<Gtk::CssProvider> high_contrast_provider;

const char* kControlsCss = R"(
    .editor-title {
        font-weight: 600;
        margin-bottom: 2px;
    }

    .editor-suffix {
        color: alpha(currentColor, 0.6);
        margin-left: 4px;
    }

    entry.error {
        border-color: #E74C3C;
        box-shadow: inset 0 0 0 1px #E74C3C;
    }

    .group-box {
        border-radius: 6px;
        padding: 4px;
    }

    .group-box-header {
        font-weight: bold;
        padding: 0 4px;
    }

    .overlay-presenter {
        background-color: alpha(black, 0.45);
    }

    .overlay-card {
        background-color: @window_bg_color;
        border-radius: 8px;
        padding: 20px;
        min-width: 300px;
    }

    .info-bar {
        border-radius: 4px;
        padding: 8px 12px;
        margin: 6px;
    }

    .info-bar-informational { background-color: alpha(#4A90E2, 0.2); }
    .info-bar-success { background-color: alpha(#2ECC71, 0.2); }
    .info-bar-warning { background-color: alpha(#F1C40F, 0.25); }
    .info-bar-error { background-color: alpha(#E74C3C, 0.25); }

    .navigation-sidebar {
        min-width: 180px;
        border-right: 1px solid alpha(currentColor, 0.15);
    }
)";

const char* kHighContrastCss = R"(
    window, .overlay-card {
        background-color: black;
        color: white;
    }

    entry, button {
        border: 2px solid yellow;
    }
)";
}

std::string to_string(ApplicationTheme theme) {
    switch (theme) {
        case ApplicationTheme::System: return "System";
        case ApplicationTheme::Light: return "Light";
        case ApplicationTheme::Dark: return "Dark";
        case ApplicationTheme::HighContrast: return "HighContrast";
    }
    return "System";
}

std::optional<ApplicationTheme> parse_application_theme(const std::string& text) {
    if (text == "System") return ApplicationTheme::System;
    if (text == "Light") return ApplicationTheme::Light;
    if (text == "Dark") return ApplicationTheme::Dark;
    if (text == "HighContrast") return ApplicationTheme::HighContrast;
    return std::nullopt;
}

void load_controls_style() {
    auto display = Gdk::Display::get_default();
    if (!display) {
        throw std::runtime_error("No default display to install the controls style on");
    }

    std::cout << "🔧 Loading controls style..." << std::endl;
    auto css_provider = Gtk::CssProvider::create();
    css_provider->load_from_data(kControlsCss);
    Gtk::StyleContext::add_provider_for_display(
        display, css_provider, GTK_STYLE_PROVIDER_PRIORITY_APPLICATION);
    std::cout << "✅ Controls style loaded" << std::endl;
}

void apply_application_theme(ApplicationTheme theme) {
    auto settings = Gtk::Settings::get_default();
    auto display = Gdk::Display::get_default();
    if (!settings || !display) {
        std::cerr << "⚠️  No display, theme not applied" << std::endl;
        return;
    }

    if (high_contrast_provider) {
        Gtk::StyleContext::remove_provider_for_display(display, high_contrast_provider);
        high_contrast_provider.reset();
    }

    switch (theme) {
        case ApplicationTheme::System:
            settings->reset_property("gtk-application-prefer-dark-theme");
            break;
        case ApplicationTheme::Light:
            settings->property_gtk_application_prefer_dark_theme() = false;
            break;
        case ApplicationTheme::Dark:
            settings->property_gtk_application_prefer_dark_theme() = true;
            break;
        case ApplicationTheme::HighContrast:
            settings->property_gtk_application_prefer_dark_theme() = true;
            high_contrast_provider = Gtk::CssProvider::create();
            high_contrast_provider->load_from_data(kHighContrastCss);
            Gtk::StyleContext::add_provider_for_display(
                display, high_contrast_provider, GTK_STYLE_PROVIDER_PRIORITY_USER);
            break;
    }
    std::cout << "✅ Theme applied: " << to_string(theme) << std::endl;
}
