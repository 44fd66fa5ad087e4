#pragma once

#include <optional>
#include <string>

enum class ApplicationTheme {
    System,
    Light,
    Dark,
    HighContrast
};

std::string to_string(ApplicationTheme theme);
std::optional<ApplicationTheme> parse_application_theme(const std::string& text);

// Installs the stylesheet of the library controls on the default display.
// Throws std::runtime_error when there is no display.
void load_controls_style();

void apply_application_theme(ApplicationTheme theme);
