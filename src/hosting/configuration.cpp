#include "hosting/configuration.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <iostream>

#include "converters/value_converter_factory.h"
#include "database/settings_db.h"

extern char** environ;

namespace {
std::string to_lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

// FOO__BAR -> FOO:BAR
std::string normalize_env_key(const std::string& key) {
    std::string result;
    result.reserve(key.size());
    for (size_t i = 0; i < key.size(); ++i) {
        if (key[i] == '_' && i + 1 < key.size() && key[i + 1] == '_') {
            result.push_back(':');
            ++i;
        } else {
            result.push_back(key[i]);
        }
    }
    return result;
}
}

Configuration::Configuration(std::map<std::string, std::string> values)
    : values_(std::move(values))
{
}

std::optional<std::string> Configuration::get(const std::string& key) const {
    auto it = values_.find(key);
    if (it == values_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::string Configuration::get_or(const std::string& key, const std::string& fallback) const {
    auto value = get(key);
    return value ? *value : fallback;
}

std::optional<bool> Configuration::get_bool(const std::string& key) const {
    auto value = get(key);
    if (!value) {
        return std::nullopt;
    }
    auto lowered = to_lower(*value);
    if (lowered == "true" || lowered == "1" || lowered == "yes" || lowered == "on") {
        return true;
    }
    if (lowered == "false" || lowered == "0" || lowered == "no" || lowered == "off") {
        return false;
    }
    return std::nullopt;
}

std::optional<long long> Configuration::get_int(const std::string& key) const {
    auto value = get(key);
    if (!value) {
        return std::nullopt;
    }
    return ValueConverterFactory::create_default_long_value_converter().try_parse(*value);
}

std::optional<double> Configuration::get_double(const std::string& key) const {
    auto value = get(key);
    if (!value) {
        return std::nullopt;
    }
    return ValueConverterFactory::create_default_double_value_converter().try_parse(*value);
}

bool Configuration::contains(const std::string& key) const {
    return values_.count(key) > 0;
}

std::vector<std::string> Configuration::keys() const {
    std::vector<std::string> result;
    result.reserve(values_.size());
    for (const auto& entry : values_) {
        result.push_back(entry.first);
    }
    return result;
}

ConfigurationBuilder& ConfigurationBuilder::add_values(std::map<std::string, std::string> values) {
    return add_source([values = std::move(values)](std::map<std::string, std::string>& target) {
        for (const auto& entry : values) {
            target[entry.first] = entry.second;
        }
    });
}

ConfigurationBuilder& ConfigurationBuilder::add_environment_variables(const std::string& prefix) {
    return add_source([prefix](std::map<std::string, std::string>& target) {
        for (char** env = environ; env && *env; ++env) {
            std::string entry(*env);
            auto eq = entry.find('=');
            if (eq == std::string::npos) {
                continue;
            }
            auto key = entry.substr(0, eq);
            if (key.size() <= prefix.size() || key.compare(0, prefix.size(), prefix) != 0) {
                continue;
            }
            target[normalize_env_key(key.substr(prefix.size()))] = entry.substr(eq + 1);
        }
    });
}

ConfigurationBuilder& ConfigurationBuilder::add_command_line(std::vector<std::string> args) {
    return add_source([args = std::move(args)](std::map<std::string, std::string>& target) {
        for (size_t i = 0; i < args.size(); ++i) {
            const auto& arg = args[i];
            if (arg.size() <= 2 || arg.compare(0, 2, "--") != 0) {
                continue;
            }
            auto body = arg.substr(2);
            auto eq = body.find('=');
            if (eq != std::string::npos) {
                target[body.substr(0, eq)] = body.substr(eq + 1);
            } else if (i + 1 < args.size() && args[i + 1].compare(0, 2, "--") != 0) {
                target[body] = args[++i];
            } else {
                std::cerr << "⚠️  Ignoring command line switch without value: " << arg << std::endl;
            }
        }
    });
}

ConfigurationBuilder& ConfigurationBuilder::add_settings_db(const std::string& db_path) {
    return add_source([db_path](std::map<std::string, std::string>& target) {
        std::error_code ec;
        if (!std::filesystem::exists(db_path, ec)) {
            std::cout << "⚠️  Settings database not found, skipping: " << db_path << std::endl;
            return;
        }

        SettingsDB db(db_path);
        if (!db.initialize()) {
            std::cerr << "⚠️  Settings database unreadable, skipping: " << db_path << std::endl;
            return;
        }
        for (const auto& entry : db.all()) {
            target[entry.first] = entry.second;
        }
    });
}

ConfigurationBuilder& ConfigurationBuilder::add_source(Source source) {
    sources_.push_back(std::move(source));
    return *this;
}

Configuration ConfigurationBuilder::build() const {
    std::map<std::string, std::string> values;
    for (const auto& source : sources_) {
        source(values);
    }
    return Configuration(std::move(values));
}
