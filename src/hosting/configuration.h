#pragma once

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

// Flattened key/value settings. Keys are hierarchical, separated by ':'.
// Lookups are case sensitive.
class Configuration {
public:
    Configuration() = default;
    explicit Configuration(std::map<std::string, std::string> values);

    std::optional<std::string> get(const std::string& key) const;
    std::string get_or(const std::string& key, const std::string& fallback) const;
    std::optional<bool> get_bool(const std::string& key) const;
    std::optional<long long> get_int(const std::string& key) const;
    std::optional<double> get_double(const std::string& key) const;

    bool contains(const std::string& key) const;
    std::vector<std::string> keys() const;
    std::size_t size() const { return values_.size(); }

private:
    std::map<std::string, std::string> values_;
};

class ConfigurationBuilder {
public:
    using Source = std::function<void(std::map<std::string, std::string>&)>;

    ConfigurationBuilder& add_values(std::map<std::string, std::string> values);
    ConfigurationBuilder& add_environment_variables(const std::string& prefix);
    ConfigurationBuilder& add_command_line(std::vector<std::string> args);
    ConfigurationBuilder& add_settings_db(const std::string& db_path);
    ConfigurationBuilder& add_source(Source source);

    std::size_t source_count() const { return sources_.size(); }

    // Later sources override earlier ones.
    Configuration build() const;

private:
    std::vector<Source> sources_;
};
