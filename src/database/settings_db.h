#pragma once

#include <sqlite3.h>
#include <map>
#include <optional>
#include <string>

// Persisted application settings in a single key/value table.
class SettingsDB {
public:
    explicit SettingsDB(const std::string& db_path);
    ~SettingsDB();

    SettingsDB(const SettingsDB&) = delete;
    SettingsDB& operator=(const SettingsDB&) = delete;

    bool initialize();
    bool is_open() const { return db_ != nullptr; }
    const std::string& path() const { return db_path_; }

    std::optional<std::string> get(const std::string& key);
    bool set(const std::string& key, const std::string& value);
    bool remove(const std::string& key);
    std::map<std::string, std::string> all();

private:
    bool create_tables();

    std::string db_path_;
    sqlite3* db_ = nullptr;
};
