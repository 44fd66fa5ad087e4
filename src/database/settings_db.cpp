#include "settings_db.h"

#include <filesystem>
#include <iostream>

SettingsDB::SettingsDB(const std::string& db_path) : db_path_(db_path) {}

SettingsDB::~SettingsDB() {
    if (db_) {
        sqlite3_close(db_);
    }
}

bool SettingsDB::initialize() {
    if (db_) {
        return true;
    }

    std::error_code ec;
    auto parent = std::filesystem::path(db_path_).parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            std::cerr << "Failed to create settings directory: " << ec.message() << std::endl;
            return false;
        }
    }

    int rc = sqlite3_open(db_path_.c_str(), &db_);
    if (rc != SQLITE_OK) {
        std::cerr << "Failed to open settings database: " << sqlite3_errmsg(db_) << std::endl;
        sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }

    const char* pragmas = R"(
        PRAGMA journal_mode = WAL;
        PRAGMA synchronous = NORMAL;
    )";
    char* err_msg = nullptr;
    int prc = sqlite3_exec(db_, pragmas, nullptr, nullptr, &err_msg);
    if (prc != SQLITE_OK) {
        std::cerr << "Failed to apply PRAGMAs: " << err_msg << std::endl;
        sqlite3_free(err_msg);
        // continue, but warn
    }

    return create_tables();
}

bool SettingsDB::create_tables() {
    const char* sql = R"(
        CREATE TABLE IF NOT EXISTS config (
            key TEXT PRIMARY KEY,
            value TEXT NOT NULL
        );
    )";

    char* err_msg = nullptr;
    int rc = sqlite3_exec(db_, sql, nullptr, nullptr, &err_msg);
    if (rc != SQLITE_OK) {
        std::cerr << "SQL error: " << err_msg << std::endl;
        sqlite3_free(err_msg);
        return false;
    }

    return true;
}

std::optional<std::string> SettingsDB::get(const std::string& key) {
    if (!db_) {
        return std::nullopt;
    }

    const char* sql = "SELECT value FROM config WHERE key = ?";
    sqlite3_stmt* stmt;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        std::cerr << "❌ Settings get prepare failed: " << sqlite3_errmsg(db_) << std::endl;
        return std::nullopt;
    }
    sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);

    std::optional<std::string> result;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        const unsigned char* value = sqlite3_column_text(stmt, 0);
        result = value ? std::string(reinterpret_cast<const char*>(value)) : std::string();
    }
    sqlite3_finalize(stmt);
    return result;
}

bool SettingsDB::set(const std::string& key, const std::string& value) {
    if (!db_) {
        return false;
    }

    const char* sql = R"(
        INSERT INTO config(key, value) VALUES (?, ?)
        ON CONFLICT(key) DO UPDATE SET value = excluded.value
    )";
    sqlite3_stmt* stmt;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        std::cerr << "❌ Settings set prepare failed: " << sqlite3_errmsg(db_) << std::endl;
        return false;
    }
    sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, value.c_str(), -1, SQLITE_TRANSIENT);
    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        std::cerr << "❌ Settings set failed: " << sqlite3_errmsg(db_) << std::endl;
        return false;
    }
    return true;
}

bool SettingsDB::remove(const std::string& key) {
    if (!db_) {
        return false;
    }

    const char* sql = "DELETE FROM config WHERE key = ?";
    sqlite3_stmt* stmt;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        std::cerr << "❌ Settings delete prepare failed: " << sqlite3_errmsg(db_) << std::endl;
        return false;
    }
    sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);
    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        std::cerr << "❌ Settings delete failed: " << sqlite3_errmsg(db_) << std::endl;
        return false;
    }
    return sqlite3_changes(db_) > 0;
}

std::map<std::string, std::string> SettingsDB::all() {
    std::map<std::string, std::string> result;
    if (!db_) {
        return result;
    }

    const char* sql = "SELECT key, value FROM config";
    sqlite3_stmt* stmt;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        std::cerr << "❌ Settings read prepare failed: " << sqlite3_errmsg(db_) << std::endl;
        return result;
    }
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        const unsigned char* key = sqlite3_column_text(stmt, 0);
        const unsigned char* value = sqlite3_column_text(stmt, 1);
        if (key) {
            result[reinterpret_cast<const char*>(key)] = value ? reinterpret_cast<const char*>(value) : "";
        }
    }
    sqlite3_finalize(stmt);
    return result;
}
