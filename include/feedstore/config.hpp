#pragma once

#include <feedstore/log.hpp>
#include <feedstore/result.hpp>
#include <string>

namespace feedstore {

// Connection settings applied by FeedDatabase
struct DatabaseOptions {
    std::string journal_mode = "DELETE";
    std::string synchronous = "FULL";
    int busy_timeout_ms = 5000;
    // Create missing parent directories of the database file before opening
    bool create_directories = false;
};

struct StoreConfig {
    std::string path;
    DatabaseOptions database;
    // Run delete + write of an insert inside one transaction
    bool transactional_insert = true;

    log::Level log_level = log::Info;
    bool log_color = false;
    bool log_color_set = false;

    // Load from a TOML config file
    static Result<StoreConfig> load(const std::string& path);

    // Parse from TOML string
    static Result<StoreConfig> parse(const std::string& toml_str);

    // Config for a store at db_path with every other setting at its default
    static StoreConfig with_path(const std::string& db_path);

    void apply_log_settings() const;
};

} // namespace feedstore
