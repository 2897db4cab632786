#include <feedstore/config.hpp>
#include <toml++/toml.hpp>
#include <algorithm>
#include <array>
#include <cctype>
#include <fstream>
#include <sstream>

namespace feedstore {

static const std::array<const char*, 6> JOURNAL_MODES = {
    "DELETE", "TRUNCATE", "PERSIST", "MEMORY", "WAL", "OFF"};
static const std::array<const char*, 4> SYNCHRONOUS_MODES = {
    "OFF", "NORMAL", "FULL", "EXTRA"};

static std::string to_upper(std::string s) {
    for (auto& c : s) {
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    return s;
}

template<size_t N>
static bool one_of(const std::string& v, const std::array<const char*, N>& allowed) {
    return std::any_of(allowed.begin(), allowed.end(),
                       [&](const char* a) { return v == a; });
}

template<size_t N>
static std::string join_allowed(const std::array<const char*, N>& allowed) {
    std::string out;
    for (size_t i = 0; i < N; ++i) {
        if (i > 0) out += '|';
        out += allowed[i];
    }
    return out;
}

static FeedStoreError type_error(const std::string& key, const char* expected) {
    return FeedStoreError{FeedStoreError::Config,
        "config key '" + key + "' must be a " + expected};
}

Result<StoreConfig> StoreConfig::parse(const std::string& toml_str) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        return FeedStoreError{FeedStoreError::Parse,
            std::string("config TOML parse error: ") + e.what()};
    }

    StoreConfig cfg;

    // [store] section
    if (auto store = doc["store"].as_table()) {
        if (auto node = store->get("path")) {
            auto v = node->value<std::string>();
            if (!v) return type_error("store.path", "string");
            cfg.path = *v;
        }
        if (auto node = store->get("journal-mode")) {
            auto v = node->value<std::string>();
            if (!v) return type_error("store.journal-mode", "string");
            std::string mode = to_upper(*v);
            if (!one_of(mode, JOURNAL_MODES)) {
                return FeedStoreError{FeedStoreError::Config,
                    "unknown journal mode: " + *v,
                    "expected one of " + join_allowed(JOURNAL_MODES)};
            }
            cfg.database.journal_mode = mode;
        }
        if (auto node = store->get("synchronous")) {
            auto v = node->value<std::string>();
            if (!v) return type_error("store.synchronous", "string");
            std::string mode = to_upper(*v);
            if (!one_of(mode, SYNCHRONOUS_MODES)) {
                return FeedStoreError{FeedStoreError::Config,
                    "unknown synchronous mode: " + *v,
                    "expected one of " + join_allowed(SYNCHRONOUS_MODES)};
            }
            cfg.database.synchronous = mode;
        }
        if (auto node = store->get("busy-timeout-ms")) {
            auto v = node->value<int64_t>();
            if (!v) return type_error("store.busy-timeout-ms", "integer");
            if (*v < 0 || *v > 3600000) {
                return FeedStoreError{FeedStoreError::Config,
                    "busy-timeout-ms out of range: " + std::to_string(*v),
                    "expected 0..3600000"};
            }
            cfg.database.busy_timeout_ms = static_cast<int>(*v);
        }
        if (auto node = store->get("create-directories")) {
            auto v = node->value<bool>();
            if (!v) return type_error("store.create-directories", "boolean");
            cfg.database.create_directories = *v;
        }
        if (auto node = store->get("transactional-insert")) {
            auto v = node->value<bool>();
            if (!v) return type_error("store.transactional-insert", "boolean");
            cfg.transactional_insert = *v;
        }
    }

    // [log] section
    if (auto log_tbl = doc["log"].as_table()) {
        if (auto node = log_tbl->get("level")) {
            auto v = node->value<std::string>();
            if (!v) return type_error("log.level", "string");
            auto lvl = log::parse_level(*v);
            if (!lvl) {
                return FeedStoreError{FeedStoreError::Config,
                    "unknown log level: " + *v,
                    "expected one of trace|debug|info|warn|error"};
            }
            cfg.log_level = *lvl;
        }
        if (auto node = log_tbl->get("color")) {
            auto v = node->value<bool>();
            if (!v) return type_error("log.color", "boolean");
            cfg.log_color = *v;
            cfg.log_color_set = true;
        }
    }

    return Result<StoreConfig>::ok(std::move(cfg));
}

Result<StoreConfig> StoreConfig::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return FeedStoreError{FeedStoreError::IO,
            "cannot open config file: " + path};
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    return StoreConfig::parse(ss.str());
}

StoreConfig StoreConfig::with_path(const std::string& db_path) {
    StoreConfig cfg;
    cfg.path = db_path;
    return cfg;
}

void StoreConfig::apply_log_settings() const {
    log::set_level(log_level);
    // Without an explicit setting the logger keeps detecting a tty
    if (log_color_set) log::set_color_enabled(log_color);
}

} // namespace feedstore
