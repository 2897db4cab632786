#include <feedstore/feed_database.hpp>
#include <feedstore/log.hpp>
#include <sqlite3.h>

#include <cctype>
#include <cstdlib>
#include <filesystem>

namespace fs = std::filesystem;

namespace feedstore {

// ---------------------------------------------------------------------------
// Column helpers
// ---------------------------------------------------------------------------

static std::string column_string(sqlite3_stmt* stmt, int col) {
    const unsigned char* text = sqlite3_column_text(stmt, col);
    if (!text) return std::string();
    return std::string(reinterpret_cast<const char*>(text));
}

static std::optional<std::string> column_optional(sqlite3_stmt* stmt, int col) {
    if (sqlite3_column_type(stmt, col) == SQLITE_NULL) return std::nullopt;
    return column_string(stmt, col);
}

static int bind_optional(sqlite3_stmt* stmt, int idx, const std::optional<std::string>& v) {
    if (!v.has_value()) return sqlite3_bind_null(stmt, idx);
    return sqlite3_bind_text(stmt, idx, v->c_str(), -1, SQLITE_TRANSIENT);
}

// PRAGMA values are spliced into SQL text
static bool is_pragma_word(const std::string& s) {
    if (s.empty()) return false;
    for (char c : s) {
        if (!std::isalpha(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

// ---------------------------------------------------------------------------
// pImpl
// ---------------------------------------------------------------------------

struct FeedDatabase::Impl {
    sqlite3* db = nullptr;
    std::string path;
    DatabaseOptions options;

    // Prepared statements (lazily initialized, cached)
    sqlite3_stmt* stmt_select_all = nullptr;
    sqlite3_stmt* stmt_delete_all = nullptr;
    sqlite3_stmt* stmt_insert = nullptr;
    sqlite3_stmt* stmt_count = nullptr;

    ~Impl() {
        finalize_all();
        if (db) sqlite3_close(db);
    }

    void finalize_all() {
        auto fin = [](sqlite3_stmt*& s) {
            if (s) { sqlite3_finalize(s); s = nullptr; }
        };
        fin(stmt_select_all);
        fin(stmt_delete_all);
        fin(stmt_insert);
        fin(stmt_count);
    }

    std::string errmsg() const {
        return db ? sqlite3_errmsg(db) : "database is not open";
    }

    // Error carrying the connection's last message and extended result code
    FeedStoreError sqlite_error(FeedStoreError::Code code, const std::string& what) const {
        FeedStoreError err(code, what + ": " + errmsg());
        if (db) err.sqlite_code = sqlite3_extended_errcode(db);
        return err;
    }

    Status require_open() const {
        if (!db) {
            return FeedStoreError(FeedStoreError::InvalidArg,
                "Feed cache database is not open");
        }
        return ok_status();
    }

    Status prepare(const char* sql, sqlite3_stmt*& out) {
        if (out) return ok_status();
        int rc = sqlite3_prepare_v2(db, sql, -1, &out, nullptr);
        if (rc != SQLITE_OK) {
            return sqlite_error(FeedStoreError::Query, "SQLite prepare failed");
        }
        return ok_status();
    }

    Status exec(const std::string& sql, FeedStoreError::Code code) {
        char* err = nullptr;
        int rc = sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err);
        if (rc != SQLITE_OK) {
            std::string msg = err ? err : "unknown error";
            sqlite3_free(err);
            FeedStoreError e(code, "SQLite exec failed: " + msg);
            e.sqlite_code = sqlite3_extended_errcode(db);
            return e;
        }
        return ok_status();
    }

    Status apply_pragmas() {
        if (!is_pragma_word(options.journal_mode) || !is_pragma_word(options.synchronous)) {
            return FeedStoreError(FeedStoreError::InvalidArg,
                "Invalid PRAGMA value in database options",
                "journal_mode='" + options.journal_mode +
                "' synchronous='" + options.synchronous + "'");
        }
        FEEDSTORE_TRY(exec("PRAGMA journal_mode=" + options.journal_mode + ";",
                           FeedStoreError::Schema));
        FEEDSTORE_TRY(exec("PRAGMA synchronous=" + options.synchronous + ";",
                           FeedStoreError::Schema));
        return ok_status();
    }

    Status init_schema() {
        FEEDSTORE_TRY(exec(
            "CREATE TABLE IF NOT EXISTS FeedImageCache ("
            "  id TEXT PRIMARY KEY NOT NULL,"
            "  description TEXT,"
            "  location TEXT,"
            "  url TEXT,"
            "  timestamp REAL"
            ");",
            FeedStoreError::Schema));

        // A pre-existing table with another layout would only fail on first use
        sqlite3_stmt* stmt = nullptr;
        int rc = sqlite3_prepare_v2(db,
            "SELECT id, description, location, url, timestamp FROM FeedImageCache LIMIT 0",
            -1, &stmt, nullptr);
        if (stmt) sqlite3_finalize(stmt);
        if (rc != SQLITE_OK) {
            auto err = sqlite_error(FeedStoreError::Schema, "Incompatible FeedImageCache table");
            err.hint = "expected columns (id, description, location, url, timestamp)";
            return err;
        }
        return ok_status();
    }
};

// ---------------------------------------------------------------------------
// FeedDatabase public interface
// ---------------------------------------------------------------------------

FeedDatabase::FeedDatabase() : impl_(std::make_unique<Impl>()) {}
FeedDatabase::~FeedDatabase() = default;
FeedDatabase::FeedDatabase(FeedDatabase&&) noexcept = default;
FeedDatabase& FeedDatabase::operator=(FeedDatabase&&) noexcept = default;

std::string FeedDatabase::default_path() {
    const char* home = std::getenv("HOME");
    if (!home) home = "/tmp";
    return std::string(home) + "/.feedstore/feed_cache.sqlite";
}

Status FeedDatabase::open(const std::string& db_path, const DatabaseOptions& options) {
    close();

    if (db_path.empty()) {
        return FeedStoreError(FeedStoreError::InvalidArg,
            "Feed cache database path must not be empty");
    }

    if (options.create_directories) {
        fs::path parent = fs::path(db_path).parent_path();
        if (!parent.empty()) {
            std::error_code ec;
            fs::create_directories(parent, ec);
            if (ec) {
                return FeedStoreError(FeedStoreError::IO,
                    "Failed to create cache directory: " + parent.string(),
                    ec.message());
            }
        }
    }

    int rc = sqlite3_open_v2(db_path.c_str(), &impl_->db,
        SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);
    if (rc != SQLITE_OK) {
        std::string err_msg = impl_->db ? sqlite3_errmsg(impl_->db) : sqlite3_errstr(rc);
        int err_code = impl_->db ? sqlite3_extended_errcode(impl_->db) : rc;
        if (impl_->db) { sqlite3_close(impl_->db); impl_->db = nullptr; }
        log::warn("cannot open feed cache %s: %s", db_path.c_str(), err_msg.c_str());
        FeedStoreError err(FeedStoreError::Open,
            "Failed to open feed cache database: " + err_msg,
            "path: " + db_path);
        err.sqlite_code = err_code;
        return err;
    }

    sqlite3_busy_timeout(impl_->db, options.busy_timeout_ms);
    impl_->path = db_path;
    impl_->options = options;
    log::debug("opened feed cache database: %s", db_path.c_str());
    return ok_status();
}

void FeedDatabase::close() {
    if (impl_->db) {
        impl_->finalize_all();
        sqlite3_close(impl_->db);
        impl_->db = nullptr;
        log::debug("closed feed cache database: %s", impl_->path.c_str());
    }
    impl_->path.clear();
}

bool FeedDatabase::is_open() const {
    return impl_->db != nullptr;
}

const std::string& FeedDatabase::path() const {
    return impl_->path;
}

Status FeedDatabase::prepare_schema() {
    FEEDSTORE_TRY(impl_->require_open());
    FEEDSTORE_TRY(impl_->apply_pragmas());
    FEEDSTORE_TRY(impl_->init_schema());
    log::trace("feed cache schema ready: %s", impl_->path.c_str());
    return ok_status();
}

// ---------------------------------------------------------------------------
// Snapshot rows
// ---------------------------------------------------------------------------

Result<std::optional<CachedFeed>> FeedDatabase::read_all() {
    FEEDSTORE_TRY(impl_->require_open());
    FEEDSTORE_TRY(impl_->prepare(
        "SELECT id, description, location, url, timestamp "
        "FROM FeedImageCache ORDER BY rowid",
        impl_->stmt_select_all));

    sqlite3_stmt* stmt = impl_->stmt_select_all;
    sqlite3_reset(stmt);

    std::vector<FeedImage> feed;
    double first_timestamp = 0.0;
    int rc;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        auto id = Uuid::from_string(column_string(stmt, 0));
        if (id.is_err()) {
            sqlite3_reset(stmt);
            return FeedStoreError(FeedStoreError::Query,
                "Malformed id in FeedImageCache row " + std::to_string(feed.size()),
                id.error().message);
        }
        auto url = Url::from_string(column_string(stmt, 3));
        if (url.is_err()) {
            sqlite3_reset(stmt);
            return FeedStoreError(FeedStoreError::Query,
                "Malformed url in FeedImageCache row " + std::to_string(feed.size()),
                url.error().message);
        }
        if (feed.empty()) {
            first_timestamp = sqlite3_column_double(stmt, 4);
            if (!is_valid_reference_seconds(first_timestamp)) {
                sqlite3_reset(stmt);
                return FeedStoreError(FeedStoreError::Query,
                    "Malformed timestamp in FeedImageCache row 0",
                    "expected finite seconds since 2001-01-01T00:00:00Z");
            }
        }
        feed.push_back(FeedImage{id.value(), column_optional(stmt, 1),
                                 column_optional(stmt, 2), url.value()});
    }

    if (rc != SQLITE_DONE) {
        auto err = impl_->sqlite_error(FeedStoreError::Query, "Failed to read feed cache");
        sqlite3_reset(stmt);
        return err;
    }
    sqlite3_reset(stmt);

    if (feed.empty()) {
        return Result<std::optional<CachedFeed>>::ok(std::nullopt);
    }
    log::trace("read %zu feed images from cache", feed.size());
    return Result<std::optional<CachedFeed>>::ok(
        CachedFeed{std::move(feed), from_reference_seconds(first_timestamp)});
}

Status FeedDatabase::delete_all() {
    FEEDSTORE_TRY(impl_->require_open());
    FEEDSTORE_TRY(impl_->prepare("DELETE FROM FeedImageCache", impl_->stmt_delete_all));

    sqlite3_stmt* stmt = impl_->stmt_delete_all;
    sqlite3_reset(stmt);
    int rc = sqlite3_step(stmt);
    if (rc != SQLITE_DONE) {
        auto err = impl_->sqlite_error(FeedStoreError::Query, "Failed to clear feed cache");
        sqlite3_reset(stmt);
        return err;
    }
    sqlite3_reset(stmt);
    return ok_status();
}

Status FeedDatabase::insert_all(const std::vector<FeedImage>& feed, Timestamp timestamp) {
    FEEDSTORE_TRY(impl_->require_open());
    FEEDSTORE_TRY(impl_->prepare(
        "INSERT INTO FeedImageCache (id, description, location, url, timestamp) "
        "VALUES (?, ?, ?, ?, ?)",
        impl_->stmt_insert));

    sqlite3_stmt* stmt = impl_->stmt_insert;
    const double seconds = to_reference_seconds(timestamp);

    for (auto& image : feed) {
        sqlite3_reset(stmt);
        sqlite3_clear_bindings(stmt);

        std::string id = image.id.to_string();
        if (sqlite3_bind_text(stmt, 1, id.c_str(), -1, SQLITE_TRANSIENT) != SQLITE_OK ||
            bind_optional(stmt, 2, image.description) != SQLITE_OK ||
            bind_optional(stmt, 3, image.location) != SQLITE_OK ||
            sqlite3_bind_text(stmt, 4, image.url.to_string().c_str(), -1, SQLITE_TRANSIENT) != SQLITE_OK ||
            sqlite3_bind_double(stmt, 5, seconds) != SQLITE_OK) {
            auto err = impl_->sqlite_error(FeedStoreError::Query, "Failed to bind feed image " + id);
            sqlite3_reset(stmt);
            return err;
        }

        int rc = sqlite3_step(stmt);
        if (rc != SQLITE_DONE) {
            auto err = impl_->sqlite_error(FeedStoreError::Query, "Failed to insert feed image " + id);
            sqlite3_reset(stmt);
            return err;
        }
    }
    sqlite3_reset(stmt);
    return ok_status();
}

Result<int64_t> FeedDatabase::count() {
    FEEDSTORE_TRY(impl_->require_open());
    FEEDSTORE_TRY(impl_->prepare("SELECT COUNT(*) FROM FeedImageCache", impl_->stmt_count));

    sqlite3_stmt* stmt = impl_->stmt_count;
    sqlite3_reset(stmt);
    if (sqlite3_step(stmt) != SQLITE_ROW) {
        auto err = impl_->sqlite_error(FeedStoreError::Query, "Failed to count feed cache rows");
        sqlite3_reset(stmt);
        return err;
    }
    int64_t n = sqlite3_column_int64(stmt, 0);
    sqlite3_reset(stmt);
    return Result<int64_t>::ok(n);
}

// ---------------------------------------------------------------------------
// Transactions
// ---------------------------------------------------------------------------

Status FeedDatabase::begin_transaction() {
    FEEDSTORE_TRY(impl_->require_open());
    return impl_->exec("BEGIN IMMEDIATE;", FeedStoreError::Query);
}

Status FeedDatabase::commit() {
    FEEDSTORE_TRY(impl_->require_open());
    return impl_->exec("COMMIT;", FeedStoreError::Query);
}

Status FeedDatabase::rollback() {
    FEEDSTORE_TRY(impl_->require_open());
    return impl_->exec("ROLLBACK;", FeedStoreError::Query);
}

bool FeedDatabase::in_transaction() const {
    return impl_->db && sqlite3_get_autocommit(impl_->db) == 0;
}

Result<std::unique_ptr<Transaction>> Transaction::begin(FeedDatabase& db) {
    FEEDSTORE_TRY(db.begin_transaction());
    return Result<std::unique_ptr<Transaction>>::ok(
        std::make_unique<Transaction>(PrivateTag{}, db));
}

Transaction::~Transaction() {
    if (finished_ || !db_.in_transaction()) return;
    auto r = db_.rollback();
    if (r.is_err()) {
        log::error("feed cache rollback failed: %s", r.error().message.c_str());
    }
}

Status Transaction::commit() {
    FEEDSTORE_TRY(db_.commit());
    finished_ = true;
    return ok_status();
}

Status Transaction::rollback() {
    finished_ = true;
    return db_.rollback();
}

} // namespace feedstore
