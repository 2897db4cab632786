#pragma once

#include <feedstore/config.hpp>
#include <feedstore/feed_image.hpp>
#include <feedstore/result.hpp>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace feedstore {

// Owns the SQLite connection backing a feed cache and maps FeedImage
// records to rows of the FeedImageCache table.
//
// Table layout:
//   FeedImageCache(id TEXT PRIMARY KEY NOT NULL, description TEXT,
//                  location TEXT, url TEXT, timestamp REAL)
//
// Rows are read back in insertion (rowid) order. The timestamp is stored on
// every row; the first row's value is the snapshot timestamp.
class FeedDatabase {
public:
    FeedDatabase();
    ~FeedDatabase();
    FeedDatabase(FeedDatabase&&) noexcept;
    FeedDatabase& operator=(FeedDatabase&&) noexcept;

    // Database lifecycle
    Status open(const std::string& db_path,
                const DatabaseOptions& options = DatabaseOptions{});
    void close();
    bool is_open() const;
    const std::string& path() const;
    // $HOME/.feedstore/feed_cache.sqlite, under /tmp when HOME is unset
    static std::string default_path();

    Status prepare_schema();

    // Snapshot rows
    Result<std::optional<CachedFeed>> read_all();
    Status delete_all();
    Status insert_all(const std::vector<FeedImage>& feed, Timestamp timestamp);
    Result<int64_t> count();

    // Transactions
    Status begin_transaction();
    Status commit();
    Status rollback();
    bool in_transaction() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

// Scoped BEGIN IMMEDIATE; rolls back on destruction unless committed.
class Transaction {
    struct PrivateTag {};

public:
    static Result<std::unique_ptr<Transaction>> begin(FeedDatabase& db);
    Transaction(PrivateTag, FeedDatabase& db) : db_(db) {}
    ~Transaction();

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    Status commit();
    Status rollback();

private:
    FeedDatabase& db_;
    bool finished_ = false;
};

} // namespace feedstore
