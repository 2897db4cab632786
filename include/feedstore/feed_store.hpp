#pragma once

#include <feedstore/config.hpp>
#include <feedstore/feed_database.hpp>
#include <feedstore/feed_image.hpp>
#include <feedstore/result.hpp>
#include <feedstore/serial_queue.hpp>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <vector>

namespace feedstore {

struct RetrieveResult {
    enum Kind { Empty, Found, Failure };

    Kind kind = Empty;
    CachedFeed cache;
    FeedStoreError error;

    static RetrieveResult empty();
    static RetrieveResult found(CachedFeed cache);
    static RetrieveResult failure(FeedStoreError error);

    bool is_empty() const { return kind == Empty; }
    bool is_found() const { return kind == Found; }
    bool is_failure() const { return kind == Failure; }
};

// nullopt on success
using CompletionError = std::optional<FeedStoreError>;

using RetrieveCompletion = std::function<void(RetrieveResult)>;
using InsertionCompletion = std::function<void(CompletionError)>;
using DeletionCompletion = std::function<void(CompletionError)>;

// Feed cache backed by one FeedDatabase connection.
//
// Every operation is queued on the store's SerialQueue and runs in
// submission order; completions are invoked exactly once, on the queue's
// worker thread, after the operation has taken effect. Destroying the store
// runs the operations already queued, then closes the connection. A
// completion may destroy the store that invoked it; the operations still
// queued behind it run before that destructor returns.
class FeedStore {
    struct PrivateTag {};

public:
    // An empty config.path selects FeedDatabase::default_path() and creates
    // its directory.
    static Result<std::unique_ptr<FeedStore>> create(const StoreConfig& config);
    FeedStore(PrivateTag, StoreConfig config, FeedDatabase db);
    ~FeedStore();

    FeedStore(const FeedStore&) = delete;
    FeedStore& operator=(const FeedStore&) = delete;

    void retrieve(RetrieveCompletion completion);
    void insert(std::vector<FeedImage> feed, Timestamp timestamp,
                InsertionCompletion completion);
    void delete_cached_feed(DeletionCompletion completion);

    std::future<RetrieveResult> retrieve();
    std::future<CompletionError> insert(std::vector<FeedImage> feed, Timestamp timestamp);
    std::future<CompletionError> delete_cached_feed();

    const StoreConfig& config() const { return config_; }

private:
    RetrieveResult perform_retrieve();
    Status perform_delete();
    Status perform_insert(const std::vector<FeedImage>& feed, Timestamp timestamp);

    StoreConfig config_;
    // Declared before queue_: the worker must be joined before the connection closes.
    FeedDatabase db_;
    SerialQueue queue_;
};

} // namespace feedstore
