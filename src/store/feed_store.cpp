#include <feedstore/feed_store.hpp>
#include <feedstore/log.hpp>

namespace feedstore {

// ---------------------------------------------------------------------------
// RetrieveResult
// ---------------------------------------------------------------------------

RetrieveResult RetrieveResult::empty() {
    return RetrieveResult{};
}

RetrieveResult RetrieveResult::found(CachedFeed cache) {
    RetrieveResult r;
    r.kind = Found;
    r.cache = std::move(cache);
    return r;
}

RetrieveResult RetrieveResult::failure(FeedStoreError error) {
    RetrieveResult r;
    r.kind = Failure;
    r.error = std::move(error);
    return r;
}

// ---------------------------------------------------------------------------
// Lifecycle
// ---------------------------------------------------------------------------

FeedStore::FeedStore(PrivateTag, StoreConfig config, FeedDatabase db)
    : config_(std::move(config)),
      db_(std::move(db)),
      queue_("feedstore:" + config_.path) {}

FeedStore::~FeedStore() {
    // Run everything already queued so each completion fires exactly once
    queue_.shutdown();
    db_.close();
}

Result<std::unique_ptr<FeedStore>> FeedStore::create(const StoreConfig& requested) {
    StoreConfig config = requested;
    if (config.path.empty()) {
        config.path = FeedDatabase::default_path();
        config.database.create_directories = true;
    }

    FeedDatabase db;
    FEEDSTORE_TRY(db.open(config.path, config.database));
    FEEDSTORE_TRY(db.prepare_schema());

    log::debug("feed store ready: %s (transactional insert %s)",
               config.path.c_str(), config.transactional_insert ? "on" : "off");
    return Result<std::unique_ptr<FeedStore>>::ok(
        std::make_unique<FeedStore>(PrivateTag{}, std::move(config), std::move(db)));
}

// ---------------------------------------------------------------------------
// Operations (run on the queue's worker thread)
// ---------------------------------------------------------------------------

RetrieveResult FeedStore::perform_retrieve() {
    auto r = db_.read_all();
    if (r.is_err()) {
        log::warn("feed cache retrieve failed: %s", r.error().message.c_str());
        return RetrieveResult::failure(std::move(r).error());
    }
    auto& cache = r.value();
    if (!cache.has_value() || cache->feed.empty()) {
        return RetrieveResult::empty();
    }
    return RetrieveResult::found(std::move(*cache));
}

Status FeedStore::perform_delete() {
    return db_.delete_all();
}

Status FeedStore::perform_insert(const std::vector<FeedImage>& feed, Timestamp timestamp) {
    if (!config_.transactional_insert) {
        // A failure part-way through leaves the rows written so far
        FEEDSTORE_TRY(perform_delete());
        return db_.insert_all(feed, timestamp);
    }

    auto tx = Transaction::begin(db_);
    if (tx.is_err()) return std::move(tx).error();

    // Returning early destroys tx, which rolls back the delete as well
    FEEDSTORE_TRY(perform_delete());
    FEEDSTORE_TRY(db_.insert_all(feed, timestamp));
    return tx.value()->commit();
}

static CompletionError to_completion_error(Status status, const char* what) {
    if (status.is_ok()) return std::nullopt;
    log::warn("feed cache %s failed: %s", what, status.error().message.c_str());
    return std::move(status).error();
}

// ---------------------------------------------------------------------------
// Completion API
// ---------------------------------------------------------------------------

void FeedStore::retrieve(RetrieveCompletion completion) {
    queue_.submit([this, completion = std::move(completion)] {
        completion(perform_retrieve());
    });
}

void FeedStore::insert(std::vector<FeedImage> feed, Timestamp timestamp,
                       InsertionCompletion completion) {
    queue_.submit([this, feed = std::move(feed), timestamp,
                   completion = std::move(completion)] {
        completion(to_completion_error(perform_insert(feed, timestamp), "insert"));
    });
}

void FeedStore::delete_cached_feed(DeletionCompletion completion) {
    queue_.submit([this, completion = std::move(completion)] {
        completion(to_completion_error(perform_delete(), "delete"));
    });
}

// ---------------------------------------------------------------------------
// Future API
// ---------------------------------------------------------------------------

std::future<RetrieveResult> FeedStore::retrieve() {
    auto promise = std::make_shared<std::promise<RetrieveResult>>();
    auto future = promise->get_future();
    retrieve([promise](RetrieveResult r) { promise->set_value(std::move(r)); });
    return future;
}

std::future<CompletionError> FeedStore::insert(std::vector<FeedImage> feed,
                                               Timestamp timestamp) {
    auto promise = std::make_shared<std::promise<CompletionError>>();
    auto future = promise->get_future();
    insert(std::move(feed), timestamp,
           [promise](CompletionError e) { promise->set_value(std::move(e)); });
    return future;
}

std::future<CompletionError> FeedStore::delete_cached_feed() {
    auto promise = std::make_shared<std::promise<CompletionError>>();
    auto future = promise->get_future();
    delete_cached_feed([promise](CompletionError e) { promise->set_value(std::move(e)); });
    return future;
}

} // namespace feedstore
