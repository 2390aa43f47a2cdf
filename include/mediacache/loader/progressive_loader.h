#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include <mediacache/cache/cache_key.h>
#include <mediacache/core/types.h>
#include <mediacache/loader/buffer_store.h>
#include <mediacache/loader/range_request.h>
#include <mediacache/loader/transport.h>

namespace mediacache::cache {
class DurableCache;
}

namespace mediacache::loader {

enum class FetchState { Idle, Fetching, Completed, Failed };

const char* fetchStateName(FetchState state);

/// Whether a successful fetch is committed to the durable cache.
enum class CachePolicy { Allow, NotAllowed };

/**
 * The resource a loader serves. Content type and total length stay unknown
 * until the first final response (or are synthesized by setMediaData).
 */
struct ResourceHandle {
    std::string sourceUrl;
    cache::ResourceKind kind{cache::ResourceKind::Video};
    std::optional<std::string> contentType;
    std::optional<std::uint64_t> totalLength;
};

struct ProgressUpdate {
    std::uint64_t bytesReceived{0};
    std::optional<std::uint64_t> totalBytes;
    std::optional<double> fraction; ///< omitted while the total length is unknown
    std::string humanReadable;      ///< "12.5% of 3.4 MB" or "812 KB received"
};

/**
 * Observer closures. Invoked outside the loader lock, on the fetch worker, in
 * order: any number of onProgress, then exactly one of onCompleted/onFailed.
 * onFailed runs on the calling thread when cancelFetch ends the fetch.
 *
 * onCompleted and onFailed may destroy the loader; the payload reference
 * passed to onCompleted dies with it. onProgress must not.
 */
struct LoaderEvents {
    std::function<void(const ProgressUpdate&)> onProgress;
    std::function<void(const ByteVector&)> onCompleted;
    std::function<void(const Error&)> onFailed;
};

struct LoaderOptions {
    cache::ResourceKind kind{cache::ResourceKind::Video};
    CachePolicy cachePolicy{CachePolicy::Allow};
    /// When set, a resized variant is committed alongside the original.
    std::optional<cache::RenderSize> targetSize;
    /// Defaults to the libcurl transport.
    std::shared_ptr<ITransport> transport;
    /// Defaults to DurableCache::shared(); no commit happens if neither is set.
    std::shared_ptr<cache::DurableCache> cache;
    /// Non-owning back-reference; notifications stop once it expires.
    std::optional<std::weak_ptr<void>> owner;
};

/**
 * Progressive Download Coordinator for one resource.
 *
 * Owns exactly one fetch: Idle -> Fetching -> {Completed, Failed}, terminal
 * states are sticky. Consumers submit byte-range reads at any time; each one
 * is served from the growing buffer as soon as the bytes exist, without
 * blocking the caller. The first submit starts the fetch.
 *
 * Every ledger and buffer mutation happens under one mutex, and range sinks
 * are called while it is held. Header, data and completion events arrive on
 * the fetch worker (a std::jthread) in order.
 */
class ProgressiveLoader {
public:
    explicit ProgressiveLoader(std::string sourceUrl, LoaderOptions options = {},
                               LoaderEvents events = {});

    /// Cancels the fetch without notifying the observer.
    ~ProgressiveLoader();

    ProgressiveLoader(const ProgressiveLoader&) = delete;
    ProgressiveLoader& operator=(const ProgressiveLoader&) = delete;

    /**
     * Register a range read and run a reconciliation pass. Ranges that are
     * already buffered finish before submit returns. After a failure the sink
     * receives onFailed immediately.
     */
    RequestId submit(std::uint64_t offset, std::uint64_t length, RangeSink sink,
                     bool wantsContentInformation = false);

    /// Drop a pending read. Idempotent; returns whether anything was removed.
    bool cancel(RequestId id);

    /// Start the fetch worker. No-op unless Idle and not pre-supplied.
    void startFetch();

    // Transport events. The fetch worker calls these; they are public so any
    // byte source can drive the loader. Ignored unless Fetching.
    void onResponseHeaders(const ResponseMetadata& meta);
    void onBytesReceived(ByteSpan chunk);
    void onComplete(std::optional<Error> error);

    /**
     * Pre-supplied mode: the payload is already available. The loader becomes
     * Completed with metadata synthesized from mimeType and the payload size.
     * No network, no cache commit, no observer notification. InvalidState
     * unless Idle.
     */
    Result<void> setMediaData(ByteVector bytes, std::string mimeType);

    /**
     * Stop the fetch and fail the loader with OperationCancelled. Safe to call
     * from any thread, concurrently with submit; once called no fetch starts.
     */
    void cancelFetch();

    /// Block until the loader is terminal and its observer has been notified.
    FetchState wait();
    std::optional<FetchState> waitFor(std::chrono::milliseconds timeout);

    FetchState state() const;
    ResourceHandle handle() const;
    std::uint64_t bufferedBytes() const;
    std::size_t pendingRequestCount() const;
    std::optional<Error> lastError() const;

private:
    void startFetchLocked();
    void run(std::stop_token token);
    void reconcileLocked();
    void failPendingLocked(const Error& error);
    void commitToCache();
    bool shouldNotify() const;
    void markFinished();

    const std::string sourceUrl_;
    LoaderOptions options_;
    LoaderEvents events_;

    mutable std::mutex mutex_;
    std::condition_variable finishedCv_;
    FetchState state_{FetchState::Idle};
    ResourceHandle handle_;
    BufferStore buffer_;
    RangeRequestLedger ledger_;
    std::optional<Error> error_;
    bool preSupplied_{false};
    bool cancelled_{false};
    bool finished_{false};
    // Set while a terminal notification runs; the destructor flags it when
    // called from inside that notification.
    bool* destroyedFlag_{nullptr};
    std::thread::id notifyThread_;
    std::atomic<bool> suppressNotifications_{false};

    std::jthread worker_;
};

} // namespace mediacache::loader
