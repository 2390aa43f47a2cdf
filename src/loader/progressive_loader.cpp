#include <mediacache/loader/progressive_loader.h>

#include <mediacache/cache/durable_cache.h>
#include <mediacache/common/format.h>
#include <mediacache/loader/reconciler.h>
#include <mediacache/media/mime_types.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <utility>

namespace mediacache::loader {

const char* fetchStateName(FetchState state) {
    switch (state) {
        case FetchState::Idle:
            return "idle";
        case FetchState::Fetching:
            return "fetching";
        case FetchState::Completed:
            return "completed";
        case FetchState::Failed:
            return "failed";
    }
    return "unknown";
}

ProgressiveLoader::ProgressiveLoader(std::string sourceUrl, LoaderOptions options,
                                     LoaderEvents events)
    : sourceUrl_(std::move(sourceUrl)), options_(std::move(options)), events_(std::move(events)) {
    handle_.sourceUrl = sourceUrl_;
    handle_.kind = options_.kind;
}

ProgressiveLoader::~ProgressiveLoader() {
    suppressNotifications_.store(true, std::memory_order_release);
    {
        std::lock_guard lock(mutex_);
        if (destroyedFlag_ && notifyThread_ == std::this_thread::get_id()) {
            *destroyedFlag_ = true;
        }
    }
    cancelFetch();
    if (worker_.joinable()) {
        // Only left here when destroyed from the fetch worker itself.
        worker_.detach();
    }
}

RequestId ProgressiveLoader::submit(std::uint64_t offset, std::uint64_t length, RangeSink sink,
                                    bool wantsContentInformation) {
    std::lock_guard lock(mutex_);
    const auto id = ledger_.add(offset, length, std::move(sink), wantsContentInformation);

    if (state_ == FetchState::Failed) {
        auto* request = ledger_.find(id);
        auto onFailed = std::move(request->sink.onFailed);
        ledger_.remove(id);
        if (onFailed) {
            onFailed(error_.value_or(Error{ErrorCode::InvalidState, "fetch failed"}));
        }
        return id;
    }

    reconcileLocked();
    if (state_ == FetchState::Idle) {
        startFetchLocked();
    }
    return id;
}

bool ProgressiveLoader::cancel(RequestId id) {
    std::lock_guard lock(mutex_);
    return ledger_.remove(id);
}

void ProgressiveLoader::startFetch() {
    std::lock_guard lock(mutex_);
    startFetchLocked();
}

void ProgressiveLoader::startFetchLocked() {
    if (state_ != FetchState::Idle || preSupplied_ || cancelled_) {
        return;
    }
    state_ = FetchState::Fetching;
    spdlog::debug("ProgressiveLoader: starting fetch of {}", sourceUrl_);
    worker_ = std::jthread([this](std::stop_token token) { run(token); });
}

void ProgressiveLoader::run(std::stop_token token) {
    auto transport = options_.transport ? options_.transport : makeCurlTransport();

    TransportCallbacks callbacks;
    callbacks.onResponse = [this](const ResponseMetadata& meta) { onResponseHeaders(meta); };
    callbacks.onData = [this, &token](ByteSpan chunk) {
        if (token.stop_requested()) {
            return false;
        }
        onBytesReceived(chunk);
        return true;
    };

    auto result = transport->stream(TransportRequest{sourceUrl_}, callbacks, token);
    if (result) {
        onComplete(std::nullopt);
    } else {
        onComplete(result.error());
    }
}

void ProgressiveLoader::reconcileLocked() {
    const auto mode =
        state_ == FetchState::Completed ? ReconcileMode::Completed : ReconcileMode::Streaming;
    reconcile(buffer_, ledger_, mode);
}

void ProgressiveLoader::failPendingLocked(const Error& error) {
    for (auto& request : ledger_.drain()) {
        if (request.sink.onFailed) {
            request.sink.onFailed(error);
        }
    }
}

void ProgressiveLoader::onResponseHeaders(const ResponseMetadata& meta) {
    std::lock_guard lock(mutex_);
    if (state_ != FetchState::Fetching) {
        return;
    }
    if (auto r = buffer_.reset(); !r) {
        spdlog::warn("ProgressiveLoader: {}: {}", sourceUrl_, r.error().message);
        return;
    }
    buffer_.setMetadata(meta);
    handle_.contentType = meta.contentType;
    handle_.totalLength = meta.expectedLength;
    spdlog::debug("ProgressiveLoader: {} response type={} length={}", sourceUrl_,
                  meta.contentType.value_or("?"),
                  meta.expectedLength ? std::to_string(*meta.expectedLength) : "?");
    reconcileLocked();
}

void ProgressiveLoader::onBytesReceived(ByteSpan chunk) {
    ProgressUpdate update;
    {
        std::lock_guard lock(mutex_);
        if (state_ != FetchState::Fetching) {
            return;
        }
        if (auto r = buffer_.append(chunk); !r) {
            spdlog::warn("ProgressiveLoader: {}: {}", sourceUrl_, r.error().message);
            return;
        }
        reconcileLocked();
        update.bytesReceived = buffer_.size();
        update.totalBytes = handle_.totalLength;
    }

    if (update.totalBytes && *update.totalBytes > 0) {
        update.fraction = std::min(1.0, static_cast<double>(update.bytesReceived) /
                                            static_cast<double>(*update.totalBytes));
        update.humanReadable = formatProgress(*update.fraction, *update.totalBytes);
    } else {
        update.humanReadable = formatByteCount(update.bytesReceived) + " received";
    }

    if (events_.onProgress && shouldNotify()) {
        events_.onProgress(update);
    }
}

void ProgressiveLoader::onComplete(std::optional<Error> error) {
    bool destroyed = false;
    {
        std::lock_guard lock(mutex_);
        if (state_ == FetchState::Completed || state_ == FetchState::Failed) {
            return;
        }
        if (state_ == FetchState::Idle && !error) {
            return;
        }

        if (error) {
            state_ = FetchState::Failed;
            error_ = *error;
            // Reads that the buffered bytes already cover still succeed.
            reconcile(buffer_, ledger_, ReconcileMode::Streaming);
            failPendingLocked(*error);
            buffer_.freeze();
        } else {
            state_ = FetchState::Completed;
            buffer_.freeze();
            if (!handle_.totalLength) {
                handle_.totalLength = buffer_.size();
            }
            reconcile(buffer_, ledger_, ReconcileMode::Completed);
        }
        destroyedFlag_ = &destroyed;
        notifyThread_ = std::this_thread::get_id();
    }

    // The buffer is frozen from here on, so it can be read without the lock.
    if (error) {
        if (error->code == ErrorCode::OperationCancelled) {
            spdlog::debug("ProgressiveLoader: fetch of {} cancelled", sourceUrl_);
        } else {
            spdlog::warn("ProgressiveLoader: fetch of {} failed: {} ({})", sourceUrl_,
                         error->message, error->code);
        }
        if (auto onFailed = events_.onFailed; onFailed && shouldNotify()) {
            onFailed(*error);
        }
    } else {
        spdlog::debug("ProgressiveLoader: fetch of {} completed ({})", sourceUrl_,
                      formatByteCount(buffer_.size()));
        if (options_.cachePolicy == CachePolicy::Allow) {
            commitToCache();
        }
        if (auto onCompleted = events_.onCompleted; onCompleted && shouldNotify()) {
            onCompleted(buffer_.bytes());
        }
    }
    if (destroyed) {
        // The observer destroyed the loader; nothing of it is left to touch.
        return;
    }
    markFinished();
}

void ProgressiveLoader::commitToCache() {
    auto cache = options_.cache ? options_.cache : cache::DurableCache::shared();
    if (!cache) {
        spdlog::debug("ProgressiveLoader: no durable cache, {} not committed", sourceUrl_);
        return;
    }

    const auto& bytes = buffer_.bytes();
    const auto source = cache::decomposeSource(sourceUrl_);
    auto mimeType = media::mimeTypeForExtension(source.extension);
    if (mimeType == media::kDefaultMimeType && handle_.contentType) {
        mimeType = *handle_.contentType;
    }

    cache->put(cache::CacheKey::original(sourceUrl_, options_.kind),
               cache::CachedPayload{bytes, mimeType, source.extension});

    if (!options_.targetSize || !options_.targetSize->valid()) {
        return;
    }
    auto scratch = cache->fileStore().createScratchFile(bytes, source.extension);
    if (!scratch) {
        spdlog::warn("ProgressiveLoader: cannot stage {} for resizing: {}", sourceUrl_,
                     scratch.error().message);
        return;
    }
    if (options_.kind == cache::ResourceKind::Image) {
        if (!cache->storeResizedImage(sourceUrl_, *options_.targetSize, scratch.value())) {
            spdlog::debug("ProgressiveLoader: no resized variant for {}", sourceUrl_);
        }
    } else {
        cache->storeResizedVideo(sourceUrl_, *options_.targetSize, scratch.value());
    }
}

Result<void> ProgressiveLoader::setMediaData(ByteVector bytes, std::string mimeType) {
    {
        std::lock_guard lock(mutex_);
        if (state_ != FetchState::Idle) {
            return Error{ErrorCode::InvalidState,
                         fmt_format("media data supplied while {}", fetchStateName(state_))};
        }
        preSupplied_ = true;
        ResponseMetadata meta{mimeType, static_cast<std::uint64_t>(bytes.size())};
        handle_.contentType = meta.contentType;
        handle_.totalLength = meta.expectedLength;
        buffer_.adopt(std::move(bytes), std::move(meta));
        state_ = FetchState::Completed;
        reconcileLocked();
    }
    markFinished();
    return {};
}

void ProgressiveLoader::cancelFetch() {
    std::jthread worker;
    {
        std::lock_guard lock(mutex_);
        cancelled_ = true;
        if (worker_.joinable() && worker_.get_id() == std::this_thread::get_id()) {
            // Called from a callback on the fetch worker; it stops on return.
            worker_.request_stop();
        } else {
            worker = std::move(worker_);
        }
    }
    if (worker.joinable()) {
        worker.request_stop();
        worker.join();
    }
    onComplete(Error{ErrorCode::OperationCancelled, "fetch cancelled"});
}

FetchState ProgressiveLoader::wait() {
    std::unique_lock lock(mutex_);
    finishedCv_.wait(lock, [this] { return finished_; });
    return state_;
}

std::optional<FetchState> ProgressiveLoader::waitFor(std::chrono::milliseconds timeout) {
    std::unique_lock lock(mutex_);
    if (!finishedCv_.wait_for(lock, timeout, [this] { return finished_; })) {
        return std::nullopt;
    }
    return state_;
}

FetchState ProgressiveLoader::state() const {
    std::lock_guard lock(mutex_);
    return state_;
}

ResourceHandle ProgressiveLoader::handle() const {
    std::lock_guard lock(mutex_);
    return handle_;
}

std::uint64_t ProgressiveLoader::bufferedBytes() const {
    std::lock_guard lock(mutex_);
    return buffer_.size();
}

std::size_t ProgressiveLoader::pendingRequestCount() const {
    std::lock_guard lock(mutex_);
    return ledger_.size();
}

std::optional<Error> ProgressiveLoader::lastError() const {
    std::lock_guard lock(mutex_);
    return error_;
}

bool ProgressiveLoader::shouldNotify() const {
    if (suppressNotifications_.load(std::memory_order_acquire)) {
        return false;
    }
    return !options_.owner || !options_.owner->expired();
}

void ProgressiveLoader::markFinished() {
    // Notified under the lock: a woken waiter may destroy the loader.
    std::lock_guard lock(mutex_);
    destroyedFlag_ = nullptr;
    finished_ = true;
    finishedCv_.notify_all();
}

} // namespace mediacache::loader
