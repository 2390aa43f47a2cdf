#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>

#include <mediacache/cache/durable_cache.h>
#include <mediacache/loader/progressive_loader.h>
#include <mediacache/media/image_codec.h>

#include "../../common/test_helpers.h"
#include "scripted_transport.h"

using namespace mediacache;
using namespace mediacache::loader;
using namespace std::chrono_literals;
using mediacache::tests::make_payload;
using mediacache::tests::ScriptedTransport;

namespace {

constexpr const char* kVideoUrl = "https://media.example.com/clips/Intro.mp4";

// Everything one range request received. Sinks run on the fetch worker; the
// test reads after ScriptedTransport::waitIdle() or ProgressiveLoader::wait().
struct SinkLog {
    std::vector<std::size_t> deliveries;
    ByteVector received;
    std::optional<ContentInformation> info;
    int finished{0};
    std::vector<Error> failures;

    RangeSink sink() {
        RangeSink s;
        s.onContentInformation = [this](const ContentInformation& i) { info = i; };
        s.onData = [this](ByteSpan bytes) {
            deliveries.push_back(bytes.size());
            received.insert(received.end(), bytes.begin(), bytes.end());
        };
        s.onFinished = [this] { ++finished; };
        s.onFailed = [this](const Error& e) { failures.push_back(e); };
        return s;
    }
};

struct EventLog {
    std::mutex mutex;
    std::vector<ProgressUpdate> progress;
    std::optional<std::size_t> completedBytes;
    std::optional<Error> failure;

    LoaderEvents events() {
        LoaderEvents e;
        e.onProgress = [this](const ProgressUpdate& u) {
            std::lock_guard lock(mutex);
            progress.push_back(u);
        };
        e.onCompleted = [this](const ByteVector& bytes) {
            std::lock_guard lock(mutex);
            completedBytes = bytes.size();
        };
        e.onFailed = [this](const Error& err) {
            std::lock_guard lock(mutex);
            failure = err;
        };
        return e;
    }
};

ByteSpan range(const ByteVector& bytes, std::size_t offset, std::size_t length) {
    return ByteSpan{bytes}.subspan(offset, length);
}

} // namespace

class ProgressiveLoaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        transport_ = std::make_shared<ScriptedTransport>();
        payload_ = make_payload(350);
    }

    LoaderOptions options(CachePolicy policy = CachePolicy::NotAllowed) {
        LoaderOptions o;
        o.kind = cache::ResourceKind::Video;
        o.cachePolicy = policy;
        o.transport = transport_;
        return o;
    }

    void sendRange(std::size_t offset, std::size_t length) {
        transport_->send(toByteVector(range(payload_, offset, length)));
    }

    std::shared_ptr<ScriptedTransport> transport_;
    ByteVector payload_;
};

// ===== Fetch lifecycle =====

TEST_F(ProgressiveLoaderTest, StartsIdleWithUnknownMetadata) {
    ProgressiveLoader loader(kVideoUrl, options());
    EXPECT_EQ(loader.state(), FetchState::Idle);
    auto handle = loader.handle();
    EXPECT_EQ(handle.sourceUrl, kVideoUrl);
    EXPECT_FALSE(handle.contentType.has_value());
    EXPECT_FALSE(handle.totalLength.has_value());
    EXPECT_EQ(transport_->streamCalls(), 0u);
}

TEST_F(ProgressiveLoaderTest, ChunksAreDeliveredAsTheyArrive) {
    ProgressiveLoader loader(kVideoUrl, options());
    SinkLog log;
    loader.submit(0, 300, log.sink());
    EXPECT_EQ(loader.state(), FetchState::Fetching);

    transport_->respond("video/mp4", 350);
    sendRange(0, 100);
    ASSERT_TRUE(transport_->waitIdle());
    EXPECT_EQ(log.deliveries, std::vector<std::size_t>{100});
    EXPECT_EQ(loader.pendingRequestCount(), 1u);

    sendRange(100, 50);
    ASSERT_TRUE(transport_->waitIdle());
    sendRange(150, 200);
    ASSERT_TRUE(transport_->waitIdle());

    EXPECT_EQ(log.deliveries, (std::vector<std::size_t>{100, 50, 150}));
    EXPECT_EQ(log.received, ByteVector(payload_.begin(), payload_.begin() + 300));
    EXPECT_EQ(log.finished, 1);
    EXPECT_EQ(loader.pendingRequestCount(), 0u);

    transport_->finish();
    ASSERT_EQ(loader.waitFor(5s), FetchState::Completed);
}

TEST_F(ProgressiveLoaderTest, OverlappingRequestsShareOneFetch) {
    ProgressiveLoader loader(kVideoUrl, options());
    SinkLog first;
    SinkLog second;
    loader.submit(0, 200, first.sink());
    loader.submit(100, 250, second.sink());
    loader.startFetch();

    transport_->respond("video/mp4", 350);
    sendRange(0, 120);
    sendRange(120, 230);
    transport_->finish();
    ASSERT_EQ(loader.waitFor(5s), FetchState::Completed);

    EXPECT_EQ(transport_->streamCalls(), 1u);
    EXPECT_EQ(transport_->lastUrl(), kVideoUrl);
    EXPECT_EQ(first.received, ByteVector(payload_.begin(), payload_.begin() + 200));
    EXPECT_EQ(second.received, ByteVector(payload_.begin() + 100, payload_.end()));
    EXPECT_EQ(first.finished, 1);
    EXPECT_EQ(second.finished, 1);
}

TEST_F(ProgressiveLoaderTest, BufferedRangeCompletesInsideSubmit) {
    ProgressiveLoader loader(kVideoUrl, options());
    SinkLog warmup;
    loader.submit(0, 10, warmup.sink());
    transport_->respond("video/mp4", 350);
    sendRange(0, 200);
    ASSERT_TRUE(transport_->waitIdle());

    SinkLog late;
    loader.submit(50, 100, late.sink());
    EXPECT_EQ(late.received, ByteVector(payload_.begin() + 50, payload_.begin() + 150));
    EXPECT_EQ(late.finished, 1);

    loader.cancelFetch();
}

TEST_F(ProgressiveLoaderTest, OpenEndedRequestFinishesOnCompletion) {
    ProgressiveLoader loader(kVideoUrl, options());
    SinkLog log;
    loader.submit(0, kToEndOfResource, log.sink(), /*wantsContentInformation=*/true);

    transport_->respond(std::nullopt, std::nullopt);
    sendRange(0, 350);
    ASSERT_TRUE(transport_->waitIdle());
    EXPECT_EQ(log.finished, 0);

    transport_->finish();
    ASSERT_EQ(loader.waitFor(5s), FetchState::Completed);
    EXPECT_EQ(log.received, payload_);
    EXPECT_EQ(log.finished, 1);
    ASSERT_TRUE(log.info.has_value());
    EXPECT_FALSE(log.info->contentLength.has_value());
    EXPECT_EQ(loader.handle().totalLength, 350u);
}

TEST_F(ProgressiveLoaderTest, RepeatedResponseResetsTheBuffer) {
    ProgressiveLoader loader(kVideoUrl, options());
    loader.startFetch();
    transport_->respond("text/html", 20);
    sendRange(0, 20);
    transport_->respond("video/mp4", 350);
    sendRange(0, 350);
    transport_->finish();
    ASSERT_EQ(loader.waitFor(5s), FetchState::Completed);

    EXPECT_EQ(loader.bufferedBytes(), 350u);
    EXPECT_EQ(loader.handle().contentType, "video/mp4");
}

TEST_F(ProgressiveLoaderTest, StartFetchTwiceIsANoOp) {
    ProgressiveLoader loader(kVideoUrl, options());
    loader.startFetch();
    loader.startFetch();
    transport_->finish();
    ASSERT_EQ(loader.waitFor(5s), FetchState::Completed);
    loader.startFetch();
    EXPECT_EQ(transport_->streamCalls(), 1u);
    EXPECT_EQ(loader.state(), FetchState::Completed);
}

// ===== Failure =====

TEST_F(ProgressiveLoaderTest, FailureFinishesCoveredReadsAndFailsTheRest) {
    EventLog events;
    ProgressiveLoader loader(kVideoUrl, options(), events.events());
    SinkLog covered;
    SinkLog uncovered;
    loader.submit(0, 50, covered.sink());
    loader.submit(0, 300, uncovered.sink());

    transport_->respond("video/mp4", 350);
    sendRange(0, 100);
    transport_->fail(Error{ErrorCode::NetworkError, "connection reset"});
    ASSERT_EQ(loader.waitFor(5s), FetchState::Failed);

    EXPECT_EQ(covered.finished, 1);
    EXPECT_TRUE(covered.failures.empty());

    EXPECT_EQ(uncovered.received.size(), 100u);
    EXPECT_EQ(uncovered.finished, 0);
    ASSERT_EQ(uncovered.failures.size(), 1u);
    EXPECT_EQ(uncovered.failures[0].code, ErrorCode::NetworkError);

    std::lock_guard lock(events.mutex);
    ASSERT_TRUE(events.failure.has_value());
    EXPECT_EQ(events.failure->code, ErrorCode::NetworkError);
    EXPECT_FALSE(events.completedBytes.has_value());
}

TEST_F(ProgressiveLoaderTest, SubmitAfterFailureFailsImmediately) {
    ProgressiveLoader loader(kVideoUrl, options());
    loader.startFetch();
    transport_->fail(Error{ErrorCode::ServerError, "HTTP error 404"});
    ASSERT_EQ(loader.waitFor(5s), FetchState::Failed);

    SinkLog log;
    loader.submit(0, 10, log.sink());
    ASSERT_EQ(log.failures.size(), 1u);
    EXPECT_EQ(log.failures[0].code, ErrorCode::ServerError);
    EXPECT_EQ(loader.pendingRequestCount(), 0u);
    EXPECT_EQ(loader.state(), FetchState::Failed);
    EXPECT_EQ(transport_->streamCalls(), 1u);
}

TEST_F(ProgressiveLoaderTest, CancelFetchFailsPendingReads) {
    EventLog events;
    ProgressiveLoader loader(kVideoUrl, options(), events.events());
    SinkLog log;
    loader.submit(0, 300, log.sink());
    transport_->respond("video/mp4", 350);
    sendRange(0, 100);
    ASSERT_TRUE(transport_->waitIdle());

    loader.cancelFetch();

    EXPECT_EQ(loader.state(), FetchState::Failed);
    ASSERT_EQ(log.failures.size(), 1u);
    EXPECT_EQ(log.failures[0].code, ErrorCode::OperationCancelled);
    ASSERT_TRUE(loader.lastError().has_value());
    EXPECT_EQ(loader.lastError()->code, ErrorCode::OperationCancelled);

    std::lock_guard lock(events.mutex);
    ASSERT_TRUE(events.failure.has_value());
    EXPECT_EQ(events.failure->code, ErrorCode::OperationCancelled);
}

TEST_F(ProgressiveLoaderTest, CancelFetchRacingSubmitFailsTheReadExactlyOnce) {
    for (int i = 0; i < 50; ++i) {
        ProgressiveLoader loader(kVideoUrl, options());
        std::atomic<int> failures{0};
        std::atomic<int> finished{0};
        RangeSink sink;
        sink.onFailed = [&failures](const Error& e) {
            EXPECT_EQ(e.code, ErrorCode::OperationCancelled);
            ++failures;
        };
        sink.onFinished = [&finished] { ++finished; };

        std::thread consumer([&] { loader.submit(0, 10, sink); });
        std::thread owner([&] { loader.cancelFetch(); });
        consumer.join();
        owner.join();

        ASSERT_EQ(loader.waitFor(5s), FetchState::Failed) << "iteration " << i;
        EXPECT_EQ(failures.load(), 1) << "iteration " << i;
        EXPECT_EQ(finished.load(), 0);
        EXPECT_EQ(loader.pendingRequestCount(), 0u);

        // No fetch may start once cancelled.
        loader.startFetch();
        EXPECT_EQ(loader.state(), FetchState::Failed);
    }
}

TEST_F(ProgressiveLoaderTest, ConcurrentCancelFetchStopsTheWorkerOnce) {
    EventLog events;
    ProgressiveLoader loader(kVideoUrl, options(), events.events());
    loader.startFetch();
    transport_->respond("video/mp4", 350);
    sendRange(0, 100);
    ASSERT_TRUE(transport_->waitIdle());

    std::thread first([&] { loader.cancelFetch(); });
    std::thread second([&] { loader.cancelFetch(); });
    first.join();
    second.join();

    EXPECT_EQ(loader.state(), FetchState::Failed);
    EXPECT_EQ(loader.bufferedBytes(), 100u);
    std::lock_guard lock(events.mutex);
    ASSERT_TRUE(events.failure.has_value());
    EXPECT_EQ(events.failure->code, ErrorCode::OperationCancelled);
    EXPECT_FALSE(events.completedBytes.has_value());
}

TEST_F(ProgressiveLoaderTest, CancelledRequestGetsNoFurtherBytes) {
    ProgressiveLoader loader(kVideoUrl, options());
    SinkLog log;
    auto id = loader.submit(0, 300, log.sink());
    transport_->respond("video/mp4", 350);
    sendRange(0, 100);
    ASSERT_TRUE(transport_->waitIdle());

    EXPECT_TRUE(loader.cancel(id));
    EXPECT_FALSE(loader.cancel(id));

    sendRange(100, 250);
    transport_->finish();
    ASSERT_EQ(loader.waitFor(5s), FetchState::Completed);
    EXPECT_EQ(log.received.size(), 100u);
    EXPECT_EQ(log.finished, 0);
    EXPECT_TRUE(log.failures.empty());
}

// ===== Observer =====

TEST_F(ProgressiveLoaderTest, ProgressReportsFractionWhenLengthIsKnown) {
    EventLog events;
    ProgressiveLoader loader(kVideoUrl, options(), events.events());
    loader.startFetch();
    transport_->respond("video/mp4", 350);
    sendRange(0, 175);
    sendRange(175, 175);
    transport_->finish();
    ASSERT_EQ(loader.waitFor(5s), FetchState::Completed);

    std::lock_guard lock(events.mutex);
    ASSERT_EQ(events.progress.size(), 2u);
    EXPECT_EQ(events.progress[0].bytesReceived, 175u);
    ASSERT_TRUE(events.progress[0].fraction.has_value());
    EXPECT_DOUBLE_EQ(*events.progress[0].fraction, 0.5);
    EXPECT_EQ(events.progress[0].humanReadable, "50.0% of 350 bytes");
    EXPECT_DOUBLE_EQ(*events.progress[1].fraction, 1.0);
    EXPECT_EQ(events.completedBytes, 350u);
}

TEST_F(ProgressiveLoaderTest, ProgressOmitsFractionWhenLengthIsUnknown) {
    EventLog events;
    ProgressiveLoader loader(kVideoUrl, options(), events.events());
    loader.startFetch();
    transport_->respond("video/mp4", std::nullopt);
    sendRange(0, 120);
    transport_->finish();
    ASSERT_EQ(loader.waitFor(5s), FetchState::Completed);

    std::lock_guard lock(events.mutex);
    ASSERT_EQ(events.progress.size(), 1u);
    EXPECT_FALSE(events.progress[0].fraction.has_value());
    EXPECT_FALSE(events.progress[0].totalBytes.has_value());
    EXPECT_EQ(events.progress[0].humanReadable, "120 bytes received");
}

TEST_F(ProgressiveLoaderTest, ExpiredOwnerSilencesNotifications) {
    EventLog events;
    auto owner = std::make_shared<int>(7);
    auto opts = options();
    opts.owner = std::weak_ptr<void>(owner);
    ProgressiveLoader loader(kVideoUrl, opts, events.events());
    SinkLog log;
    loader.submit(0, 100, log.sink());

    owner.reset();
    transport_->respond("video/mp4", 100);
    sendRange(0, 100);
    transport_->finish();
    ASSERT_EQ(loader.waitFor(5s), FetchState::Completed);

    // Range sinks still complete; only the observer is silenced.
    EXPECT_EQ(log.finished, 1);
    std::lock_guard lock(events.mutex);
    EXPECT_TRUE(events.progress.empty());
    EXPECT_FALSE(events.completedBytes.has_value());
}

TEST_F(ProgressiveLoaderTest, DestroyingALiveLoaderDoesNotNotify) {
    EventLog events;
    {
        ProgressiveLoader loader(kVideoUrl, options(), events.events());
        loader.startFetch();
        ASSERT_TRUE(transport_->waitIdle());
    }
    std::lock_guard lock(events.mutex);
    EXPECT_FALSE(events.failure.has_value());
    EXPECT_FALSE(events.completedBytes.has_value());
}

TEST_F(ProgressiveLoaderTest, LoaderCanBeDestroyedFromOnCompleted) {
    std::unique_ptr<ProgressiveLoader> loader;
    std::mutex mutex;
    std::condition_variable cv;
    bool released = false;
    std::size_t completedBytes = 0;

    LoaderEvents events;
    events.onCompleted = [&](const ByteVector& bytes) {
        completedBytes = bytes.size();
        loader.reset();
        std::lock_guard lock(mutex);
        released = true;
        cv.notify_all();
    };
    loader = std::make_unique<ProgressiveLoader>(kVideoUrl, options(), std::move(events));
    loader->startFetch();
    transport_->respond("video/mp4", 350);
    sendRange(0, 350);
    transport_->finish();

    std::unique_lock lock(mutex);
    ASSERT_TRUE(cv.wait_for(lock, 5s, [&] { return released; }));
    EXPECT_FALSE(loader);
    EXPECT_EQ(completedBytes, 350u);
}

TEST_F(ProgressiveLoaderTest, LoaderCanBeDestroyedFromOnFailed) {
    std::unique_ptr<ProgressiveLoader> loader;
    std::mutex mutex;
    std::condition_variable cv;
    bool released = false;
    std::optional<ErrorCode> code;

    LoaderEvents events;
    events.onFailed = [&](const Error& e) {
        code = e.code;
        loader.reset();
        std::lock_guard lock(mutex);
        released = true;
        cv.notify_all();
    };
    loader = std::make_unique<ProgressiveLoader>(kVideoUrl, options(), std::move(events));
    SinkLog log;
    loader->submit(0, 300, log.sink());
    transport_->respond("video/mp4", 350);
    sendRange(0, 100);
    transport_->fail(Error{ErrorCode::NetworkError, "connection reset"});

    std::unique_lock lock(mutex);
    ASSERT_TRUE(cv.wait_for(lock, 5s, [&] { return released; }));
    EXPECT_FALSE(loader);
    ASSERT_TRUE(code.has_value());
    EXPECT_EQ(*code, ErrorCode::NetworkError);
    ASSERT_EQ(log.failures.size(), 1u);
    EXPECT_EQ(log.failures[0].code, ErrorCode::NetworkError);
}

// ===== Pre-supplied data =====

TEST_F(ProgressiveLoaderTest, PreSuppliedDataSkipsTheNetwork) {
    EventLog events;
    ProgressiveLoader loader(kVideoUrl, options(), events.events());
    ASSERT_TRUE(loader.setMediaData(payload_, "video/mp4"));

    EXPECT_EQ(loader.state(), FetchState::Completed);
    auto handle = loader.handle();
    EXPECT_EQ(handle.contentType, "video/mp4");
    EXPECT_EQ(handle.totalLength, 350u);

    SinkLog log;
    loader.submit(10, 20, log.sink(), /*wantsContentInformation=*/true);
    EXPECT_EQ(log.received, ByteVector(payload_.begin() + 10, payload_.begin() + 30));
    EXPECT_EQ(log.finished, 1);
    ASSERT_TRUE(log.info.has_value());
    EXPECT_EQ(log.info->contentLength, 350u);
    EXPECT_EQ(log.info->contentType, "video/mp4");

    loader.startFetch();
    EXPECT_EQ(loader.wait(), FetchState::Completed);
    EXPECT_EQ(transport_->streamCalls(), 0u);

    std::lock_guard lock(events.mutex);
    EXPECT_FALSE(events.completedBytes.has_value());
}

TEST_F(ProgressiveLoaderTest, PreSuppliedDataRejectedOnceFetching) {
    ProgressiveLoader loader(kVideoUrl, options());
    loader.startFetch();

    auto r = loader.setMediaData(payload_, "video/mp4");
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::InvalidState);
    loader.cancelFetch();
}

// ===== Cache commit =====

class ProgressiveLoaderCacheTest : public ProgressiveLoaderTest {
protected:
    void SetUp() override {
        ProgressiveLoaderTest::SetUp();
        root_ = mediacache::tests::make_temp_dir("mediacache_loader_");
        cache::DurableCacheConfig cfg;
        cfg.rootDir = root_;
        cache_ = std::make_shared<cache::DurableCache>(cfg);
    }

    void TearDown() override {
        cache_.reset();
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    std::filesystem::path root_;
    std::shared_ptr<cache::DurableCache> cache_;
};

TEST_F(ProgressiveLoaderCacheTest, CompletedFetchIsCommittedAsOriginal) {
    auto opts = options(CachePolicy::Allow);
    opts.cache = cache_;
    ProgressiveLoader loader(kVideoUrl, opts);
    loader.startFetch();
    transport_->respond("video/mp4", 350);
    sendRange(0, 350);
    transport_->finish();
    ASSERT_EQ(loader.waitFor(5s), FetchState::Completed);

    auto key = cache::CacheKey::original(kVideoUrl, cache::ResourceKind::Video);
    auto cached = cache_->get(key);
    ASSERT_TRUE(cached.has_value());
    EXPECT_EQ(cached->bytes, payload_);
    EXPECT_EQ(cached->mimeType, "video/mp4");

    auto path = cache_->cachedFilePath(key);
    ASSERT_TRUE(path.has_value());
    EXPECT_EQ(path->filename().string(), "intro-size-original.mp4");
}

TEST_F(ProgressiveLoaderCacheTest, NotAllowedPolicySkipsTheCache) {
    auto opts = options(CachePolicy::NotAllowed);
    opts.cache = cache_;
    ProgressiveLoader loader(kVideoUrl, opts);
    loader.startFetch();
    sendRange(0, 350);
    transport_->finish();
    ASSERT_EQ(loader.waitFor(5s), FetchState::Completed);

    EXPECT_FALSE(cache_->exists(kVideoUrl, cache::ResourceKind::Video));
}

TEST_F(ProgressiveLoaderCacheTest, FailedFetchIsNotCommitted) {
    auto opts = options(CachePolicy::Allow);
    opts.cache = cache_;
    ProgressiveLoader loader(kVideoUrl, opts);
    loader.startFetch();
    sendRange(0, 100);
    transport_->fail(Error{ErrorCode::Timeout, "timed out"});
    ASSERT_EQ(loader.waitFor(5s), FetchState::Failed);

    EXPECT_FALSE(cache_->exists(kVideoUrl, cache::ResourceKind::Video));
}

TEST_F(ProgressiveLoaderCacheTest, PreSuppliedDataIsNotCommitted) {
    auto opts = options(CachePolicy::Allow);
    opts.cache = cache_;
    ProgressiveLoader loader(kVideoUrl, opts);
    ASSERT_TRUE(loader.setMediaData(payload_, "video/mp4"));
    EXPECT_FALSE(cache_->exists(kVideoUrl, cache::ResourceKind::Video));
}

TEST_F(ProgressiveLoaderCacheTest, TargetSizeCommitsResizedImage) {
    media::DecodedImage source;
    source.width = 40;
    source.height = 20;
    source.pixels.assign(40 * 20 * media::DecodedImage::kChannels, 0x80);
    auto png = media::encodeImage(source, "png");
    ASSERT_TRUE(png);

    const std::string url = "https://media.example.com/img/banner.png";
    auto opts = options(CachePolicy::Allow);
    opts.kind = cache::ResourceKind::Image;
    opts.cache = cache_;
    opts.targetSize = cache::RenderSize{20, 20};
    ProgressiveLoader loader(url, opts);
    loader.startFetch();
    transport_->respond("image/png", png.value().size());
    transport_->send(png.value());
    transport_->finish();
    ASSERT_EQ(loader.waitFor(5s), FetchState::Completed);

    auto sizedKey = cache::CacheKey::sized(url, cache::ResourceKind::Image, {20, 20});
    auto image = cache_->getImage(sizedKey);
    ASSERT_NE(image, nullptr);
    EXPECT_EQ(image->width, 20);
    EXPECT_EQ(image->height, 10);
    EXPECT_TRUE(cache_->get(cache::CacheKey::original(url, cache::ResourceKind::Image)));
    EXPECT_EQ(cache_->stats().scratch.fileCount, 0u);
}
