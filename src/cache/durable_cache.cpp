#include <mediacache/cache/durable_cache.h>
#include <mediacache/common/format.h>
#include <mediacache/media/mime_types.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <utility>

namespace mediacache::cache {

namespace fs = std::filesystem;

namespace {

std::mutex gSharedMutex;
std::shared_ptr<DurableCache> gShared;

// Resized images are re-encoded: JPEG sources stay JPEG, everything else becomes PNG.
std::string resizedImageExtension(const std::string& sourceExtension) {
    if (sourceExtension == "jpg" || sourceExtension == "jpeg") {
        return sourceExtension;
    }
    return "png";
}

} // namespace

DurableCache::DurableCache(DurableCacheConfig config)
    : config_(std::move(config)),
      files_(config_.rootDir),
      transcoder_(config_.transcoder),
      encoded_(config_.encodedCountLimit, config_.encodedCostLimit),
      decoded_(config_.decodedCountLimit, config_.decodedCostLimit) {
    auto r = files_.initialize();
    if (!r) {
        spdlog::warn("DurableCache: file tier unavailable: {}", r.error().message);
    }
}

DurableCache::~DurableCache() {
    std::vector<std::shared_ptr<media::TranscodeJob>> jobs;
    {
        std::lock_guard lock(jobsMutex_);
        jobs.swap(jobs_);
    }
    for (auto& job : jobs) {
        job->cancel();
    }
    for (auto& job : jobs) {
        (void)job->wait();
    }
}

std::optional<CachedPayload> DurableCache::get(const CacheKey& key) {
    {
        std::lock_guard lock(mutex_);
        if (auto hit = encoded_.get(key)) {
            return hit;
        }
    }

    auto fromDisk = files_.read(key);
    if (!fromDisk) {
        if (fromDisk.error().code != ErrorCode::NotFound) {
            spdlog::warn("DurableCache: read {} failed: {}", key.toString(),
                         fromDisk.error().message);
        }
        return std::nullopt;
    }

    CachedPayload payload = std::move(fromDisk).value();
    {
        std::lock_guard lock(mutex_);
        encoded_.put(key, payload, payload.cost());
    }
    spdlog::trace("DurableCache: promoted {} from disk", key.toString());
    return payload;
}

void DurableCache::put(const CacheKey& key, CachedPayload payload) {
    auto written = files_.write(key, payload);
    if (!written) {
        spdlog::warn("DurableCache: write {} failed: {}", key.toString(), written.error().message);
    }

    const auto cost = payload.cost();
    std::lock_guard lock(mutex_);
    // A stale decoded image would outlive the payload it was decoded from.
    decoded_.invalidate(key);
    if (!encoded_.put(key, std::move(payload), cost)) {
        spdlog::debug("DurableCache: {} ({}) exceeds the encoded cost limit", key.toString(),
                      formatByteCount(cost));
    }
}

DurableCache::DecodedImagePtr DurableCache::getImage(const CacheKey& key) {
    if (key.kind != ResourceKind::Image) {
        return nullptr;
    }
    {
        std::lock_guard lock(mutex_);
        if (auto hit = decoded_.get(key)) {
            return *hit;
        }
    }

    auto payload = get(key);
    if (!payload) {
        return nullptr;
    }
    auto decoded = media::decodeImage(payload->bytes);
    if (!decoded) {
        spdlog::debug("DurableCache: cannot decode {}: {}", key.toString(),
                      decoded.error().message);
        return nullptr;
    }

    auto image = std::make_shared<const media::DecodedImage>(std::move(decoded).value());
    std::lock_guard lock(mutex_);
    decoded_.put(key, image, image->costBytes());
    return image;
}

void DurableCache::remove(std::string_view sourceIdentity) {
    for (auto kind : {ResourceKind::Video, ResourceKind::Image}) {
        auto r = files_.removeSource(sourceIdentity, kind);
        if (!r) {
            spdlog::warn("DurableCache: remove {} failed: {}", sourceIdentity, r.error().message);
        }
    }

    // Same match as the file tier: every source sharing the base name.
    auto matches = [base = decomposeSource(sourceIdentity).baseName](const CacheKey& key) {
        return decomposeSource(key.sourceIdentity).baseName == base;
    };
    std::lock_guard lock(mutex_);
    encoded_.invalidateIf(matches);
    decoded_.invalidateIf(matches);
}

void DurableCache::clear(ClearScope scope) {
    auto r = files_.clear(scope);
    if (!r) {
        spdlog::warn("DurableCache: clear failed: {}", r.error().message);
    } else {
        spdlog::info("DurableCache: cleared {} file(s)", r.value());
    }

    std::lock_guard lock(mutex_);
    switch (scope) {
        case ClearScope::All:
            encoded_.clear();
            decoded_.clear();
            break;
        case ClearScope::Videos:
            encoded_.invalidateIf(
                [](const CacheKey& key) { return key.kind == ResourceKind::Video; });
            break;
        case ClearScope::Images:
            encoded_.invalidateIf(
                [](const CacheKey& key) { return key.kind == ResourceKind::Image; });
            decoded_.clear();
            break;
    }
}

bool DurableCache::exists(std::string_view sourceIdentity, ResourceKind kind) const {
    return files_.exists(sourceIdentity, kind);
}

std::optional<fs::path> DurableCache::cachedFilePath(const CacheKey& key) const {
    return files_.find(key);
}

DurableCache::DecodedImagePtr DurableCache::storeResizedImage(const std::string& sourceIdentity,
                                                              const RenderSize& size,
                                                              const fs::path& scratchFile) {
    const auto key = CacheKey::sized(sourceIdentity, ResourceKind::Image, size);
    const auto ext = resizedImageExtension(decomposeSource(sourceIdentity).extension);

    auto resized = media::resizeImageFile(scratchFile, size, ext);
    files_.removeScratch(scratchFile);
    if (!resized) {
        return nullptr;
    }

    auto image = std::make_shared<const media::DecodedImage>(std::move(resized->image));
    put(key, CachedPayload{std::move(resized->encoded), media::mimeTypeForExtension(ext), ext});

    std::lock_guard lock(mutex_);
    decoded_.put(key, image, image->costBytes());
    return image;
}

std::shared_ptr<media::TranscodeJob>
DurableCache::storeResizedVideo(const std::string& sourceIdentity, const RenderSize& resolution,
                                const fs::path& scratchFile, VideoCallback callback) {
    pruneFinishedJobs();

    const auto key = CacheKey::sized(sourceIdentity, ResourceKind::Video, resolution);
    const auto output = files_.scratchDirectory() / (scratchFile.stem().string() + "-out.mp4");

    auto job = transcoder_.start(
        scratchFile, output, resolution,
        [this, key, scratchFile, callback = std::move(callback)](
            const std::optional<fs::path>& transcoded) {
            files_.removeScratch(scratchFile);
            std::optional<fs::path> committed;
            if (transcoded) {
                auto r = files_.commitFile(key, *transcoded, media::mimeTypeForExtension("mp4"));
                if (r) {
                    committed = r.value();
                } else {
                    spdlog::warn("DurableCache: cannot commit {}: {}", key.toString(),
                                 r.error().message);
                    files_.removeScratch(*transcoded);
                }
            }
            if (callback) {
                callback(committed);
            }
        });

    std::lock_guard lock(jobsMutex_);
    jobs_.push_back(job);
    return job;
}

void DurableCache::pruneFinishedJobs() {
    std::vector<std::shared_ptr<media::TranscodeJob>> finished;
    std::lock_guard lock(jobsMutex_);
    auto it = std::stable_partition(jobs_.begin(), jobs_.end(), [](const auto& job) {
        return job->status() == media::TranscodeStatus::Running;
    });
    finished.assign(std::make_move_iterator(it), std::make_move_iterator(jobs_.end()));
    jobs_.erase(it, jobs_.end());
}

void DurableCache::waitForTranscodes() {
    std::vector<std::shared_ptr<media::TranscodeJob>> jobs;
    {
        std::lock_guard lock(jobsMutex_);
        jobs = jobs_;
    }
    for (auto& job : jobs) {
        (void)job->wait();
    }
    pruneFinishedJobs();
}

void DurableCache::setCountLimit(MemoryTier tier, std::size_t limit) {
    std::lock_guard lock(mutex_);
    if (tier == MemoryTier::Encoded) {
        encoded_.setCountLimit(limit);
    } else {
        decoded_.setCountLimit(limit);
    }
}

void DurableCache::setCostLimit(MemoryTier tier, std::size_t bytes) {
    std::lock_guard lock(mutex_);
    if (tier == MemoryTier::Encoded) {
        encoded_.setCostLimit(bytes);
    } else {
        decoded_.setCostLimit(bytes);
    }
}

DurableCacheStats DurableCache::stats() const {
    DurableCacheStats s;
    {
        std::lock_guard lock(mutex_);
        s.encoded = encoded_.stats();
        s.decoded = decoded_.stats();
    }
    s.videos = files_.directoryInfo(ResourceKind::Video);
    s.images = files_.directoryInfo(ResourceKind::Image);
    s.scratch = files_.scratchInfo();
    return s;
}

std::shared_ptr<DurableCache> DurableCache::initializeShared(DurableCacheConfig config) {
    auto cache = std::make_shared<DurableCache>(std::move(config));
    std::lock_guard lock(gSharedMutex);
    gShared = cache;
    return cache;
}

std::shared_ptr<DurableCache> DurableCache::shared() {
    std::lock_guard lock(gSharedMutex);
    return gShared;
}

void DurableCache::resetShared() {
    std::shared_ptr<DurableCache> previous;
    std::lock_guard lock(gSharedMutex);
    previous.swap(gShared);
}

} // namespace mediacache::cache
