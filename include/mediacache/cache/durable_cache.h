#pragma once

#include <cstddef>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <mediacache/cache/cache_key.h>
#include <mediacache/cache/file_store.h>
#include <mediacache/cache/memory_cache.h>
#include <mediacache/core/types.h>
#include <mediacache/media/image_codec.h>
#include <mediacache/media/video_transcoder.h>

namespace mediacache::cache {

/// In-memory tier selector for limit adjustments.
enum class MemoryTier { Encoded, Decoded };

struct DurableCacheConfig {
    std::filesystem::path rootDir;
    std::size_t encodedCountLimit{kDefaultCountLimit};
    std::size_t encodedCostLimit{kDefaultCostLimit};
    std::size_t decodedCountLimit{kDefaultCountLimit};
    std::size_t decodedCostLimit{kDefaultCostLimit};
    media::VideoTranscoder::Config transcoder;
};

struct DurableCacheStats {
    CacheStats encoded;
    CacheStats decoded;
    DirectoryInfo videos;
    DirectoryInfo images;
    DirectoryInfo scratch;
};

/**
 * Two-tier cache: bounded in-memory stores (encoded payloads and decoded
 * images) in front of the size-variant FileStore.
 *
 * Every put writes the file tier; memory is never the only copy. Misses are
 * nullopt/nullptr, never errors. Storage failures are logged and swallowed so
 * that a failed commit never blocks a load from completing.
 *
 * Thread-safe. One mutex guards both memory tiers; file I/O runs outside it.
 */
class DurableCache {
public:
    using DecodedImagePtr = std::shared_ptr<const media::DecodedImage>;
    using VideoCallback = media::TranscodeJob::Callback;

    explicit DurableCache(DurableCacheConfig config);
    ~DurableCache();

    DurableCache(const DurableCache&) = delete;
    DurableCache& operator=(const DurableCache&) = delete;

    std::optional<CachedPayload> get(const CacheKey& key);
    void put(const CacheKey& key, CachedPayload payload);

    /// Decoded image for an image key; nullptr on miss or decode failure.
    DecodedImagePtr getImage(const CacheKey& key);

    /// Every variant of the source, both kinds, both tiers. Sources are matched
    /// by lowercased base name, so other URLs with the same file name go too.
    void remove(std::string_view sourceIdentity);

    void clear(ClearScope scope);

    bool exists(std::string_view sourceIdentity, ResourceKind kind) const;
    std::optional<std::filesystem::path> cachedFilePath(const CacheKey& key) const;

    /**
     * Resize a downloaded image file to fit within size and commit the result
     * as the sized variant. The scratch file is deleted either way.
     */
    DecodedImagePtr storeResizedImage(const std::string& sourceIdentity,
                                      const RenderSize& size,
                                      const std::filesystem::path& scratchFile);

    /**
     * Start transcoding a downloaded video to fit the resolution. On success the
     * output lands in the file tier as the sized variant; the callback receives
     * its path (nullopt on failure or cancellation). The scratch file is deleted
     * once the job ends. The cache keeps the job alive until it finishes or the
     * cache is destroyed.
     */
    std::shared_ptr<media::TranscodeJob> storeResizedVideo(const std::string& sourceIdentity,
                                                           const RenderSize& resolution,
                                                           const std::filesystem::path& scratchFile,
                                                           VideoCallback callback = {});

    /// Block until every transcode started by this cache has finished.
    void waitForTranscodes();

    void setCountLimit(MemoryTier tier, std::size_t limit);
    void setCostLimit(MemoryTier tier, std::size_t bytes);

    DurableCacheStats stats() const;

    FileStore& fileStore() { return files_; }
    const FileStore& fileStore() const { return files_; }
    const DurableCacheConfig& config() const { return config_; }

    // Process-wide instance
    static std::shared_ptr<DurableCache> initializeShared(DurableCacheConfig config);
    static std::shared_ptr<DurableCache> shared();
    static void resetShared();

private:
    void pruneFinishedJobs();

    DurableCacheConfig config_;
    FileStore files_;
    media::VideoTranscoder transcoder_;

    mutable std::mutex mutex_;
    MemoryCache<CachedPayload> encoded_;
    MemoryCache<DecodedImagePtr> decoded_;

    std::mutex jobsMutex_;
    std::vector<std::shared_ptr<media::TranscodeJob>> jobs_;
};

} // namespace mediacache::cache
