#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include <mediacache/cache/cache_key.h>
#include <mediacache/core/types.h>

namespace mediacache::cache {

/**
 * Encoded payload as stored in the encoded memory tier and in the file tier.
 */
struct CachedPayload {
    ByteVector bytes;
    std::string mimeType;
    std::string fileExtension; ///< without the leading dot, may be empty

    std::size_t cost() const { return bytes.size(); }
};

/// File-name parts derived from a source identity (URL or path).
struct SourceName {
    std::string baseName;  ///< last path component without extension, lowercased
    std::string extension; ///< lowercased, may be empty
};

/**
 * Split a source URL or path into its base name and extension. Query strings
 * and fragments are ignored: "https://h/x/Clip.MP4?t=1" -> {"clip", "mp4"}.
 */
SourceName decomposeSource(std::string_view source);

/// "<base>-size-<token>", the extension-less file name of one variant.
std::string variantStem(const CacheKey& key);

struct DirectoryInfo {
    std::size_t fileCount{0};
    std::uint64_t totalBytes{0};
};

/**
 * Size-variant file tier.
 *
 * Layout:
 *   <root>/CachedVideos/<base>-size-<w>-<h>[.<ext>]
 *   <root>/CachedImages/<base>-size-original[.<ext>]
 *   <root>/Scratch/            intermediate downloads, safe to delete
 *
 * Each cached file has a "<file>.meta.json" sidecar. There is no index: lookups
 * list the kind's directory and match on the variant stem, so a variant is
 * found whatever extension it was written with. Writes land in a hidden
 * temporary sibling that is renamed into place.
 */
class FileStore {
public:
    static constexpr std::string_view kVideosDirName = "CachedVideos";
    static constexpr std::string_view kImagesDirName = "CachedImages";
    static constexpr std::string_view kScratchDirName = "Scratch";
    static constexpr std::string_view kMetaSuffix = ".meta.json";

    explicit FileStore(std::filesystem::path root);

    /// Create the three directories if missing.
    Result<void> initialize();

    const std::filesystem::path& root() const { return root_; }
    std::filesystem::path directoryFor(ResourceKind kind) const;
    std::filesystem::path scratchDirectory() const;

    /// Path a variant would be written to with the given extension.
    std::filesystem::path pathFor(const CacheKey& key, std::string_view extension) const;

    std::optional<std::filesystem::path> find(const CacheKey& key) const;

    /// NotFound when the variant is absent; IoError when it cannot be read.
    Result<CachedPayload> read(const CacheKey& key) const;

    /// Atomically create or replace the variant. Returns the final path.
    Result<std::filesystem::path> write(const CacheKey& key, const CachedPayload& payload);

    /**
     * Move an already-written file (e.g. a transcoder output) into place as the
     * variant and record its sidecar. Returns the final path.
     */
    Result<std::filesystem::path> commitFile(const CacheKey& key, const std::filesystem::path& file,
                                             std::string_view mimeType);

    /// True if any variant of the source is stored under this kind.
    bool exists(std::string_view source, ResourceKind kind) const;

    /// Delete every variant of the source under this kind. Returns the number of
    /// cached files removed.
    Result<std::size_t> removeSource(std::string_view source, ResourceKind kind);

    /// Empty the selected directories (All includes Scratch). Returns the number
    /// of entries removed.
    Result<std::size_t> clear(ClearScope scope);

    DirectoryInfo directoryInfo(ResourceKind kind) const;
    DirectoryInfo scratchInfo() const;

    // Scratch area
    Result<std::filesystem::path> createScratchFile(ByteSpan bytes, std::string_view extension);
    Result<std::filesystem::path> moveToScratch(const std::filesystem::path& file);
    bool removeScratch(const std::filesystem::path& file);
    std::size_t purgeScratch();

private:
    Result<void> install(const std::filesystem::path& tempPath,
                         const std::filesystem::path& finalPath, const CacheKey& key);

    std::filesystem::path root_;
};

} // namespace mediacache::cache
