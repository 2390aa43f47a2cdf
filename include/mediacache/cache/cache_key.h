#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <utility>

namespace mediacache::cache {

/// File type of a cached resource; selects the file tier directory.
enum class ResourceKind { Video, Image };

/// Which part of the file tier a clear request targets.
enum class ClearScope { Videos, Images, All };

constexpr const char* kindName(ResourceKind kind) {
    return kind == ResourceKind::Video ? "video" : "image";
}

/**
 * Target render size: image points or video pixels.
 */
struct RenderSize {
    double width{0.0};
    double height{0.0};

    bool operator==(const RenderSize& other) const {
        return width == other.width && height == other.height;
    }
    bool operator!=(const RenderSize& other) const { return !(*this == other); }

    bool valid() const { return width > 0.0 && height > 0.0; }
};

/**
 * Either the original download or one size-specific rendition of it.
 */
class Variant {
public:
    static Variant original() { return Variant{}; }
    static Variant sized(RenderSize size) { return Variant{size}; }

    bool isOriginal() const { return !size_.has_value(); }
    const std::optional<RenderSize>& size() const { return size_; }

    /**
     * File-name token: "original" or "<w>-<h>" with one decimal ("327.0-246.0").
     */
    std::string token() const;

    bool operator==(const Variant& other) const { return size_ == other.size_; }
    bool operator!=(const Variant& other) const { return !(*this == other); }

private:
    Variant() = default;
    explicit Variant(RenderSize size) : size_(size) {}

    std::optional<RenderSize> size_;
};

/**
 * Identity of one physically cached variant. Equality requires an exact match
 * on source, kind and variant, so one resource may have many cached variants.
 */
struct CacheKey {
    std::string sourceIdentity;
    ResourceKind kind{ResourceKind::Image};
    Variant variant{Variant::original()};

    static CacheKey original(std::string source, ResourceKind kind) {
        return CacheKey{std::move(source), kind, Variant::original()};
    }
    static CacheKey sized(std::string source, ResourceKind kind, RenderSize size) {
        return CacheKey{std::move(source), kind, Variant::sized(size)};
    }

    bool operator==(const CacheKey& other) const {
        return kind == other.kind && variant == other.variant &&
               sourceIdentity == other.sourceIdentity;
    }
    bool operator!=(const CacheKey& other) const { return !(*this == other); }

    std::string toString() const;
};

struct CacheKeyHash {
    std::size_t operator()(const CacheKey& key) const;
};

} // namespace mediacache::cache
