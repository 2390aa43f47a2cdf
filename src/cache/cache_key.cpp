#include <mediacache/cache/cache_key.h>
#include <mediacache/common/format.h>

namespace mediacache::cache {

std::string Variant::token() const {
    if (!size_) {
        return "original";
    }
    return fmt_format("{:.1f}-{:.1f}", size_->width, size_->height);
}

std::string CacheKey::toString() const {
    return fmt_format("{}|{}|{}", kindName(kind), variant.token(), sourceIdentity);
}

std::size_t CacheKeyHash::operator()(const CacheKey& key) const {
    std::size_t h = std::hash<std::string>{}(key.sourceIdentity);
    auto mix = [&h](std::size_t v) { h ^= v + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2); };
    mix(static_cast<std::size_t>(key.kind));
    if (const auto& size = key.variant.size()) {
        mix(std::hash<double>{}(size->width));
        mix(std::hash<double>{}(size->height));
    } else {
        mix(0x5bd1e995ULL);
    }
    return h;
}

} // namespace mediacache::cache
