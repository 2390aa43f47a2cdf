#include <mediacache/config/config.h>
#include <mediacache/config/config_helpers.h>

#include <spdlog/spdlog.h>

#include <charconv>
#include <map>
#include <system_error>

namespace mediacache::config {

namespace {

using ValueMap = std::map<std::string, std::string>;

template <typename T> Result<std::optional<T>> numberAt(const ValueMap& values, const std::string& key) {
    auto it = values.find(key);
    if (it == values.end() || it->second.empty()) {
        return std::optional<T>{};
    }
    const auto& raw = it->second;
    T parsed{};
    auto [ptr, ec] = std::from_chars(raw.data(), raw.data() + raw.size(), parsed);
    if (ec != std::errc{} || ptr != raw.data() + raw.size()) {
        return Error{ErrorCode::InvalidArgument, "invalid number for " + key + ": '" + raw + "'"};
    }
    return std::optional<T>{parsed};
}

std::optional<std::string> stringAt(const ValueMap& values, const std::string& key) {
    auto it = values.find(key);
    if (it == values.end() || it->second.empty()) {
        return std::nullopt;
    }
    return it->second;
}

} // namespace

cache::DurableCacheConfig MediaCacheConfig::toCacheConfig() const {
    cache::DurableCacheConfig out;
    out.rootDir = cache.rootDir;
    out.encodedCountLimit = cache.encodedCountLimit;
    out.encodedCostLimit = cache.encodedCostLimit;
    out.decodedCountLimit = cache.decodedCountLimit;
    out.decodedCostLimit = cache.decodedCostLimit;
    out.transcoder.ffmpegPath = media.ffmpegPath;
    out.transcoder.crf = media.videoCrf;
    return out;
}

loader::TransportConfig MediaCacheConfig::toTransportConfig() const {
    loader::TransportConfig out;
    out.connectTimeout = network.connectTimeout;
    out.timeout = network.timeout;
    out.userAgent = network.userAgent;
    out.proxy = network.proxy;
    out.tls.caPath = network.caPath;
    out.tls.insecure = network.insecure;
    return out;
}

Result<MediaCacheConfig> loadConfig(const std::string& overridePath) {
    MediaCacheConfig cfg;
    cfg.cache.rootDir = get_cache_dir();

    const auto path = get_config_path(overridePath);
    std::error_code ec;
    if (std::filesystem::exists(path, ec)) {
        cfg.sourcePath = path;
    } else if (!overridePath.empty()) {
        return Error{ErrorCode::NotFound, "config file not found: " + path.string()};
    }

    const auto values = parse_config_file(path);

    if (auto v = stringAt(values, "cache.root_dir")) {
        cfg.cache.rootDir = expand_tilde(*v);
    }

    auto countKey = [&](const char* key, std::size_t& target) -> Result<void> {
        auto r = numberAt<std::size_t>(values, key);
        if (!r) {
            return r.error();
        }
        if (r.value()) {
            target = *r.value();
        }
        return {};
    };
    auto megabyteKey = [&](const char* key, std::size_t& target) -> Result<void> {
        auto r = numberAt<std::size_t>(values, key);
        if (!r) {
            return r.error();
        }
        if (r.value()) {
            target = *r.value() * kOneMegabyte;
        }
        return {};
    };
    auto millisKey = [&](const char* key, std::chrono::milliseconds& target) -> Result<void> {
        auto r = numberAt<long long>(values, key);
        if (!r) {
            return r.error();
        }
        if (r.value()) {
            target = std::chrono::milliseconds(*r.value());
        }
        return {};
    };

    for (auto r : {countKey("cache.encoded_count_limit", cfg.cache.encodedCountLimit),
                   megabyteKey("cache.encoded_cost_limit_mb", cfg.cache.encodedCostLimit),
                   countKey("cache.decoded_count_limit", cfg.cache.decodedCountLimit),
                   megabyteKey("cache.decoded_cost_limit_mb", cfg.cache.decodedCostLimit),
                   millisKey("network.connect_timeout_ms", cfg.network.connectTimeout),
                   millisKey("network.timeout_ms", cfg.network.timeout)}) {
        if (!r) {
            return r.error();
        }
    }

    if (auto v = stringAt(values, "network.user_agent")) {
        cfg.network.userAgent = *v;
    }
    cfg.network.proxy = stringAt(values, "network.proxy");
    if (auto v = stringAt(values, "network.ca_path")) {
        cfg.network.caPath = expand_tilde(*v).string();
    }
    if (auto v = stringAt(values, "network.insecure")) {
        cfg.network.insecure = parse_bool(*v);
    }

    if (auto v = stringAt(values, "media.ffmpeg_path")) {
        cfg.media.ffmpegPath = expand_tilde(*v);
    }
    auto crf = numberAt<int>(values, "media.video_crf");
    if (!crf) {
        return crf.error();
    }
    if (crf.value()) {
        cfg.media.videoCrf = *crf.value();
    }

    if (auto v = stringAt(values, "logging.level")) {
        cfg.logLevel = *v;
    }

    if (const char* env = std::getenv("MEDIACACHE_CACHE_DIR"); env && *env) {
        cfg.cache.rootDir = expand_tilde(env);
    }

    spdlog::debug("config: {} root={}",
                  cfg.sourcePath ? cfg.sourcePath->string() : std::string("<defaults>"),
                  cfg.cache.rootDir.string());
    return cfg;
}

} // namespace mediacache::config
