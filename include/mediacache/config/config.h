#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>

#include <mediacache/cache/durable_cache.h>
#include <mediacache/core/types.h>
#include <mediacache/loader/transport.h>

namespace mediacache::config {

/**
 * Runtime settings. Precedence: built-in defaults, then the config file, then
 * environment (MEDIACACHE_CACHE_DIR), then command-line flags applied by the
 * caller.
 *
 * Example config.toml:
 *
 *   [cache]
 *   root_dir = "~/.cache/mediacache"
 *   encoded_count_limit = 100
 *   encoded_cost_limit_mb = 100
 *
 *   [network]
 *   connect_timeout_ms = 15000
 *   user_agent = "mediacache/1.0"
 *
 *   [media]
 *   ffmpeg_path = "/usr/bin/ffmpeg"
 *
 *   [logging]
 *   level = "info"
 */
struct MediaCacheConfig {
    struct Cache {
        std::filesystem::path rootDir;
        std::size_t encodedCountLimit{kDefaultCountLimit};
        std::size_t encodedCostLimit{kDefaultCostLimit};
        std::size_t decodedCountLimit{kDefaultCountLimit};
        std::size_t decodedCostLimit{kDefaultCostLimit};
    } cache;

    struct Network {
        std::chrono::milliseconds connectTimeout{15000};
        std::chrono::milliseconds timeout{0};
        std::string userAgent{"mediacache/1.0"};
        std::optional<std::string> proxy;
        std::string caPath;
        bool insecure{false};
    } network;

    struct Media {
        std::filesystem::path ffmpegPath{"ffmpeg"};
        int videoCrf{23};
    } media;

    std::string logLevel{"info"};

    /// File the values were read from, if one existed.
    std::optional<std::filesystem::path> sourcePath;

    cache::DurableCacheConfig toCacheConfig() const;
    loader::TransportConfig toTransportConfig() const;
};

/**
 * Load settings from the config file (explicit path, MEDIACACHE_CONFIG, or the
 * XDG location). A missing file is not an error unless the path was given
 * explicitly. Malformed numeric values are InvalidArgument.
 */
Result<MediaCacheConfig> loadConfig(const std::string& overridePath = "");

} // namespace mediacache::config
