#include <mediacache/cache/durable_cache.h>
#include <mediacache/common/format.h>
#include <mediacache/config/config.h>
#include <mediacache/config/config_helpers.h>
#include <mediacache/loader/progressive_loader.h>
#include <mediacache/media/mime_types.h>

#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <charconv>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

namespace mediacache::cli {

namespace {

std::optional<cache::RenderSize> parseSize(const std::string& raw) {
    auto x = raw.find_first_of("xX");
    if (x == std::string::npos) {
        return std::nullopt;
    }
    double w = 0.0;
    double h = 0.0;
    auto [p1, e1] = std::from_chars(raw.data(), raw.data() + x, w);
    auto [p2, e2] = std::from_chars(raw.data() + x + 1, raw.data() + raw.size(), h);
    if (e1 != std::errc{} || e2 != std::errc{} || p1 != raw.data() + x ||
        p2 != raw.data() + raw.size()) {
        return std::nullopt;
    }
    cache::RenderSize size{w, h};
    if (!size.valid()) {
        return std::nullopt;
    }
    return size;
}

cache::ResourceKind resolveKind(const std::string& kind, const std::string& url) {
    if (kind == "image") {
        return cache::ResourceKind::Image;
    }
    if (kind == "video") {
        return cache::ResourceKind::Video;
    }
    auto mime = media::mimeTypeForExtension(cache::decomposeSource(url).extension);
    return media::kindForMimeType(mime).value_or(cache::ResourceKind::Video);
}

bool writeFile(const std::string& path, const ByteVector& bytes) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        return false;
    }
    out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    return static_cast<bool>(out);
}

nlohmann::json tierJson(const cache::CacheStats& s) {
    return {{"entries", s.currentSize},   {"cost", s.totalCost},   {"count_limit", s.countLimit},
            {"cost_limit", s.costLimit},  {"hits", s.hits},        {"misses", s.misses},
            {"evictions", s.evictions},   {"insertions", s.insertions}};
}

nlohmann::json dirJson(const cache::DirectoryInfo& d) {
    return {{"files", d.fileCount}, {"bytes", d.totalBytes}};
}

} // namespace

class MediaCacheCli {
public:
    MediaCacheCli() : app_("mediacache", "Progressive media fetcher and two-tier cache") {
        setupApp();
    }

    int run(int argc, char** argv) {
        try {
            app_.parse(argc, argv);
        } catch (const CLI::ParseError& e) {
            return app_.exit(e);
        }

        if (auto rc = initialize(); rc != 0) {
            return rc;
        }

        int rc = 0;
        if (app_.got_subcommand("fetch")) {
            rc = runFetch();
        } else if (app_.got_subcommand("get")) {
            rc = runGet();
        } else if (app_.got_subcommand("remove")) {
            rc = runRemove();
        } else if (app_.got_subcommand("clear")) {
            rc = runClear();
        } else if (app_.got_subcommand("info")) {
            rc = runInfo();
        } else {
            std::cout << app_.help() << std::endl;
        }
        cache::DurableCache::resetShared();
        return rc;
    }

private:
    void setupApp() {
        app_.set_version_flag("-V,--version", "1.0.0");
        app_.require_subcommand(0, 1);

        // Global options
        app_.add_option("-c,--config", configPath_, "Path to configuration file");
        app_.add_option("--cache-dir", cacheDir_, "Cache root directory");
        app_.add_flag("-v,--verbose", verbose_, "Enable debug logging");

        auto* fetch = app_.add_subcommand("fetch", "Download a resource and commit it to the cache");
        fetch->add_option("url", url_, "Source URL")->required();
        fetch->add_option("-k,--kind", kind_, "Resource kind (auto, video, image)")
            ->default_val("auto")
            ->check(CLI::IsMember({"auto", "video", "image"}));
        fetch->add_option("-s,--size", size_, "Also cache a variant fitting WxH");
        fetch->add_flag("--no-cache", noCache_, "Do not commit the download to the cache");
        fetch->add_option("-o,--out", out_, "Write the downloaded bytes to FILE");

        auto* get = app_.add_subcommand("get", "Look up a cached variant");
        get->add_option("url", url_, "Source URL")->required();
        get->add_option("-k,--kind", kind_, "Resource kind (auto, video, image)")
            ->default_val("auto")
            ->check(CLI::IsMember({"auto", "video", "image"}));
        get->add_option("-s,--size", size_, "Variant size WxH (default: original)");
        get->add_option("-o,--out", out_, "Write the cached bytes to FILE");

        auto* remove = app_.add_subcommand("remove", "Delete every cached variant of a source");
        remove->add_option("url", url_, "Source URL")->required();

        auto* clear = app_.add_subcommand("clear", "Delete cached files");
        clear->add_option("scope", scope_, "videos, images or all")
            ->default_val("all")
            ->check(CLI::IsMember({"videos", "images", "all"}));

        auto* info = app_.add_subcommand("info", "Show cache location and usage");
        info->add_flag("--json", json_, "Output JSON");
    }

    int initialize() {
        auto cfg = config::loadConfig(configPath_);
        if (!cfg) {
            std::cerr << "Error: " << cfg.error().message << std::endl;
            return 2;
        }
        config_ = cfg.value();
        if (!cacheDir_.empty()) {
            config_.cache.rootDir = config::expand_tilde(cacheDir_);
        }

        spdlog::set_pattern("[%H:%M:%S] [%l] %v");
        if (verbose_) {
            spdlog::set_level(spdlog::level::debug);
        } else {
            spdlog::set_level(spdlog::level::from_str(config_.logLevel));
        }

        cache_ = cache::DurableCache::initializeShared(config_.toCacheConfig());
        return 0;
    }

    int runFetch() {
        std::optional<cache::RenderSize> target;
        if (!size_.empty()) {
            target = parseSize(size_);
            if (!target) {
                std::cerr << "Error: invalid size '" << size_ << "', expected WxH" << std::endl;
                return 2;
            }
        }

        loader::LoaderOptions options;
        options.kind = resolveKind(kind_, url_);
        options.cachePolicy = noCache_ ? loader::CachePolicy::NotAllowed : loader::CachePolicy::Allow;
        options.targetSize = target;
        options.transport = loader::makeCurlTransport(config_.toTransportConfig());
        options.cache = cache_;

        int rc = 0;
        loader::LoaderEvents events;
        events.onProgress = [](const loader::ProgressUpdate& p) {
            std::cerr << "\r" << p.humanReadable << "        " << std::flush;
        };
        events.onCompleted = [this, &rc](const ByteVector& bytes) {
            std::cerr << "\r" << formatByteCount(bytes.size()) << " downloaded        "
                      << std::endl;
            if (!out_.empty() && !writeFile(out_, bytes)) {
                std::cerr << "Error: cannot write " << out_ << std::endl;
                rc = 1;
            }
        };
        events.onFailed = [&rc](const Error& error) {
            std::cerr << std::endl << "Error: " << error.message << std::endl;
            rc = 1;
        };

        loader::ProgressiveLoader fetcher(url_, options, events);
        fetcher.startFetch();
        fetcher.wait();

        if (target) {
            cache_->waitForTranscodes();
            auto key = cache::CacheKey::sized(url_, options.kind, *target);
            if (auto path = cache_->cachedFilePath(key)) {
                std::cout << path->string() << std::endl;
            } else if (!noCache_ && rc == 0) {
                std::cerr << "No resized variant was produced" << std::endl;
            }
        } else if (!noCache_ && rc == 0) {
            if (auto path = cache_->cachedFilePath(cache::CacheKey::original(url_, options.kind))) {
                std::cout << path->string() << std::endl;
            }
        }
        return rc;
    }

    int runGet() {
        auto kind = resolveKind(kind_, url_);
        cache::CacheKey key = cache::CacheKey::original(url_, kind);
        if (!size_.empty()) {
            auto size = parseSize(size_);
            if (!size) {
                std::cerr << "Error: invalid size '" << size_ << "', expected WxH" << std::endl;
                return 2;
            }
            key = cache::CacheKey::sized(url_, kind, *size);
        }

        auto payload = cache_->get(key);
        if (!payload) {
            std::cerr << "Not cached: " << key.toString() << std::endl;
            return 1;
        }
        if (!out_.empty()) {
            if (!writeFile(out_, payload->bytes)) {
                std::cerr << "Error: cannot write " << out_ << std::endl;
                return 1;
            }
            return 0;
        }
        auto path = cache_->cachedFilePath(key);
        std::cout << (path ? path->string() : std::string("<memory>")) << "  "
                  << payload->mimeType << "  " << formatByteCount(payload->bytes.size())
                  << std::endl;
        return 0;
    }

    int runRemove() {
        cache_->remove(url_);
        return 0;
    }

    int runClear() {
        auto scope = scope_ == "videos"   ? cache::ClearScope::Videos
                     : scope_ == "images" ? cache::ClearScope::Images
                                          : cache::ClearScope::All;
        cache_->clear(scope);
        return 0;
    }

    int runInfo() {
        auto s = cache_->stats();
        if (json_) {
            nlohmann::json j;
            j["root"] = config_.cache.rootDir.string();
            j["config"] = config_.sourcePath ? config_.sourcePath->string() : std::string();
            j["videos"] = dirJson(s.videos);
            j["images"] = dirJson(s.images);
            j["scratch"] = dirJson(s.scratch);
            j["encoded"] = tierJson(s.encoded);
            j["decoded"] = tierJson(s.decoded);
            std::cout << j.dump(2) << std::endl;
            return 0;
        }
        std::cout << "Cache root : " << config_.cache.rootDir.string() << "\n"
                  << "Config     : "
                  << (config_.sourcePath ? config_.sourcePath->string() : "<defaults>") << "\n"
                  << "Videos     : " << s.videos.fileCount << " file(s), "
                  << formatByteCount(s.videos.totalBytes) << "\n"
                  << "Images     : " << s.images.fileCount << " file(s), "
                  << formatByteCount(s.images.totalBytes) << "\n"
                  << "Scratch    : " << s.scratch.fileCount << " file(s), "
                  << formatByteCount(s.scratch.totalBytes) << std::endl;
        return 0;
    }

    CLI::App app_;
    config::MediaCacheConfig config_;
    std::shared_ptr<cache::DurableCache> cache_;

    std::string configPath_;
    std::string cacheDir_;
    bool verbose_ = false;
    std::string url_;
    std::string kind_ = "auto";
    std::string size_;
    std::string out_;
    bool noCache_ = false;
    std::string scope_ = "all";
    bool json_ = false;
};

} // namespace mediacache::cli

int main(int argc, char** argv) {
    mediacache::cli::MediaCacheCli app;
    return app.run(argc, argv);
}
