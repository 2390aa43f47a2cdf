#include <mediacache/cache/file_store.h>
#include <mediacache/common/format.h>
#include <mediacache/media/mime_types.h>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <atomic>
#include <cctype>
#include <chrono>
#include <cstring>
#include <fstream>
#include <iterator>
#include <system_error>
#include <vector>

namespace mediacache::cache {

namespace fs = std::filesystem;

namespace {

std::atomic<std::uint64_t> gUniqueCounter{0};

std::string lowered(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s) {
        out.push_back(static_cast<char>(std::tolower(c)));
    }
    return out;
}

std::string uniqueToken() {
    auto now_ns = std::chrono::duration_cast<std::chrono::nanoseconds>(
                      std::chrono::steady_clock::now().time_since_epoch())
                      .count();
    return std::to_string(now_ns) + "-" + std::to_string(gUniqueCounter.fetch_add(1));
}

std::string normalizedExtension(std::string_view ext) {
    if (!ext.empty() && ext.front() == '.') {
        ext.remove_prefix(1);
    }
    return lowered(ext);
}

bool isHidden(const std::string& name) {
    return !name.empty() && name.front() == '.';
}

bool isSidecar(const std::string& name) {
    return name.ends_with(FileStore::kMetaSuffix);
}

// A cached file of the stem: "<stem>" or "<stem>.<ext>", never a sidecar.
bool matchesStem(const std::string& name, const std::string& stem) {
    if (isHidden(name) || isSidecar(name)) {
        return false;
    }
    if (name == stem) {
        return true;
    }
    return name.size() > stem.size() + 1 && name.starts_with(stem) && name[stem.size()] == '.' &&
           name.find('.', stem.size() + 1) == std::string::npos;
}

std::string sourcePrefix(std::string_view source) {
    return decomposeSource(source).baseName + "-size-";
}

fs::path metaPath(const fs::path& file) {
    auto meta = file;
    meta += std::string(FileStore::kMetaSuffix);
    return meta;
}

void writeMetadata(const fs::path& file, const CacheKey& key, std::string_view mimeType,
                   std::string_view extension, std::uint64_t size) {
    nlohmann::json meta = nlohmann::json::object();
    meta["source"] = key.sourceIdentity;
    meta["kind"] = kindName(key.kind);
    meta["variant"] = key.variant.token();
    meta["mime_type"] = std::string(mimeType);
    meta["extension"] = std::string(extension);
    meta["size"] = size;
    meta["created_at"] = std::chrono::duration_cast<std::chrono::seconds>(
                             std::chrono::system_clock::now().time_since_epoch())
                             .count();

    std::ofstream out(metaPath(file), std::ios::binary | std::ios::trunc);
    if (!out) {
        spdlog::debug("FileStore: cannot write metadata for {}", file.string());
        return;
    }
    out << meta.dump(2);
}

std::optional<nlohmann::json> loadMetadata(const fs::path& file) {
    std::ifstream in(metaPath(file));
    if (!in) {
        return std::nullopt;
    }
    try {
        nlohmann::json j;
        in >> j;
        if (!j.is_object()) {
            return std::nullopt;
        }
        return j;
    } catch (const nlohmann::json::exception& e) {
        spdlog::debug("FileStore: ignoring unreadable metadata for {}: {}", file.string(),
                      e.what());
        return std::nullopt;
    }
}

Result<std::size_t> removeEntries(const fs::path& dir) {
    std::error_code ec;
    if (!fs::exists(dir, ec)) {
        return std::size_t{0};
    }
    std::vector<fs::path> entries;
    for (const auto& entry : fs::directory_iterator(dir, ec)) {
        entries.push_back(entry.path());
    }
    if (ec) {
        return Error{ErrorCode::IoError, "cannot list " + dir.string() + ": " + ec.message()};
    }

    std::size_t removed = 0;
    for (const auto& p : entries) {
        std::error_code rm_ec;
        fs::remove_all(p, rm_ec);
        if (rm_ec) {
            spdlog::warn("FileStore: failed to delete {}: {}", p.string(), rm_ec.message());
            continue;
        }
        if (!isSidecar(p.filename().string())) {
            ++removed;
        }
    }
    return removed;
}

DirectoryInfo collectInfo(const fs::path& dir) {
    DirectoryInfo info;
    std::error_code ec;
    for (const auto& entry : fs::directory_iterator(dir, ec)) {
        const auto name = entry.path().filename().string();
        if (isHidden(name) || isSidecar(name)) {
            continue;
        }
        std::error_code st_ec;
        if (!entry.is_regular_file(st_ec)) {
            continue;
        }
        ++info.fileCount;
        auto size = entry.file_size(st_ec);
        if (!st_ec) {
            info.totalBytes += size;
        }
    }
    return info;
}

} // namespace

SourceName decomposeSource(std::string_view source) {
    auto cut = source.find_first_of("?#");
    if (cut != std::string_view::npos) {
        source = source.substr(0, cut);
    }
    while (!source.empty() && source.back() == '/') {
        source.remove_suffix(1);
    }
    auto slash = source.rfind('/');
    std::string_view last = slash == std::string_view::npos ? source : source.substr(slash + 1);

    SourceName name;
    auto dot = last.rfind('.');
    if (dot == std::string_view::npos || dot == 0) {
        name.baseName = lowered(last);
    } else {
        name.baseName = lowered(last.substr(0, dot));
        name.extension = lowered(last.substr(dot + 1));
    }
    return name;
}

std::string variantStem(const CacheKey& key) {
    return decomposeSource(key.sourceIdentity).baseName + "-size-" + key.variant.token();
}

FileStore::FileStore(fs::path root) : root_(std::move(root)) {}

Result<void> FileStore::initialize() {
    for (const auto& dir : {directoryFor(ResourceKind::Video), directoryFor(ResourceKind::Image),
                            scratchDirectory()}) {
        std::error_code ec;
        fs::create_directories(dir, ec);
        if (ec) {
            return Error{ErrorCode::IoError,
                         "Failed to create cache dir: " + dir.string() + ": " + ec.message()};
        }
    }
    spdlog::debug("FileStore: ready at {}", root_.string());
    return {};
}

fs::path FileStore::directoryFor(ResourceKind kind) const {
    return root_ / (kind == ResourceKind::Video ? kVideosDirName : kImagesDirName);
}

fs::path FileStore::scratchDirectory() const {
    return root_ / kScratchDirName;
}

fs::path FileStore::pathFor(const CacheKey& key, std::string_view extension) const {
    std::string name = variantStem(key);
    auto ext = normalizedExtension(extension);
    if (!ext.empty()) {
        name += "." + ext;
    }
    return directoryFor(key.kind) / name;
}

std::optional<fs::path> FileStore::find(const CacheKey& key) const {
    const auto dir = directoryFor(key.kind);
    const auto stem = variantStem(key);
    std::error_code ec;
    for (const auto& entry : fs::directory_iterator(dir, ec)) {
        if (matchesStem(entry.path().filename().string(), stem)) {
            return entry.path();
        }
    }
    return std::nullopt;
}

Result<CachedPayload> FileStore::read(const CacheKey& key) const {
    auto path = find(key);
    if (!path) {
        return Error{ErrorCode::NotFound, "no cached file for " + key.toString()};
    }

    std::ifstream in(*path, std::ios::binary);
    if (!in) {
        return Error{ErrorCode::IoError, "cannot open " + path->string()};
    }
    std::vector<char> raw((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        return Error{ErrorCode::IoError, "read failed on " + path->string()};
    }

    CachedPayload payload;
    payload.bytes.resize(raw.size());
    std::memcpy(payload.bytes.data(), raw.data(), raw.size());
    payload.fileExtension = normalizedExtension(path->extension().string());

    if (auto meta = loadMetadata(*path)) {
        payload.mimeType = meta->value("mime_type", std::string{});
    }
    if (payload.mimeType.empty()) {
        payload.mimeType = media::mimeTypeForExtension(payload.fileExtension);
    }
    return payload;
}

Result<fs::path> FileStore::write(const CacheKey& key, const CachedPayload& payload) {
    const auto dir = directoryFor(key.kind);
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        return Error{ErrorCode::WriteError, "Failed to create cache dir: " + dir.string()};
    }

    std::string ext = payload.fileExtension.empty()
                          ? decomposeSource(key.sourceIdentity).extension
                          : normalizedExtension(payload.fileExtension);
    const auto finalPath = pathFor(key, ext);
    const auto tempPath = dir / ("." + finalPath.filename().string() + "." + uniqueToken() + ".part");

    {
        std::ofstream out(tempPath, std::ios::binary | std::ios::trunc);
        if (!out) {
            return Error{ErrorCode::WriteError, "Failed to create " + tempPath.string()};
        }
        out.write(reinterpret_cast<const char*>(payload.bytes.data()),
                  static_cast<std::streamsize>(payload.bytes.size()));
        out.close();
        if (!out) {
            fs::remove(tempPath, ec);
            return Error{ErrorCode::WriteError, "write failed on " + tempPath.string()};
        }
    }

    auto installed = install(tempPath, finalPath, key);
    if (!installed) {
        return installed.error();
    }
    writeMetadata(finalPath, key, payload.mimeType, ext, payload.bytes.size());
    spdlog::debug("FileStore: wrote {} ({})", finalPath.string(),
                  formatByteCount(payload.bytes.size()));
    return finalPath;
}

Result<fs::path> FileStore::commitFile(const CacheKey& key, const fs::path& file,
                                       std::string_view mimeType) {
    const auto dir = directoryFor(key.kind);
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        return Error{ErrorCode::WriteError, "Failed to create cache dir: " + dir.string()};
    }

    const auto ext = normalizedExtension(file.extension().string());
    const auto finalPath = pathFor(key, ext);
    const auto size = fs::file_size(file, ec);
    if (ec) {
        return Error{ErrorCode::NotFound, "cannot stat " + file.string() + ": " + ec.message()};
    }

    // Stage next to the destination first so the final rename never crosses devices.
    const auto tempPath = dir / ("." + finalPath.filename().string() + "." + uniqueToken() + ".part");
    fs::rename(file, tempPath, ec);
    if (ec == std::errc::cross_device_link) {
        ec.clear();
        fs::copy_file(file, tempPath, fs::copy_options::overwrite_existing, ec);
        if (!ec) {
            std::error_code rm_ec;
            fs::remove(file, rm_ec);
        }
    }
    if (ec) {
        std::error_code rm_ec;
        fs::remove(tempPath, rm_ec);
        return Error{ErrorCode::WriteError,
                     "cannot stage " + file.string() + " into cache: " + ec.message()};
    }

    auto installed = install(tempPath, finalPath, key);
    if (!installed) {
        return installed.error();
    }
    writeMetadata(finalPath, key, mimeType, ext, size);
    spdlog::debug("FileStore: committed {} ({})", finalPath.string(), formatByteCount(size));
    return finalPath;
}

Result<void> FileStore::install(const fs::path& tempPath, const fs::path& finalPath,
                                const CacheKey& key) {
    std::error_code ec;
    fs::rename(tempPath, finalPath, ec);
    if (ec) {
        std::error_code rm_ec;
        fs::remove(tempPath, rm_ec);
        return Error{ErrorCode::WriteError, "rename() failed (" + ec.message() + ") from " +
                                                tempPath.string() + " to " + finalPath.string()};
    }

    // Same variant under a different extension would shadow the new file in find().
    const auto stem = variantStem(key);
    std::vector<fs::path> stale;
    for (const auto& entry : fs::directory_iterator(finalPath.parent_path(), ec)) {
        const auto& p = entry.path();
        if (p != finalPath && matchesStem(p.filename().string(), stem)) {
            stale.push_back(p);
        }
    }
    for (const auto& p : stale) {
        std::error_code rm_ec;
        fs::remove(p, rm_ec);
        fs::remove(metaPath(p), rm_ec);
    }
    return {};
}

bool FileStore::exists(std::string_view source, ResourceKind kind) const {
    const auto prefix = sourcePrefix(source);
    std::error_code ec;
    for (const auto& entry : fs::directory_iterator(directoryFor(kind), ec)) {
        const auto name = entry.path().filename().string();
        if (!isHidden(name) && !isSidecar(name) && name.starts_with(prefix)) {
            return true;
        }
    }
    return false;
}

Result<std::size_t> FileStore::removeSource(std::string_view source, ResourceKind kind) {
    const auto dir = directoryFor(kind);
    const auto prefix = sourcePrefix(source);

    std::error_code ec;
    std::vector<fs::path> matches;
    for (const auto& entry : fs::directory_iterator(dir, ec)) {
        const auto name = entry.path().filename().string();
        if (!isHidden(name) && name.starts_with(prefix)) {
            matches.push_back(entry.path());
        }
    }
    if (ec && ec != std::errc::no_such_file_or_directory) {
        return Error{ErrorCode::IoError, "cannot list " + dir.string() + ": " + ec.message()};
    }

    std::size_t removed = 0;
    for (const auto& p : matches) {
        std::error_code rm_ec;
        fs::remove(p, rm_ec);
        if (rm_ec) {
            spdlog::warn("FileStore: error deleting {}: {}", p.string(), rm_ec.message());
            continue;
        }
        if (!isSidecar(p.filename().string())) {
            ++removed;
        }
    }
    spdlog::debug("FileStore: removed {} {} file(s) for {}", removed, kindName(kind), source);
    return removed;
}

Result<std::size_t> FileStore::clear(ClearScope scope) {
    std::vector<fs::path> dirs;
    switch (scope) {
        case ClearScope::Videos:
            dirs.push_back(directoryFor(ResourceKind::Video));
            break;
        case ClearScope::Images:
            dirs.push_back(directoryFor(ResourceKind::Image));
            break;
        case ClearScope::All:
            dirs = {directoryFor(ResourceKind::Video), directoryFor(ResourceKind::Image),
                    scratchDirectory()};
            break;
    }

    std::size_t removed = 0;
    for (const auto& dir : dirs) {
        auto info = collectInfo(dir);
        spdlog::info("FileStore: clearing {} ({} file(s), {})", dir.string(), info.fileCount,
                     formatByteCount(info.totalBytes));
        auto r = removeEntries(dir);
        if (!r) {
            return r.error();
        }
        removed += r.value();
    }
    return removed;
}

DirectoryInfo FileStore::directoryInfo(ResourceKind kind) const {
    return collectInfo(directoryFor(kind));
}

DirectoryInfo FileStore::scratchInfo() const {
    return collectInfo(scratchDirectory());
}

Result<fs::path> FileStore::createScratchFile(ByteSpan bytes, std::string_view extension) {
    const auto dir = scratchDirectory();
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        return Error{ErrorCode::WriteError, "Failed to create scratch dir: " + dir.string()};
    }

    std::string name = uniqueToken();
    auto ext = normalizedExtension(extension);
    if (!ext.empty()) {
        name += "." + ext;
    }
    const auto path = dir / name;

    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        return Error{ErrorCode::WriteError, "Failed to create scratch file: " + path.string()};
    }
    out.write(reinterpret_cast<const char*>(bytes.data()),
              static_cast<std::streamsize>(bytes.size()));
    out.close();
    if (!out) {
        fs::remove(path, ec);
        return Error{ErrorCode::WriteError, "write failed on " + path.string()};
    }
    return path;
}

Result<fs::path> FileStore::moveToScratch(const fs::path& file) {
    const auto dir = scratchDirectory();
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        return Error{ErrorCode::WriteError, "Failed to create scratch dir: " + dir.string()};
    }

    const auto target = dir / (uniqueToken() + file.extension().string());
    fs::rename(file, target, ec);
    if (!ec) {
        return target;
    }
    if (ec != std::errc::cross_device_link) {
        return Error{ErrorCode::IoError, "rename() failed (" + ec.message() + ") from " +
                                             file.string() + " to " + target.string()};
    }

    spdlog::debug("FileStore: cross-device move of {}, copying", file.string());
    fs::copy_file(file, target, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        return Error{ErrorCode::IoError, "copy failed from " + file.string() + ": " + ec.message()};
    }
    fs::remove(file, ec);
    return target;
}

bool FileStore::removeScratch(const fs::path& file) {
    std::error_code ec;
    bool removed = fs::remove(file, ec);
    if (ec) {
        spdlog::debug("FileStore: failed to remove scratch file {}: {}", file.string(),
                      ec.message());
        return false;
    }
    return removed;
}

std::size_t FileStore::purgeScratch() {
    auto r = removeEntries(scratchDirectory());
    if (!r) {
        spdlog::warn("FileStore: {}", r.error().message);
        return 0;
    }
    return r.value();
}

} // namespace mediacache::cache
