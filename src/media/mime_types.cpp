#include <mediacache/media/mime_types.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <utility>

namespace mediacache::media {

namespace {

struct MimeEntry {
    std::string_view extension;
    std::string_view mimeType;
};

consteval auto createMimeTable() {
    return std::array{
        MimeEntry{"jpg", "image/jpeg"},        MimeEntry{"jpeg", "image/jpeg"},
        MimeEntry{"png", "image/png"},         MimeEntry{"gif", "image/gif"},
        MimeEntry{"bmp", "image/bmp"},         MimeEntry{"webp", "image/webp"},
        MimeEntry{"heic", "image/heic"},       MimeEntry{"tif", "image/tiff"},
        MimeEntry{"tiff", "image/tiff"},       MimeEntry{"mp4", "video/mp4"},
        MimeEntry{"m4v", "video/x-m4v"},       MimeEntry{"mov", "video/quicktime"},
        MimeEntry{"webm", "video/webm"},       MimeEntry{"mkv", "video/x-matroska"},
        MimeEntry{"avi", "video/x-msvideo"},   MimeEntry{"3gp", "video/3gpp"},
        MimeEntry{"ts", "video/mp2t"},         MimeEntry{"m3u8", "application/x-mpegURL"},
        MimeEntry{"mp3", "audio/mpeg"},        MimeEntry{"m4a", "audio/mp4"},
    };
}

constexpr auto kMimeTable = createMimeTable();

std::string lowered(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s) {
        out.push_back(static_cast<char>(std::tolower(c)));
    }
    return out;
}

} // namespace

std::string mimeTypeForExtension(std::string_view extension) {
    if (!extension.empty() && extension.front() == '.') {
        extension.remove_prefix(1);
    }
    const auto ext = lowered(extension);
    auto it = std::find_if(kMimeTable.begin(), kMimeTable.end(),
                           [&ext](const MimeEntry& e) { return e.extension == ext; });
    if (it == kMimeTable.end()) {
        return std::string(kDefaultMimeType);
    }
    return std::string(it->mimeType);
}

std::optional<cache::ResourceKind> kindForMimeType(std::string_view mimeType) {
    const auto mime = lowered(mimeType);
    if (mime.starts_with("image/")) {
        return cache::ResourceKind::Image;
    }
    if (mime.starts_with("video/") || mime == "application/x-mpegurl") {
        return cache::ResourceKind::Video;
    }
    return std::nullopt;
}

} // namespace mediacache::media
