#pragma once

#include <optional>
#include <string>
#include <string_view>

#include <mediacache/cache/cache_key.h>

namespace mediacache::media {

inline constexpr std::string_view kDefaultMimeType = "application/octet-stream";

/**
 * Mime type for a file extension (with or without the leading dot, any case).
 * Unknown extensions map to application/octet-stream.
 */
std::string mimeTypeForExtension(std::string_view extension);

/**
 * Image or video, if the mime type is one of either.
 */
std::optional<cache::ResourceKind> kindForMimeType(std::string_view mimeType);

} // namespace mediacache::media
