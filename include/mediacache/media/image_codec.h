#pragma once

/*
 * Image decode / scale / encode for the resize stage and the decoded tier.
 *
 * Decoding goes through stb_image and always yields 8-bit RGBA. Encoding
 * writes PNG, or JPEG when the target extension asks for it (stb_image_write).
 */

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

#include <mediacache/cache/cache_key.h>
#include <mediacache/core/types.h>

namespace mediacache::media {

struct DecodedImage {
    int width{0};
    int height{0};
    static constexpr int kChannels = 4; // RGBA
    std::vector<std::uint8_t> pixels;

    /// In-memory cost estimate: pixel dimensions x bytes-per-pixel.
    std::size_t costBytes() const {
        return static_cast<std::size_t>(width) * static_cast<std::size_t>(height) * kChannels;
    }
    bool empty() const { return width <= 0 || height <= 0 || pixels.empty(); }
};

struct ResizedImage {
    DecodedImage image;
    ByteVector encoded;
};

Result<DecodedImage> decodeImage(ByteSpan encoded);

/**
 * Largest size that fits within bounds while preserving the aspect ratio:
 * the source is scaled by min(bounds.w / w, bounds.h / h). Never below 1x1.
 */
std::pair<int, int> fitWithin(int width, int height, const cache::RenderSize& bounds);

/**
 * Bilinear resample to exactly width x height.
 */
DecodedImage resizeImage(const DecodedImage& source, int width, int height);

/**
 * Encode as JPEG for "jpg"/"jpeg" extensions, PNG otherwise.
 */
Result<ByteVector> encodeImage(const DecodedImage& image, std::string_view extension);

/**
 * Decode the file, fit it within bounds and re-encode it. Best effort: any
 * failure is logged and yields nullopt.
 */
std::optional<ResizedImage> resizeImageFile(const std::filesystem::path& file,
                                            const cache::RenderSize& bounds,
                                            std::string_view extension);

} // namespace mediacache::media
