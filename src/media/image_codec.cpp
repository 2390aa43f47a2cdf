#include <mediacache/media/image_codec.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstring>
#include <fstream>
#include <iterator>
#include <string>

#define STB_IMAGE_STATIC
#define STB_IMAGE_IMPLEMENTATION
#include <stb_image.h>

#define STB_IMAGE_WRITE_STATIC
#define STB_IMAGE_WRITE_IMPLEMENTATION
#include <stb_image_write.h>

namespace mediacache::media {

namespace {

constexpr int kJpegQuality = 90;

void appendToVector(void* context, void* data, int size) {
    auto* out = static_cast<ByteVector*>(context);
    const auto* bytes = static_cast<const std::byte*>(data);
    out->insert(out->end(), bytes, bytes + size);
}

bool isJpegExtension(std::string_view extension) {
    std::string ext;
    for (unsigned char c : extension) {
        if (c != '.')
            ext.push_back(static_cast<char>(std::tolower(c)));
    }
    return ext == "jpg" || ext == "jpeg";
}

} // namespace

Result<DecodedImage> decodeImage(ByteSpan encoded) {
    if (encoded.empty()) {
        return Error{ErrorCode::InvalidData, "empty image payload"};
    }
    int width = 0;
    int height = 0;
    int channels = 0;
    stbi_uc* pixels = stbi_load_from_memory(reinterpret_cast<const stbi_uc*>(encoded.data()),
                                            static_cast<int>(encoded.size()), &width, &height,
                                            &channels, DecodedImage::kChannels);
    if (pixels == nullptr) {
        return Error{ErrorCode::InvalidData,
                     std::string("image decode failed: ") + stbi_failure_reason()};
    }

    DecodedImage image;
    image.width = width;
    image.height = height;
    const auto count = image.costBytes();
    image.pixels.assign(pixels, pixels + count);
    stbi_image_free(pixels);
    return image;
}

std::pair<int, int> fitWithin(int width, int height, const cache::RenderSize& bounds) {
    if (width <= 0 || height <= 0 || !bounds.valid()) {
        return {std::max(width, 1), std::max(height, 1)};
    }
    const double widthRatio = bounds.width / static_cast<double>(width);
    const double heightRatio = bounds.height / static_cast<double>(height);
    const double ratio = std::min(widthRatio, heightRatio);
    const int w = std::max(1, static_cast<int>(std::lround(width * ratio)));
    const int h = std::max(1, static_cast<int>(std::lround(height * ratio)));
    return {w, h};
}

DecodedImage resizeImage(const DecodedImage& source, int width, int height) {
    DecodedImage out;
    if (source.empty() || width <= 0 || height <= 0) {
        return out;
    }
    out.width = width;
    out.height = height;
    out.pixels.resize(out.costBytes());

    constexpr int C = DecodedImage::kChannels;
    const double sx = static_cast<double>(source.width) / width;
    const double sy = static_cast<double>(source.height) / height;

    for (int y = 0; y < height; ++y) {
        const double fy = std::clamp((y + 0.5) * sy - 0.5, 0.0, source.height - 1.0);
        const int y0 = static_cast<int>(fy);
        const int y1 = std::min(y0 + 1, source.height - 1);
        const double wy = fy - y0;
        for (int x = 0; x < width; ++x) {
            const double fx = std::clamp((x + 0.5) * sx - 0.5, 0.0, source.width - 1.0);
            const int x0 = static_cast<int>(fx);
            const int x1 = std::min(x0 + 1, source.width - 1);
            const double wx = fx - x0;

            const auto* p00 = &source.pixels[(static_cast<std::size_t>(y0) * source.width + x0) * C];
            const auto* p01 = &source.pixels[(static_cast<std::size_t>(y0) * source.width + x1) * C];
            const auto* p10 = &source.pixels[(static_cast<std::size_t>(y1) * source.width + x0) * C];
            const auto* p11 = &source.pixels[(static_cast<std::size_t>(y1) * source.width + x1) * C];
            auto* dst = &out.pixels[(static_cast<std::size_t>(y) * width + x) * C];
            for (int c = 0; c < C; ++c) {
                const double top = p00[c] + (p01[c] - p00[c]) * wx;
                const double bottom = p10[c] + (p11[c] - p10[c]) * wx;
                const double v = top + (bottom - top) * wy;
                dst[c] = static_cast<std::uint8_t>(std::clamp(std::lround(v), 0L, 255L));
            }
        }
    }
    return out;
}

Result<ByteVector> encodeImage(const DecodedImage& image, std::string_view extension) {
    if (image.empty()) {
        return Error{ErrorCode::InvalidArgument, "cannot encode an empty image"};
    }
    ByteVector out;
    int ok = 0;
    if (isJpegExtension(extension)) {
        ok = stbi_write_jpg_to_func(appendToVector, &out, image.width, image.height,
                                    DecodedImage::kChannels, image.pixels.data(), kJpegQuality);
    } else {
        ok = stbi_write_png_to_func(appendToVector, &out, image.width, image.height,
                                    DecodedImage::kChannels, image.pixels.data(),
                                    image.width * DecodedImage::kChannels);
    }
    if (ok == 0 || out.empty()) {
        return Error{ErrorCode::InvalidData, "image encode failed"};
    }
    return out;
}

std::optional<ResizedImage> resizeImageFile(const std::filesystem::path& file,
                                            const cache::RenderSize& bounds,
                                            std::string_view extension) {
    if (!bounds.valid()) {
        spdlog::debug("resizeImageFile: invalid bounds {}x{}", bounds.width, bounds.height);
        return std::nullopt;
    }
    std::ifstream in(file, std::ios::binary);
    if (!in) {
        spdlog::warn("resizeImageFile: cannot open {}", file.string());
        return std::nullopt;
    }
    std::vector<char> raw((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    ByteSpan bytes{reinterpret_cast<const std::byte*>(raw.data()), raw.size()};

    auto decoded = decodeImage(bytes);
    if (!decoded) {
        spdlog::warn("resizeImageFile: {}: {}", file.string(), decoded.error().message);
        return std::nullopt;
    }

    const auto& source = decoded.value();
    auto [w, h] = fitWithin(source.width, source.height, bounds);

    ResizedImage result;
    result.image = resizeImage(source, w, h);
    auto encoded = encodeImage(result.image, extension);
    if (!encoded) {
        spdlog::warn("resizeImageFile: {}: {}", file.string(), encoded.error().message);
        return std::nullopt;
    }
    result.encoded = std::move(encoded).value();
    spdlog::debug("resizeImageFile: {} {}x{} -> {}x{} ({} bytes)", file.string(), source.width,
                  source.height, w, h, result.encoded.size());
    return result;
}

} // namespace mediacache::media
