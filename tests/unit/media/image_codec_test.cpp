#include <gtest/gtest.h>

#include <mediacache/media/image_codec.h>

#include "../../common/test_helpers.h"

using namespace mediacache;
using namespace mediacache::media;
namespace fs = std::filesystem;

namespace {

DecodedImage solidImage(int width, int height, std::uint8_t r, std::uint8_t g, std::uint8_t b) {
    DecodedImage image;
    image.width = width;
    image.height = height;
    image.pixels.reserve(static_cast<std::size_t>(width) * height * DecodedImage::kChannels);
    for (int i = 0; i < width * height; ++i) {
        image.pixels.insert(image.pixels.end(), {r, g, b, 255});
    }
    return image;
}

} // namespace

// ===== Geometry =====

TEST(ImageCodecTest, FitWithinPreservesAspectRatio) {
    EXPECT_EQ(fitWithin(1000, 500, {200, 200}), std::make_pair(200, 100));
    EXPECT_EQ(fitWithin(500, 1000, {200, 200}), std::make_pair(100, 200));
    EXPECT_EQ(fitWithin(100, 50, {400, 400}), std::make_pair(400, 200));
    EXPECT_EQ(fitWithin(3000, 10, {100, 100}), std::make_pair(100, 1));
}

TEST(ImageCodecTest, FitWithinHandlesDegenerateInput) {
    EXPECT_EQ(fitWithin(0, 10, {100, 100}), std::make_pair(1, 10));
    EXPECT_EQ(fitWithin(10, 10, {0, 100}), std::make_pair(10, 10));
}

TEST(ImageCodecTest, ResizeProducesRequestedDimensions) {
    auto source = solidImage(8, 4, 10, 200, 30);
    auto resized = resizeImage(source, 3, 2);
    EXPECT_EQ(resized.width, 3);
    EXPECT_EQ(resized.height, 2);
    ASSERT_EQ(resized.pixels.size(), 3u * 2u * 4u);
    // A solid colour stays solid under bilinear sampling.
    EXPECT_EQ(resized.pixels[0], 10);
    EXPECT_EQ(resized.pixels[1], 200);
    EXPECT_EQ(resized.pixels[2], 30);
    EXPECT_EQ(resized.pixels[3], 255);
}

// ===== Encode / decode =====

TEST(ImageCodecTest, PngKeepsPixelsExactly) {
    auto source = solidImage(5, 3, 1, 2, 3);
    source.pixels[0] = 99;
    auto png = encodeImage(source, "png");
    ASSERT_TRUE(png);

    auto decoded = decodeImage(png.value());
    ASSERT_TRUE(decoded) << decoded.error().message;
    EXPECT_EQ(decoded.value().width, 5);
    EXPECT_EQ(decoded.value().height, 3);
    EXPECT_EQ(decoded.value().pixels, source.pixels);
    EXPECT_EQ(decoded.value().costBytes(), 5u * 3u * 4u);
}

TEST(ImageCodecTest, JpegExtensionSelectsJpeg) {
    auto jpg = encodeImage(solidImage(16, 16, 128, 128, 128), "jpeg");
    ASSERT_TRUE(jpg);
    ASSERT_GE(jpg.value().size(), 3u);
    EXPECT_EQ(jpg.value()[0], std::byte{0xFF});
    EXPECT_EQ(jpg.value()[1], std::byte{0xD8});

    auto decoded = decodeImage(jpg.value());
    ASSERT_TRUE(decoded);
    EXPECT_EQ(decoded.value().width, 16);
}

TEST(ImageCodecTest, EmptyImageCannotBeEncoded) {
    auto r = encodeImage(DecodedImage{}, "png");
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::InvalidArgument);
}

TEST(ImageCodecTest, GarbageIsInvalidData) {
    auto r = decodeImage(asBytes("definitely not an image"));
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::InvalidData);
}

// ===== File resize =====

TEST(ImageCodecTest, ResizeImageFileFitsAndEncodes) {
    mediacache::tests::ScopedTempDir dir("mediacache_codec_");
    auto png = encodeImage(solidImage(60, 30, 0, 0, 255), "png");
    ASSERT_TRUE(png);
    auto file = mediacache::tests::write_file(dir.path() / "in.png",
                                              mediacache::tests::to_string(png.value()));

    auto resized = resizeImageFile(file, {20, 20}, "png");
    ASSERT_TRUE(resized.has_value());
    EXPECT_EQ(resized->image.width, 20);
    EXPECT_EQ(resized->image.height, 10);

    auto roundTrip = decodeImage(resized->encoded);
    ASSERT_TRUE(roundTrip);
    EXPECT_EQ(roundTrip.value().width, 20);

    EXPECT_FALSE(resizeImageFile(dir.path() / "missing.png", {20, 20}, "png").has_value());
}
