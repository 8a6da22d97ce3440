#include <gtest/gtest.h>

#include <string>
#include <utility>
#include <vector>

#include <archive.h>
#include <archive_entry.h>

#include "core/frame_reducer.h"
#include "core/image_io.h"
#include "test_frames.h"

namespace pixunscale::test {
namespace {

using core::Image;
using core::ImageFormat;

// Two 1x1 frames (red, then blue) with 100 ms and 200 ms delays.
const std::vector<unsigned char> k_two_frame_gif = {
    'G', 'I', 'F', '8', '9', 'a',
    0x01, 0x00, 0x01, 0x00, 0x80, 0x00, 0x00,
    0xFF, 0x00, 0x00, 0x00, 0x00, 0xFF,
    0x21, 0xF9, 0x04, 0x00, 0x0A, 0x00, 0x00, 0x00,
    0x2C, 0x00, 0x00, 0x00, 0x00, 0x01, 0x00, 0x01, 0x00, 0x00,
    0x02, 0x02, 0x44, 0x01, 0x00,
    0x21, 0xF9, 0x04, 0x00, 0x14, 0x00, 0x00, 0x00,
    0x2C, 0x00, 0x00, 0x00, 0x00, 0x01, 0x00, 0x01, 0x00, 0x00,
    0x02, 0x02, 0x4C, 0x01, 0x00,
    0x3B,
};

struct ArchiveEntry {
    std::string name;
    std::vector<unsigned char> data;
};

std::vector<ArchiveEntry> read_tar(const std::vector<unsigned char>& bytes) {
    std::vector<ArchiveEntry> entries;
    struct archive* a = archive_read_new();
    archive_read_support_format_tar(a);
    if (archive_read_open_memory(a, bytes.data(), bytes.size()) != ARCHIVE_OK) {
        archive_read_free(a);
        return entries;
    }
    struct archive_entry* entry = nullptr;
    while (archive_read_next_header(a, &entry) == ARCHIVE_OK) {
        ArchiveEntry item;
        item.name = archive_entry_pathname(entry);
        item.data.resize(static_cast<size_t>(archive_entry_size(entry)));
        if (!item.data.empty()) {
            archive_read_data(a, item.data.data(), item.data.size());
        }
        entries.push_back(std::move(item));
    }
    archive_read_free(a);
    return entries;
}

TEST(FormatDetection, SniffsMagicBeforeExtension) {
    const std::vector<unsigned char> png = {0x89, 'P', 'N', 'G', 0x0D, 0x0A, 0x1A, 0x0A, 0x00};
    EXPECT_EQ(core::detect_image_format(png, "wrong.gif"), ImageFormat::Png);
    EXPECT_EQ(core::detect_image_format(k_two_frame_gif, "anim.png"), ImageFormat::Gif);
    EXPECT_EQ(core::detect_image_format({0xFF, 0xD8, 0xFF, 0xE0}, "x"), ImageFormat::Jpeg);
    EXPECT_EQ(core::detect_image_format({'B', 'M', 0, 0}, "x"), ImageFormat::Bmp);
    EXPECT_EQ(core::detect_image_format({0, 0, 2, 0}, "sprite.TGA"), ImageFormat::Tga);
    EXPECT_EQ(core::detect_image_format({0, 0, 2, 0}, "sprite"), ImageFormat::Unknown);
}

TEST(FormatDetection, ExtensionMapping) {
    EXPECT_EQ(core::format_from_extension("a.JPEG"), ImageFormat::Jpeg);
    EXPECT_EQ(core::format_from_extension("a.jpg"), ImageFormat::Jpeg);
    EXPECT_EQ(core::format_from_extension("a.tar"), ImageFormat::Tar);
    EXPECT_EQ(core::format_from_extension("a.webp"), ImageFormat::Unknown);
    EXPECT_STREQ(core::format_extension(ImageFormat::Jpeg), "jpg");
    EXPECT_TRUE(core::is_writable_still_format(ImageFormat::Png));
    EXPECT_FALSE(core::is_writable_still_format(ImageFormat::Gif));
    EXPECT_FALSE(core::is_writable_still_format(ImageFormat::Tar));
    EXPECT_TRUE(core::is_animation_format(ImageFormat::Gif));
    EXPECT_TRUE(core::is_animation_format(ImageFormat::Tar));
    EXPECT_FALSE(core::is_animation_format(ImageFormat::Png));
}

TEST(DecodeImage, GifKeepsEveryFrameAndDelay) {
    Image image;
    std::string error;
    ASSERT_TRUE(core::decode_image(k_two_frame_gif, "anim.gif", image, error)) << error;
    EXPECT_EQ(image.format, ImageFormat::Gif);
    ASSERT_EQ(image.frames.size(), 2U);
    EXPECT_TRUE(image.is_animated());
    EXPECT_EQ(image.width(), 1);
    EXPECT_EQ(image.height(), 1);
    EXPECT_EQ(image.frames[0].delay_ms, 100);
    EXPECT_EQ(image.frames[1].delay_ms, 200);
    EXPECT_EQ(image.frames[0].pixel(0, 0), k_red);
    EXPECT_EQ(image.frames[1].pixel(0, 0), k_blue);
}

TEST(DecodeImage, PngRoundTripIsLossless) {
    const Frame source = core::expand_frame(checkerboard_gradient(3, 2), 4);
    std::vector<unsigned char> bytes;
    std::string error;
    ASSERT_TRUE(core::encode_frame(source, ImageFormat::Png, bytes, error)) << error;

    Image image;
    ASSERT_TRUE(core::decode_image(bytes, "whatever", image, error)) << error;
    EXPECT_EQ(image.format, ImageFormat::Png);
    ASSERT_EQ(image.frames.size(), 1U);
    EXPECT_EQ(image.frames[0].width, source.width);
    EXPECT_EQ(image.frames[0].height, source.height);
    EXPECT_EQ(image.frames[0].pixels, source.pixels);
}

TEST(DecodeImage, RejectsGarbageAndEmptyInput) {
    Image image;
    std::string error;
    EXPECT_FALSE(core::decode_image({}, "empty.png", image, error));
    EXPECT_FALSE(error.empty());
    error.clear();
    EXPECT_FALSE(core::decode_image({'n', 'o', 'p', 'e'}, "junk.png", image, error));
    EXPECT_FALSE(error.empty());
}

TEST(EncodeFrame, StillFormatsProduceTheirMagic) {
    const Frame frame = core::make_frame(4, 4, k_green);
    std::vector<unsigned char> bytes;
    std::string error;
    ASSERT_TRUE(core::encode_frame(frame, ImageFormat::Bmp, bytes, error)) << error;
    EXPECT_EQ(core::detect_image_format(bytes, "x"), ImageFormat::Bmp);
    ASSERT_TRUE(core::encode_frame(frame, ImageFormat::Jpeg, bytes, error)) << error;
    EXPECT_EQ(core::detect_image_format(bytes, "x"), ImageFormat::Jpeg);
    ASSERT_TRUE(core::encode_frame(frame, ImageFormat::Tga, bytes, error)) << error;
    EXPECT_FALSE(bytes.empty());
}

TEST(EncodeFrame, GifStillDecodesBack) {
    const Frame frame = frame_from_rows({{k_red, k_blue}, {k_yellow, k_green}});
    std::vector<unsigned char> bytes;
    std::string error;
    ASSERT_TRUE(core::encode_frame(frame, ImageFormat::Gif, bytes, error)) << error;

    Image image;
    ASSERT_TRUE(core::decode_image(bytes, "still.gif", image, error)) << error;
    EXPECT_EQ(image.format, ImageFormat::Gif);
    ASSERT_EQ(image.frames.size(), 1U);
    EXPECT_EQ(image.frames[0].pixels, frame.pixels);
}

TEST(SaveAnimationFile, RejectsStillFormats) {
    std::string error;
    EXPECT_FALSE(core::save_animation_file({core::make_frame(2, 2, k_red)}, "unused.png", ImageFormat::Png, error));
    EXPECT_NE(error.find("PNG"), std::string::npos);
}

TEST(AnimationArchive, HoldsFramesAndDelayManifest) {
    Frame first = core::make_frame(2, 2, k_red);
    first.delay_ms = 80;
    Frame second = core::make_frame(2, 2, k_yellow);
    second.delay_ms = 160;

    std::vector<unsigned char> bytes;
    std::string error;
    ASSERT_TRUE(core::build_animation_archive({first, second}, bytes, error)) << error;

    const std::vector<ArchiveEntry> entries = read_tar(bytes);
    ASSERT_EQ(entries.size(), 3U);
    EXPECT_EQ(entries[0].name, "frame_0000.png");
    EXPECT_EQ(entries[1].name, "frame_0001.png");
    EXPECT_EQ(entries[2].name, "frames.txt");

    const std::string manifest(entries[2].data.begin(), entries[2].data.end());
    EXPECT_EQ(manifest, "frame \"frame_0000.png\" delay 80\nframe \"frame_0001.png\" delay 160\n");

    Image decoded;
    ASSERT_TRUE(core::decode_image(entries[1].data, entries[1].name, decoded, error)) << error;
    ASSERT_EQ(decoded.frames.size(), 1U);
    EXPECT_EQ(decoded.frames[0].pixel(1, 1), k_yellow);
}

TEST(AnimationArchive, RejectsEmptyFrameList) {
    std::vector<unsigned char> bytes;
    std::string error;
    EXPECT_FALSE(core::build_animation_archive({}, bytes, error));
    EXPECT_FALSE(error.empty());
}

} // namespace
} // namespace pixunscale::test
