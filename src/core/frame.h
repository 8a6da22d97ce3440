#pragma once

#include <cstddef>
#include <cstring>
#include <vector>

namespace pixunscale::core {

constexpr size_t NUM_CHANNELS = 4;
constexpr size_t CHANNEL_R = 0;
constexpr size_t CHANNEL_G = 1;
constexpr size_t CHANNEL_B = 2;
constexpr size_t CHANNEL_A = 3;

struct Color {
    unsigned char r = 0;
    unsigned char g = 0;
    unsigned char b = 0;
    unsigned char a = 0;

    bool operator==(const Color& other) const {
        return r == other.r && g == other.g && b == other.b && a == other.a;
    }

    bool operator!=(const Color& other) const {
        return !(*this == other);
    }
};

// Row-major RGBA8 pixel grid. delay_ms is carried through untouched.
struct Frame {
    int width = 0;
    int height = 0;
    int delay_ms = 0;
    std::vector<unsigned char> pixels;

    [[nodiscard]] size_t offset(int x, int y) const {
        return ((static_cast<size_t>(y) * static_cast<size_t>(width)) + static_cast<size_t>(x)) * NUM_CHANNELS;
    }

    [[nodiscard]] const unsigned char* row(int y) const {
        return pixels.data() + offset(0, y);
    }

    [[nodiscard]] Color pixel(int x, int y) const {
        const size_t idx = offset(x, y);
        return {.r = pixels[idx + CHANNEL_R], .g = pixels[idx + CHANNEL_G], .b = pixels[idx + CHANNEL_B], .a = pixels[idx + CHANNEL_A]};
    }

    void set_pixel(int x, int y, const Color& color) {
        const size_t idx = offset(x, y);
        pixels[idx + CHANNEL_R] = color.r;
        pixels[idx + CHANNEL_G] = color.g;
        pixels[idx + CHANNEL_B] = color.b;
        pixels[idx + CHANNEL_A] = color.a;
    }

    [[nodiscard]] bool same_pixel(int ax, int ay, int bx, int by) const {
        return std::memcmp(pixels.data() + offset(ax, ay), pixels.data() + offset(bx, by), NUM_CHANNELS) == 0;
    }

    [[nodiscard]] size_t byte_count() const {
        return static_cast<size_t>(width) * static_cast<size_t>(height) * NUM_CHANNELS;
    }
};

Frame make_frame(int width, int height, const Color& fill = {});

enum class ImageFormat {
    Unknown,
    Png,
    Gif,
    Jpeg,
    Bmp,
    Tga,
    Tar,
};

struct Image {
    ImageFormat format = ImageFormat::Unknown;
    std::vector<Frame> frames;

    [[nodiscard]] int width() const { return frames.empty() ? 0 : frames.front().width; }
    [[nodiscard]] int height() const { return frames.empty() ? 0 : frames.front().height; }
    [[nodiscard]] bool is_animated() const { return frames.size() > 1; }
};

} // namespace pixunscale::core
