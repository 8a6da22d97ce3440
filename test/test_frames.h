#pragma once

#include <vector>

#include "core/frame.h"

namespace pixunscale::test {

using core::Color;
using core::Frame;

inline constexpr Color k_red{.r = 255, .g = 0, .b = 0, .a = 255};
inline constexpr Color k_green{.r = 0, .g = 255, .b = 0, .a = 255};
inline constexpr Color k_blue{.r = 0, .g = 0, .b = 255, .a = 255};
inline constexpr Color k_yellow{.r = 255, .g = 255, .b = 0, .a = 255};
inline constexpr Color k_clear{.r = 0, .g = 0, .b = 0, .a = 0};

// Builds a frame from rows of colors; rows[y][x].
inline Frame frame_from_rows(const std::vector<std::vector<Color>>& rows, int delay_ms = 0) {
    const int height = static_cast<int>(rows.size());
    const int width = static_cast<int>(rows.front().size());
    Frame frame = core::make_frame(width, height);
    frame.delay_ms = delay_ms;
    for (int y = 0; y < height; ++y) {
        for (int x = 0; x < width; ++x) {
            frame.set_pixel(x, y, rows[static_cast<size_t>(y)][static_cast<size_t>(x)]);
        }
    }
    return frame;
}

// Every pixel distinct from its neighbours, so no factor above 1 fits.
inline Frame checkerboard_gradient(int width, int height) {
    Frame frame = core::make_frame(width, height);
    for (int y = 0; y < height; ++y) {
        for (int x = 0; x < width; ++x) {
            frame.set_pixel(x, y, Color{
                .r = static_cast<unsigned char>((x * 37) & 0xFF),
                .g = static_cast<unsigned char>((y * 53) & 0xFF),
                .b = static_cast<unsigned char>(((x + y) % 2) * 200),
                .a = 255});
        }
    }
    return frame;
}

} // namespace pixunscale::test
