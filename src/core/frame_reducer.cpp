#include "frame_reducer.h"

#include <cstring>
#include <limits>
#include <stdexcept>
#include <string>

namespace pixunscale::core {

Frame make_frame(int width, int height, const Color& fill) {
    Frame frame;
    frame.width = width;
    frame.height = height;
    frame.pixels.resize(frame.byte_count());
    for (int y = 0; y < height; ++y) {
        for (int x = 0; x < width; ++x) {
            frame.set_pixel(x, y, fill);
        }
    }
    return frame;
}

Frame reduce_frame(const Frame& frame, int k) {
    if (k <= 0) {
        throw std::invalid_argument("reduction factor must be positive, got " + std::to_string(k));
    }
    if (frame.width <= 0 || frame.height <= 0 || frame.width % k != 0 || frame.height % k != 0) {
        throw std::invalid_argument(
            "reduction factor " + std::to_string(k) + " does not divide "
            + std::to_string(frame.width) + "x" + std::to_string(frame.height));
    }
    if (frame.pixels.size() != frame.byte_count()) {
        throw std::invalid_argument("frame pixel buffer has the wrong size");
    }

    Frame reduced;
    reduced.width = frame.width / k;
    reduced.height = frame.height / k;
    reduced.delay_ms = frame.delay_ms;
    reduced.pixels.resize(reduced.byte_count());

    for (int y = 0; y < reduced.height; ++y) {
        for (int x = 0; x < reduced.width; ++x) {
            std::memcpy(reduced.pixels.data() + reduced.offset(x, y),
                        frame.pixels.data() + frame.offset(x * k, y * k),
                        NUM_CHANNELS);
        }
    }
    return reduced;
}

Frame expand_frame(const Frame& frame, int k) {
    if (k <= 0) {
        throw std::invalid_argument("expansion factor must be positive, got " + std::to_string(k));
    }
    if (frame.width > std::numeric_limits<int>::max() / k || frame.height > std::numeric_limits<int>::max() / k) {
        throw std::invalid_argument("expanded frame is too large");
    }

    Frame expanded;
    expanded.width = frame.width * k;
    expanded.height = frame.height * k;
    expanded.delay_ms = frame.delay_ms;
    expanded.pixels.resize(expanded.byte_count());

    for (int y = 0; y < expanded.height; ++y) {
        for (int x = 0; x < expanded.width; ++x) {
            std::memcpy(expanded.pixels.data() + expanded.offset(x, y),
                        frame.pixels.data() + frame.offset(x / k, y / k),
                        NUM_CHANNELS);
        }
    }
    return expanded;
}

} // namespace pixunscale::core
