#pragma once

#include <vector>

#include "frame.h"

namespace pixunscale::core {

struct DetectionResult {
    int factor = 1;
    int width = 0;
    int height = 0;
};

// Common divisors of width and height, largest first. Always ends with 1.
std::vector<int> candidate_factors(int width, int height);

// True when every k-aligned k x k block of the frame is a single color.
bool is_uniform_at(const Frame& frame, int k);

// Largest factor at which every frame is uniform, or 1.
// Throws std::invalid_argument when frames is empty or sizes differ.
int detect_block_factor(const std::vector<Frame>& frames, unsigned int threads = 1);

DetectionResult detect(const std::vector<Frame>& frames, unsigned int threads = 1);

} // namespace pixunscale::core
