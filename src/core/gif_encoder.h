#pragma once

#include <string>
#include <vector>

#include "frame.h"

namespace pixunscale::core {

constexpr size_t k_max_gif_colors = 256;
constexpr int k_max_gif_dimension = 65535;

// GIF89a with one global palette holding every exact color of every frame.
// Pixels with alpha 0 share the transparent index; other alpha values are
// written opaque. Animations loop forever and keep their per-frame delays
// (rounded to centiseconds). Fails when the frames use more than 256 colors.
bool encode_gif(const std::vector<Frame>& frames, std::vector<unsigned char>& out, std::string& error);

// Variable-width GIF LZW over palette indices, not yet split into sub-blocks.
std::vector<unsigned char> lzw_encode_indices(const std::vector<unsigned char>& indices, int min_code_size);

} // namespace pixunscale::core
