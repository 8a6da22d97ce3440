#pragma once

#include "frame.h"

namespace pixunscale::core {

// Collapses every k x k block to its top-left pixel.
// Throws std::invalid_argument unless k >= 1 divides both dimensions.
Frame reduce_frame(const Frame& frame, int k);

// Nearest-neighbor replication by k in both axes.
Frame expand_frame(const Frame& frame, int k);

} // namespace pixunscale::core
