#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>

#include "frame.h"

namespace pixunscale::core {

struct OutputPlan {
    ImageFormat format = ImageFormat::Unknown;
    std::filesystem::path path;
    // A still format was chosen for an animation; only the first frame is written.
    bool first_frame_only = false;
};

// Where and how the reduced image is written.
//   explicit output: format from its extension, which must be writable
//   in place:        the input's own format, which must be writable
//   otherwise:       the input format when writable, else PNG,
//                    as <stem>.scaled.<ext> beside the input
// Never writes bytes of one format under another format's name; returns
// false with a message instead.
bool plan_output(
    const std::optional<std::filesystem::path>& explicit_output,
    const std::filesystem::path& input,
    bool in_place,
    ImageFormat input_format,
    size_t frame_count,
    OutputPlan& out,
    std::string& error);

} // namespace pixunscale::core
