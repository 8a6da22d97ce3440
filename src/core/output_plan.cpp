#include "output_plan.h"

#include <utility>

#include "cli_parse.h"
#include "image_io.h"

namespace pixunscale::core {

namespace {

bool is_writable_format(ImageFormat format) {
    return is_writable_still_format(format) || is_animation_format(format);
}

} // namespace

bool plan_output(
    const std::optional<std::filesystem::path>& explicit_output,
    const std::filesystem::path& input,
    bool in_place,
    ImageFormat input_format,
    size_t frame_count,
    OutputPlan& out,
    std::string& error) {
    OutputPlan plan;
    if (explicit_output.has_value()) {
        plan.format = format_from_extension(*explicit_output);
        if (!is_writable_format(plan.format)) {
            error = "unsupported output format for " + to_quoted(explicit_output->string())
                + "; use .png, .gif, .jpg, .bmp, .tga or .tar";
            return false;
        }
    } else if (in_place) {
        plan.format = input_format;
        if (!is_writable_format(plan.format)) {
            error = std::string("cannot write ") + format_name(input_format)
                + " images in place; give an output path instead";
            return false;
        }
    } else {
        plan.format = is_writable_format(input_format) ? input_format : ImageFormat::Png;
    }

    plan.path = resolve_output_path(explicit_output, input, in_place, format_extension(plan.format));
    plan.first_frame_only = frame_count > 1 && is_writable_still_format(plan.format);
    out = std::move(plan);
    return true;
}

} // namespace pixunscale::core
