#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "frame.h"

namespace pixunscale::core {

constexpr int k_max_image_dimension = 32768;
constexpr size_t k_max_total_pixels = 100000000;
constexpr int k_jpeg_quality = 95;

ImageFormat detect_image_format(const std::vector<unsigned char>& bytes, const std::filesystem::path& path);
ImageFormat format_from_extension(const std::filesystem::path& path);
const char* format_extension(ImageFormat format);
const char* format_name(ImageFormat format);
bool is_writable_still_format(ImageFormat format);
// Formats that keep every frame of an animation (GIF, tar archive).
bool is_animation_format(ImageFormat format);

bool read_file_bytes(const std::filesystem::path& path, std::vector<unsigned char>& out, std::string& error);
bool write_file_bytes(const std::filesystem::path& path, const std::vector<unsigned char>& bytes, std::string& error);

// GIF input yields every frame with its delay; anything else a single frame.
bool decode_image(
    const std::vector<unsigned char>& bytes,
    const std::filesystem::path& path,
    Image& out,
    std::string& error);
bool load_image_file(const std::filesystem::path& path, Image& out, std::string& error);

bool encode_frame(const Frame& frame, ImageFormat format, std::vector<unsigned char>& out, std::string& error);
bool save_frame_file(const Frame& frame, const std::filesystem::path& path, ImageFormat format, std::string& error);
bool save_animation_file(
    const std::vector<Frame>& frames,
    const std::filesystem::path& path,
    ImageFormat format,
    std::string& error);

// Tar with frame_NNNN.png entries and a frames.txt manifest of delays.
bool build_animation_archive(const std::vector<Frame>& frames, std::vector<unsigned char>& out, std::string& error);

std::string frame_entry_name(size_t index);

} // namespace pixunscale::core
