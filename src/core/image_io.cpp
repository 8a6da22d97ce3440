#include "image_io.h"

#include <cstdlib>
#include <ctime>
#include <fstream>
#include <initializer_list>
#include <iomanip>
#include <iterator>
#include <limits>
#include <memory>
#include <sstream>

#include "cli_parse.h"
#include "gif_encoder.h"

#define STB_IMAGE_IMPLEMENTATION
#include <stb_image.h>
#define STB_IMAGE_WRITE_IMPLEMENTATION
#include <stb_image_write.h>

// Libarchive for proper tar format
#include <archive.h>
#include <archive_entry.h>

namespace pixunscale::core {

namespace {

constexpr int DEFAULT_FILE_PERMISSIONS = 0644;
constexpr const char* MANIFEST_NAME = "frames.txt";

bool starts_with_bytes(const std::vector<unsigned char>& bytes, std::initializer_list<unsigned char> magic) {
    if (bytes.size() < magic.size()) {
        return false;
    }
    size_t i = 0;
    for (unsigned char b : magic) {
        if (bytes[i++] != b) {
            return false;
        }
    }
    return true;
}

std::string archive_error(struct archive* a) {
    const char* message = archive_error_string(a);
    return message != nullptr ? message : "unknown archive error";
}

bool checked_frame_size(int width, int height, std::string& error) {
    if (width <= 0 || height <= 0 || width > k_max_image_dimension || height > k_max_image_dimension) {
        error = "invalid image dimensions " + std::to_string(width) + "x" + std::to_string(height);
        return false;
    }
    const size_t total_pixels = static_cast<size_t>(width) * static_cast<size_t>(height);
    if (total_pixels > k_max_total_pixels) {
        error = "image too large: " + std::to_string(total_pixels) + " pixels";
        return false;
    }
    return true;
}

void append_to_vector(void* context, void* data, int size) {
    auto* out = static_cast<std::vector<unsigned char>*>(context);
    const auto* begin = static_cast<const unsigned char*>(data);
    out->insert(out->end(), begin, begin + size);
}

bool decode_gif(const std::vector<unsigned char>& bytes, Image& out, std::string& error) {
    int* delays_raw = nullptr;
    int width = 0;
    int height = 0;
    int layers = 0;
    int channels = 0;
    unsigned char* data_raw = stbi_load_gif_from_memory(
        bytes.data(), static_cast<int>(bytes.size()), &delays_raw,
        &width, &height, &layers, &channels, static_cast<int>(NUM_CHANNELS));
    std::unique_ptr<int, void (*)(void*)> delays(delays_raw, std::free);
    if (data_raw == nullptr) {
        error = stbi_failure_reason() != nullptr ? stbi_failure_reason() : "unknown GIF decode failure";
        return false;
    }
    std::unique_ptr<unsigned char, void (*)(void*)> data(data_raw, stbi_image_free);

    if (!checked_frame_size(width, height, error)) {
        return false;
    }
    if (layers <= 0) {
        error = "GIF has no frames";
        return false;
    }

    const size_t frame_bytes = static_cast<size_t>(width) * static_cast<size_t>(height) * NUM_CHANNELS;
    out.format = ImageFormat::Gif;
    out.frames.clear();
    out.frames.reserve(static_cast<size_t>(layers));
    for (int i = 0; i < layers; ++i) {
        Frame frame;
        frame.width = width;
        frame.height = height;
        frame.delay_ms = delays ? delays.get()[i] : 0;
        const unsigned char* begin = data.get() + (frame_bytes * static_cast<size_t>(i));
        frame.pixels.assign(begin, begin + frame_bytes);
        out.frames.push_back(std::move(frame));
    }
    return true;
}

bool decode_still(const std::vector<unsigned char>& bytes, ImageFormat format, Image& out, std::string& error) {
    int width = 0;
    int height = 0;
    int channels = 0;
    unsigned char* data_raw = stbi_load_from_memory(
        bytes.data(), static_cast<int>(bytes.size()), &width, &height, &channels, static_cast<int>(NUM_CHANNELS));
    if (data_raw == nullptr) {
        error = stbi_failure_reason() != nullptr ? stbi_failure_reason() : "unknown decode failure";
        return false;
    }
    std::unique_ptr<unsigned char, void (*)(void*)> data(data_raw, stbi_image_free);

    if (!checked_frame_size(width, height, error)) {
        return false;
    }

    Frame frame;
    frame.width = width;
    frame.height = height;
    frame.pixels.assign(data.get(), data.get() + frame.byte_count());
    out.format = format;
    out.frames.clear();
    out.frames.push_back(std::move(frame));
    return true;
}

bool add_archive_entry(struct archive* a, const std::string& name, const std::vector<unsigned char>& payload, std::string& error) {
    struct archive_entry* entry = archive_entry_new();
    if (entry == nullptr) {
        error = "failed to allocate archive entry";
        return false;
    }

    archive_entry_set_pathname(entry, name.c_str());
    archive_entry_set_size(entry, static_cast<la_int64_t>(payload.size()));
    archive_entry_set_filetype(entry, AE_IFREG);
    archive_entry_set_perm(entry, DEFAULT_FILE_PERMISSIONS);
    archive_entry_set_mtime(entry, time(nullptr), 0);

    if (archive_write_header(a, entry) != ARCHIVE_OK) {
        error = "failed to write archive header: " + archive_error(a);
        archive_entry_free(entry);
        return false;
    }

    if (archive_write_data(a, payload.data(), payload.size()) != static_cast<la_ssize_t>(payload.size())) {
        error = "failed to write archive data: " + archive_error(a);
        archive_entry_free(entry);
        return false;
    }

    archive_entry_free(entry);
    return true;
}

} // namespace

ImageFormat format_from_extension(const std::filesystem::path& path) {
    const std::string extension = to_lower_copy(path.extension().string());
    if (extension == ".png") {
        return ImageFormat::Png;
    }
    if (extension == ".gif") {
        return ImageFormat::Gif;
    }
    if (extension == ".jpg" || extension == ".jpeg") {
        return ImageFormat::Jpeg;
    }
    if (extension == ".bmp") {
        return ImageFormat::Bmp;
    }
    if (extension == ".tga") {
        return ImageFormat::Tga;
    }
    if (extension == ".tar") {
        return ImageFormat::Tar;
    }
    return ImageFormat::Unknown;
}

ImageFormat detect_image_format(const std::vector<unsigned char>& bytes, const std::filesystem::path& path) {
    if (starts_with_bytes(bytes, {0x89, 'P', 'N', 'G', 0x0D, 0x0A, 0x1A, 0x0A})) {
        return ImageFormat::Png;
    }
    if (starts_with_bytes(bytes, {'G', 'I', 'F', '8'})) {
        return ImageFormat::Gif;
    }
    if (starts_with_bytes(bytes, {0xFF, 0xD8, 0xFF})) {
        return ImageFormat::Jpeg;
    }
    if (starts_with_bytes(bytes, {'B', 'M'})) {
        return ImageFormat::Bmp;
    }
    // TGA has no magic number.
    return format_from_extension(path);
}

const char* format_extension(ImageFormat format) {
    switch (format) {
        case ImageFormat::Png: return "png";
        case ImageFormat::Gif: return "gif";
        case ImageFormat::Jpeg: return "jpg";
        case ImageFormat::Bmp: return "bmp";
        case ImageFormat::Tga: return "tga";
        case ImageFormat::Tar: return "tar";
        case ImageFormat::Unknown: break;
    }
    return "png";
}

const char* format_name(ImageFormat format) {
    switch (format) {
        case ImageFormat::Png: return "PNG";
        case ImageFormat::Gif: return "GIF";
        case ImageFormat::Jpeg: return "JPEG";
        case ImageFormat::Bmp: return "BMP";
        case ImageFormat::Tga: return "TGA";
        case ImageFormat::Tar: return "TAR";
        case ImageFormat::Unknown: break;
    }
    return "unknown";
}

bool is_writable_still_format(ImageFormat format) {
    return format == ImageFormat::Png || format == ImageFormat::Jpeg
        || format == ImageFormat::Bmp || format == ImageFormat::Tga;
}

bool is_animation_format(ImageFormat format) {
    return format == ImageFormat::Gif || format == ImageFormat::Tar;
}

bool read_file_bytes(const std::filesystem::path& path, std::vector<unsigned char>& out, std::string& error) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        error = "cannot open file";
        return false;
    }
    out.assign(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
    if (file.bad()) {
        error = "read error";
        return false;
    }
    return true;
}

bool write_file_bytes(const std::filesystem::path& path, const std::vector<unsigned char>& bytes, std::string& error) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        error = "cannot open " + to_quoted(path.string()) + " for writing";
        return false;
    }
    file.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    if (!file) {
        error = "failed to write " + to_quoted(path.string());
        return false;
    }
    return true;
}

bool decode_image(
    const std::vector<unsigned char>& bytes,
    const std::filesystem::path& path,
    Image& out,
    std::string& error) {
    if (bytes.empty()) {
        error = "empty input";
        return false;
    }
    if (bytes.size() > static_cast<size_t>(std::numeric_limits<int>::max())) {
        error = "input too large";
        return false;
    }

    const ImageFormat format = detect_image_format(bytes, path);
    if (format == ImageFormat::Gif) {
        return decode_gif(bytes, out, error);
    }
    return decode_still(bytes, format, out, error);
}

bool load_image_file(const std::filesystem::path& path, Image& out, std::string& error) {
    std::vector<unsigned char> bytes;
    if (!read_file_bytes(path, bytes, error)) {
        return false;
    }
    return decode_image(bytes, path, out, error);
}

bool encode_frame(const Frame& frame, ImageFormat format, std::vector<unsigned char>& out, std::string& error) {
    if (frame.width <= 0 || frame.height <= 0 || frame.pixels.size() != frame.byte_count()) {
        error = "invalid frame";
        return false;
    }

    out.clear();
    const int comp = static_cast<int>(NUM_CHANNELS);
    int ok = 0;
    switch (format) {
        case ImageFormat::Png:
            ok = stbi_write_png_to_func(append_to_vector, &out, frame.width, frame.height, comp,
                                        frame.pixels.data(), frame.width * comp);
            break;
        case ImageFormat::Bmp:
            ok = stbi_write_bmp_to_func(append_to_vector, &out, frame.width, frame.height, comp, frame.pixels.data());
            break;
        case ImageFormat::Tga:
            ok = stbi_write_tga_to_func(append_to_vector, &out, frame.width, frame.height, comp, frame.pixels.data());
            break;
        case ImageFormat::Jpeg:
            ok = stbi_write_jpg_to_func(append_to_vector, &out, frame.width, frame.height, comp,
                                        frame.pixels.data(), k_jpeg_quality);
            break;
        case ImageFormat::Gif:
            return encode_gif(std::vector<Frame>{frame}, out, error);
        default:
            error = std::string("writing ") + format_name(format) + " images is not supported";
            return false;
    }

    if (ok == 0) {
        error = std::string("failed to encode ") + format_name(format);
        return false;
    }
    return true;
}

bool save_frame_file(const Frame& frame, const std::filesystem::path& path, ImageFormat format, std::string& error) {
    std::vector<unsigned char> bytes;
    if (!encode_frame(frame, format, bytes, error)) {
        return false;
    }
    return write_file_bytes(path, bytes, error);
}

bool save_animation_file(
    const std::vector<Frame>& frames,
    const std::filesystem::path& path,
    ImageFormat format,
    std::string& error) {
    std::vector<unsigned char> bytes;
    if (format == ImageFormat::Gif) {
        if (!encode_gif(frames, bytes, error)) {
            return false;
        }
    } else if (format == ImageFormat::Tar) {
        if (!build_animation_archive(frames, bytes, error)) {
            return false;
        }
    } else {
        error = std::string("writing animated ") + format_name(format) + " images is not supported";
        return false;
    }
    return write_file_bytes(path, bytes, error);
}

std::string frame_entry_name(size_t index) {
    std::ostringstream name;
    name << "frame_" << std::setw(4) << std::setfill('0') << index << ".png";
    return name.str();
}

bool build_animation_archive(const std::vector<Frame>& frames, std::vector<unsigned char>& out, std::string& error) {
    if (frames.empty()) {
        error = "no frames to archive";
        return false;
    }

    struct archive* a = archive_write_new();
    if (a == nullptr) {
        error = "failed to create archive writer";
        return false;
    }
    std::unique_ptr<struct archive, int (*)(struct archive*)> writer(a, archive_write_free);

    if (archive_write_set_format_pax_restricted(a) != ARCHIVE_OK) {
        error = "failed to set archive format: " + archive_error(a);
        return false;
    }
    if (archive_write_add_filter_none(a) != ARCHIVE_OK) {
        error = "failed to set compression: " + archive_error(a);
        return false;
    }

    out.clear();
    auto write_callback = [](struct archive* /*unused*/, void* client_data, const void* buffer, size_t length) -> la_ssize_t {
        auto* target = static_cast<std::vector<unsigned char>*>(client_data);
        const auto* begin = static_cast<const unsigned char*>(buffer);
        target->insert(target->end(), begin, begin + length);
        return static_cast<la_ssize_t>(length);
    };

    if (archive_write_open(a, &out, nullptr, write_callback, nullptr) != ARCHIVE_OK) {
        error = "failed to open archive: " + archive_error(a);
        return false;
    }

    std::ostringstream manifest;
    for (size_t i = 0; i < frames.size(); ++i) {
        const std::string name = frame_entry_name(i);
        std::vector<unsigned char> png;
        if (!encode_frame(frames[i], ImageFormat::Png, png, error)) {
            return false;
        }
        if (!add_archive_entry(a, name, png, error)) {
            return false;
        }
        manifest << "frame " << to_quoted(name) << " delay " << frames[i].delay_ms << "\n";
    }

    const std::string manifest_text = manifest.str();
    const std::vector<unsigned char> manifest_bytes(manifest_text.begin(), manifest_text.end());
    if (!add_archive_entry(a, MANIFEST_NAME, manifest_bytes, error)) {
        return false;
    }

    if (archive_write_close(a) != ARCHIVE_OK) {
        error = "failed to close archive: " + archive_error(a);
        return false;
    }
    return true;
}

} // namespace pixunscale::core
