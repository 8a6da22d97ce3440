#include "gif_encoder.h"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <iterator>
#include <unordered_map>

namespace pixunscale::core {

namespace {

constexpr int k_max_lzw_bits = 12;
constexpr uint32_t k_max_lzw_codes = 1U << k_max_lzw_bits;
constexpr uint32_t k_transparent_key = 0xFF000000U;
constexpr size_t k_max_sub_block = 255;
constexpr int k_max_delay_cs = 65535;

constexpr unsigned char k_extension_introducer = 0x21;
constexpr unsigned char k_graphic_control_label = 0xF9;
constexpr unsigned char k_application_label = 0xFF;
constexpr unsigned char k_image_separator = 0x2C;
constexpr unsigned char k_trailer = 0x3B;

constexpr unsigned char k_dispose_none = 1;
constexpr unsigned char k_dispose_background = 2;

// Packs codes least significant bit first, as GIF requires.
class BitWriter {
public:
    explicit BitWriter(std::vector<unsigned char>& out) : out_(out) {}

    void write(uint32_t code, int bits) {
        buffer_ |= code << count_;
        count_ += bits;
        while (count_ >= 8) {
            out_.push_back(static_cast<unsigned char>(buffer_ & 0xFFU));
            buffer_ >>= 8;
            count_ -= 8;
        }
    }

    void flush() {
        if (count_ > 0) {
            out_.push_back(static_cast<unsigned char>(buffer_ & 0xFFU));
        }
        buffer_ = 0;
        count_ = 0;
    }

private:
    std::vector<unsigned char>& out_;
    uint32_t buffer_ = 0;
    int count_ = 0;
};

struct Palette {
    std::vector<Color> colors;
    std::unordered_map<uint32_t, unsigned char> index;
    int transparent_index = -1;
};

uint32_t color_key(const unsigned char* px) {
    if (px[CHANNEL_A] == 0) {
        return k_transparent_key;
    }
    return (static_cast<uint32_t>(px[CHANNEL_R]) << 16)
        | (static_cast<uint32_t>(px[CHANNEL_G]) << 8)
        | static_cast<uint32_t>(px[CHANNEL_B]);
}

bool build_palette(const std::vector<Frame>& frames, Palette& palette, std::string& error) {
    for (const auto& frame : frames) {
        for (size_t offset = 0; offset < frame.pixels.size(); offset += NUM_CHANNELS) {
            const unsigned char* px = frame.pixels.data() + offset;
            const uint32_t key = color_key(px);
            if (palette.index.contains(key)) {
                continue;
            }
            if (palette.colors.size() == k_max_gif_colors) {
                error = "too many colors for GIF (more than " + std::to_string(k_max_gif_colors) + ")";
                return false;
            }
            const auto slot = static_cast<unsigned char>(palette.colors.size());
            if (key == k_transparent_key) {
                palette.transparent_index = slot;
                palette.colors.push_back(Color{});
            } else {
                palette.colors.push_back(Color{
                    .r = px[CHANNEL_R], .g = px[CHANNEL_G], .b = px[CHANNEL_B], .a = 255});
            }
            palette.index.emplace(key, slot);
        }
    }
    return true;
}

// Smallest bit count whose table holds `colors` entries (1..8).
int palette_bits(size_t colors) {
    int bits = 1;
    while ((size_t{1} << bits) < colors) {
        ++bits;
    }
    return bits;
}

void put_u16(std::vector<unsigned char>& out, int value) {
    out.push_back(static_cast<unsigned char>(value & 0xFF));
    out.push_back(static_cast<unsigned char>((value >> 8) & 0xFF));
}

void put_sub_blocks(std::vector<unsigned char>& out, const std::vector<unsigned char>& data) {
    for (size_t pos = 0; pos < data.size(); pos += k_max_sub_block) {
        const size_t length = std::min(k_max_sub_block, data.size() - pos);
        out.push_back(static_cast<unsigned char>(length));
        const auto begin = data.begin() + static_cast<std::ptrdiff_t>(pos);
        out.insert(out.end(), begin, begin + static_cast<std::ptrdiff_t>(length));
    }
    out.push_back(0);
}

void put_loop_extension(std::vector<unsigned char>& out) {
    static constexpr unsigned char block[] = {
        k_extension_introducer, k_application_label, 0x0B,
        'N', 'E', 'T', 'S', 'C', 'A', 'P', 'E', '2', '.', '0',
        0x03, 0x01, 0x00, 0x00, // loop count 0 = forever
        0x00,
    };
    out.insert(out.end(), std::begin(block), std::end(block));
}

void put_graphic_control(std::vector<unsigned char>& out, int delay_ms, int transparent_index) {
    const bool transparent = transparent_index >= 0;
    const unsigned char disposal = transparent ? k_dispose_background : k_dispose_none;
    const int delay_cs = std::clamp((std::max(0, delay_ms) + 5) / 10, 0, k_max_delay_cs);

    out.push_back(k_extension_introducer);
    out.push_back(k_graphic_control_label);
    out.push_back(0x04);
    out.push_back(static_cast<unsigned char>((disposal << 2) | (transparent ? 0x01 : 0x00)));
    put_u16(out, delay_cs);
    out.push_back(static_cast<unsigned char>(transparent ? transparent_index : 0));
    out.push_back(0x00);
}

} // namespace

std::vector<unsigned char> lzw_encode_indices(const std::vector<unsigned char>& indices, int min_code_size) {
    std::vector<unsigned char> out;
    BitWriter writer(out);

    const uint32_t clear_code = 1U << min_code_size;
    const uint32_t end_code = clear_code + 1;
    std::unordered_map<uint32_t, uint32_t> dictionary;
    uint32_t next_code = end_code + 1;
    int code_size = min_code_size + 1;

    writer.write(clear_code, code_size);
    if (indices.empty()) {
        writer.write(end_code, code_size);
        writer.flush();
        return out;
    }

    uint32_t prefix = indices.front();
    for (size_t i = 1; i < indices.size(); ++i) {
        const uint32_t symbol = indices[i];
        const uint32_t key = (prefix << 8) | symbol;
        const auto found = dictionary.find(key);
        if (found != dictionary.end()) {
            prefix = found->second;
            continue;
        }

        writer.write(prefix, code_size);
        dictionary.emplace(key, next_code++);
        if (next_code == k_max_lzw_codes) {
            writer.write(clear_code, code_size);
            dictionary.clear();
            next_code = end_code + 1;
            code_size = min_code_size + 1;
        } else if (next_code == (1U << code_size) + 1) {
            // The decoder lags one entry behind and widens on this code.
            ++code_size;
        }
        prefix = symbol;
    }
    writer.write(prefix, code_size);

    // The decoder adds its last entry after reading the final code.
    if (next_code == (1U << code_size) && code_size < k_max_lzw_bits) {
        ++code_size;
    }
    writer.write(end_code, code_size);
    writer.flush();
    return out;
}

bool encode_gif(const std::vector<Frame>& frames, std::vector<unsigned char>& out, std::string& error) {
    if (frames.empty()) {
        error = "no frames to encode";
        return false;
    }

    const int width = frames.front().width;
    const int height = frames.front().height;
    if (width <= 0 || height <= 0 || width > k_max_gif_dimension || height > k_max_gif_dimension) {
        error = "invalid GIF dimensions " + std::to_string(width) + "x" + std::to_string(height);
        return false;
    }
    for (size_t i = 0; i < frames.size(); ++i) {
        const Frame& frame = frames[i];
        if (frame.width != width || frame.height != height || frame.pixels.size() != frame.byte_count()) {
            error = "frame " + std::to_string(i) + " does not match the first frame's size";
            return false;
        }
    }

    Palette palette;
    if (!build_palette(frames, palette, error)) {
        return false;
    }
    const int bits = palette_bits(palette.colors.size());
    const int min_code_size = std::max(2, bits);

    out.clear();
    const char signature[] = "GIF89a";
    out.insert(out.end(), signature, signature + 6);
    put_u16(out, width);
    put_u16(out, height);
    // Global table present, 8-bit color resolution, table size 2^bits.
    out.push_back(static_cast<unsigned char>(0x80 | 0x70 | (bits - 1)));
    out.push_back(0x00); // background index
    out.push_back(0x00); // pixel aspect ratio
    for (size_t i = 0; i < (size_t{1} << bits); ++i) {
        const Color color = i < palette.colors.size() ? palette.colors[i] : Color{};
        out.push_back(color.r);
        out.push_back(color.g);
        out.push_back(color.b);
    }

    if (frames.size() > 1) {
        put_loop_extension(out);
    }

    std::vector<unsigned char> indices;
    for (const auto& frame : frames) {
        put_graphic_control(out, frame.delay_ms, palette.transparent_index);

        out.push_back(k_image_separator);
        put_u16(out, 0);
        put_u16(out, 0);
        put_u16(out, width);
        put_u16(out, height);
        out.push_back(0x00); // no local table, not interlaced

        indices.clear();
        indices.reserve(static_cast<size_t>(width) * static_cast<size_t>(height));
        for (size_t offset = 0; offset < frame.pixels.size(); offset += NUM_CHANNELS) {
            indices.push_back(palette.index.at(color_key(frame.pixels.data() + offset)));
        }

        out.push_back(static_cast<unsigned char>(min_code_size));
        put_sub_blocks(out, lzw_encode_indices(indices, min_code_size));
    }

    out.push_back(k_trailer);
    return true;
}

} // namespace pixunscale::core
