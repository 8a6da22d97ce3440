#include "cli_parse.h"

#include <algorithm>
#include <cctype>
#include <charconv>

namespace pixunscale::core {

bool parse_non_negative_int(const std::string& value, int& out) {
    int parsed = 0;
    const auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), parsed);
    if (value.empty() || ec != std::errc() || ptr != value.data() + value.size()) {
        return false;
    }
    if (parsed < 0) {
        return false;
    }
    out = parsed;
    return true;
}

bool parse_non_negative_uint(const std::string& value, unsigned int& out) {
    int parsed = 0;
    if (!parse_non_negative_int(value, parsed)) {
        return false;
    }
    out = static_cast<unsigned int>(parsed);
    return true;
}

std::string to_quoted(const std::string& s) {
    std::string result = "\"";
    for (char c : s) {
        if (c == '"' || c == '\\') {
            result += '\\';
        }
        result += c;
    }
    result += "\"";
    return result;
}

std::string to_lower_copy(std::string s) {
    std::ranges::transform(s, s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::filesystem::path default_output_path(const std::filesystem::path& input, const std::string& extension) {
    // Only the last extension is replaced: "a.b.gif" -> "a.b.scaled.png".
    std::filesystem::path output = input;
    std::string name = input.has_extension() ? input.stem().string() : input.filename().string();
    name += ".scaled.";
    name += extension;
    output.replace_filename(name);
    return output;
}

std::filesystem::path resolve_output_path(
    const std::optional<std::filesystem::path>& explicit_output,
    const std::filesystem::path& input,
    bool in_place,
    const std::string& extension) {
    if (explicit_output.has_value()) {
        return *explicit_output;
    }
    if (in_place) {
        return input;
    }
    return default_output_path(input, extension);
}

} // namespace pixunscale::core
