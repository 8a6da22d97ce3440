#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace pixunscale::core {

bool parse_non_negative_int(const std::string& value, int& out);
bool parse_non_negative_uint(const std::string& value, unsigned int& out);

std::string to_quoted(const std::string& s);
std::string to_lower_copy(std::string s);

// "<dir>/<stem>.scaled.<extension>" next to the input.
std::filesystem::path default_output_path(const std::filesystem::path& input, const std::string& extension);

// Explicit output wins, then the input itself when in_place, then the default name.
std::filesystem::path resolve_output_path(
    const std::optional<std::filesystem::path>& explicit_output,
    const std::filesystem::path& input,
    bool in_place,
    const std::string& extension);

} // namespace pixunscale::core
