#ifndef STRING_UTILS_HPP
#define STRING_UTILS_HPP

#include <cstddef>      // for byte
#include <span>         // for span
#include <string>       // for string
#include <string_view>  // for string_view
#include <vector>       // for vector

namespace dmctl::utils {

/// Characters treated as whitespace by the trim helpers.
inline constexpr std::string_view WHITESPACE{" \t\n\r\f\v"};

/// @brief Remove leading whitespace.
constexpr auto ltrim(std::string_view str) noexcept -> std::string_view {
    const auto pos = str.find_first_not_of(WHITESPACE);
    return pos == std::string_view::npos ? std::string_view{} : str.substr(pos);
}

/// @brief Remove trailing whitespace.
constexpr auto rtrim(std::string_view str) noexcept -> std::string_view {
    const auto pos = str.find_last_not_of(WHITESPACE);
    return pos == std::string_view::npos ? std::string_view{} : str.substr(0, pos + 1);
}

/// @brief Remove leading and trailing whitespace.
constexpr auto trim(std::string_view str) noexcept -> std::string_view {
    return ltrim(rtrim(str));
}

/// @brief Split a string into views based on a delimiter.
/// Empty pieces are kept, so line numbers survive.
/// @param str The string to split.
/// @param delim The delimiter to split the string.
/// @return A vector of string views.
auto split_keep_empty(std::string_view str, char delim = '\n') noexcept -> std::vector<std::string_view>;

/// @brief Decode bytes as UTF-8, replacing every invalid sequence with U+FFFD.
auto from_utf8_lossy(std::span<const std::byte> bytes) noexcept -> std::string;

}  // namespace dmctl::utils

#endif  // STRING_UTILS_HPP
