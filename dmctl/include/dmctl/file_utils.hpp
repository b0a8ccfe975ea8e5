#ifndef FILE_UTILS_HPP
#define FILE_UTILS_HPP

#include <optional>     // for optional
#include <string>       // for string
#include <string_view>  // for string_view

namespace dmctl::file_utils {

// Read a whole file. std::nullopt if it can not be opened or read.
auto read_whole_file(std::string_view filepath) noexcept -> std::optional<std::string>;

}  // namespace dmctl::file_utils

#endif  // FILE_UTILS_HPP
