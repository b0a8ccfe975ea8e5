#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <memory>       // for shared_ptr
#include <string_view>  // for string_view

#include <spdlog/spdlog.h>

namespace dmctl::logger {

// Set library default logger
void set_logger(std::shared_ptr<spdlog::logger> default_logger) noexcept;

// Set the level of the library logger by name ("trace" .. "off").
// Returns false and leaves the level alone for an unknown name.
auto set_level(std::string_view level_name) noexcept -> bool;

}  // namespace dmctl::logger

#endif  // LOGGER_HPP
