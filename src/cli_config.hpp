#ifndef CLI_CONFIG_HPP
#define CLI_CONFIG_HPP

#include <cstddef>      // for size_t
#include <expected>     // for expected
#include <optional>     // for optional
#include <string>       // for string
#include <string_view>  // for string_view

namespace cli {

/// Settings read from the JSON config file. Command line flags win.
struct CliConfig {
    std::string control_path{"/dev/mapper/control"};
    std::size_t min_buffer_size{16 * 1024};
    std::string log_level{"warn"};
    // Log to this file instead of stderr.
    std::optional<std::string> log_file{};
};

/// Returns CliConfig with sensible defaults.
[[nodiscard]] auto get_default_config() noexcept -> CliConfig;

/// Parses the configuration from JSON string content.
/// @param json_content The JSON configuration content.
/// @return CliConfig on success, or error string on failure.
[[nodiscard]] auto parse_cli_config(std::string_view json_content) noexcept
    -> std::expected<CliConfig, std::string>;

}  // namespace cli

#endif  // CLI_CONFIG_HPP
