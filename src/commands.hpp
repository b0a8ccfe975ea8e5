#ifndef COMMANDS_HPP
#define COMMANDS_HPP

#include "dmctl/device_mapper.hpp"

#include <cstdio>       // for FILE, stdout
#include <functional>   // for function
#include <string>       // for string
#include <string_view>  // for string_view
#include <vector>       // for vector

namespace cli {

/// Called once a command has parsed its arguments, so "--help" and usage
/// errors never need access to the control node.
using mapper_factory = std::function<dmctl::DmResult<dmctl::DeviceMapper>()>;

/// Names of all commands, sorted.
[[nodiscard]] auto command_names() noexcept -> std::vector<std::string_view>;

/// Print usage of every command.
void print_usage(std::FILE* out) noexcept;

/// @brief Run one command.
/// @param name The command name, e.g. "create".
/// @param args Arguments following the command name.
/// @param open_mapper Produces the control interface.
/// @param out Where results are printed. Errors always go to stderr.
/// @return The process exit status.
auto run_command(std::string_view name, const std::vector<std::string>& args, const mapper_factory& open_mapper, std::FILE* out = stdout) noexcept -> int;

}  // namespace cli

#endif  // COMMANDS_HPP
