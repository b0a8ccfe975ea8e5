#include "dmctl/logger.hpp"

#include <array>    // for array
#include <utility>  // for move, pair

using namespace std::string_view_literals;

namespace dmctl::logger {

void set_logger(std::shared_ptr<spdlog::logger> default_logger) noexcept {
    spdlog::set_default_logger(std::move(default_logger));
}

auto set_level(std::string_view level_name) noexcept -> bool {
    /* clang-format off */
    static constexpr std::array<std::pair<std::string_view, spdlog::level::level_enum>, 7> levels{{
        {"trace"sv, spdlog::level::trace},
        {"debug"sv, spdlog::level::debug},
        {"info"sv, spdlog::level::info},
        {"warn"sv, spdlog::level::warn},
        {"error"sv, spdlog::level::err},
        {"critical"sv, spdlog::level::critical},
        {"off"sv, spdlog::level::off},
    }};
    /* clang-format on */

    for (const auto& [name, level] : levels) {
        if (name == level_name) {
            spdlog::set_level(level);
            return true;
        }
    }
    return false;
}

}  // namespace dmctl::logger
