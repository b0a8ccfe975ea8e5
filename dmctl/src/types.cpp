#include "dmctl/types.hpp"

#include <fmt/compile.h>
#include <fmt/format.h>

namespace dmctl {

auto validate_identifier(std::string_view value, std::size_t max_len, std::string_view kind) noexcept -> std::optional<std::string> {
    if (value.empty()) {
        return fmt::format(FMT_COMPILE("{} must not be empty"), kind);
    }
    if (value.size() > max_len) {
        return fmt::format(FMT_COMPILE("{} is {} bytes, the limit is {}"), kind, value.size(), max_len);
    }
    if (value.find('\0') != std::string_view::npos) {
        return fmt::format(FMT_COMPILE("{} contains a NUL byte"), kind);
    }
    return std::nullopt;
}

}  // namespace dmctl
