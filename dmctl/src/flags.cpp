#include "dmctl/flags.hpp"

#include <array>    // for array
#include <utility>  // for pair

#include <fmt/compile.h>
#include <fmt/format.h>

using namespace std::string_view_literals;

namespace {

using dmctl::DmFlags;

// clang-format off
static constexpr std::array<std::pair<DmFlags, std::string_view>, 17> FLAG_NAMES{{
    {dmctl::flags::READONLY,             "READONLY"sv},
    {dmctl::flags::SUSPEND,              "SUSPEND"sv},
    {dmctl::flags::PERSISTENT_DEV,       "PERSISTENT_DEV"sv},
    {dmctl::flags::STATUS_TABLE,         "STATUS_TABLE"sv},
    {dmctl::flags::ACTIVE_PRESENT,       "ACTIVE_PRESENT"sv},
    {dmctl::flags::INACTIVE_PRESENT,     "INACTIVE_PRESENT"sv},
    {dmctl::flags::BUFFER_FULL,          "BUFFER_FULL"sv},
    {dmctl::flags::SKIP_BDGET,           "SKIP_BDGET"sv},
    {dmctl::flags::SKIP_LOCKFS,          "SKIP_LOCKFS"sv},
    {dmctl::flags::NOFLUSH,              "NOFLUSH"sv},
    {dmctl::flags::QUERY_INACTIVE_TABLE, "QUERY_INACTIVE_TABLE"sv},
    {dmctl::flags::UEVENT_GENERATED,     "UEVENT_GENERATED"sv},
    {dmctl::flags::UUID,                 "UUID"sv},
    {dmctl::flags::SECURE_DATA,          "SECURE_DATA"sv},
    {dmctl::flags::DATA_OUT,             "DATA_OUT"sv},
    {dmctl::flags::DEFERRED_REMOVE,      "DEFERRED_REMOVE"sv},
    {dmctl::flags::INTERNAL_SUSPEND,     "INTERNAL_SUSPEND"sv},
}};
// clang-format on

}  // namespace

namespace dmctl {

auto flags_to_string(DmFlags flags) noexcept -> std::string {
    std::string result{};
    auto remaining = flags;
    for (auto&& [flag, name] : FLAG_NAMES) {
        if (!flags.contains(flag)) {
            continue;
        }
        if (!result.empty()) {
            result += '|';
        }
        result += name;
        remaining &= ~flag;
    }

    if (!remaining.empty()) {
        if (!result.empty()) {
            result += '|';
        }
        result += fmt::format(FMT_COMPILE("{:#x}"), remaining.bits());
    }
    return result;
}

}  // namespace dmctl
