#ifndef ERROR_HPP
#define ERROR_HPP

#include "dmctl/device_info.hpp"

#include <cstdint>      // for uint8_t
#include <cstring>      // for strerror
#include <expected>     // for expected, unexpected
#include <optional>     // for optional
#include <string>       // for string
#include <string_view>  // for string_view

#include <fmt/format.h>

namespace dmctl {

enum class ErrorKind : std::uint8_t {
    // A value failed validation before anything was sent to the kernel.
    InvalidArgument,
    // The control node could not be opened.
    ContextInit,
    // The kernel or the OS rejected an ioctl.
    Ioctl,
};

/// @brief Error returned by every fallible operation.
///
/// The kernel reports failures only through errno, so os_error is passed
/// through unclassified. For ErrorKind::Ioctl, info holds the header as it
/// was sent, so the caller can tell which device and flags were used.
struct DmError {
    ErrorKind kind{ErrorKind::Ioctl};
    std::string message{};
    int os_error{};
    std::optional<DeviceInfo> info{};
};

template <typename T>
using DmResult = std::expected<T, DmError>;

[[nodiscard]] auto error_kind_to_string(ErrorKind kind) noexcept -> std::string_view;

[[nodiscard]] auto make_invalid_argument(std::string message) noexcept -> std::unexpected<DmError>;
[[nodiscard]] auto make_context_error(std::string message, int os_error) noexcept -> std::unexpected<DmError>;
[[nodiscard]] auto make_ioctl_error(std::string message, int os_error, const layout::IoctlHeader& sent) noexcept -> std::unexpected<DmError>;

}  // namespace dmctl

template <>
struct fmt::formatter<dmctl::DmError> : fmt::formatter<std::string_view> {
    template <typename FormatContext>
    auto format(const dmctl::DmError& e, FormatContext& ctx) const -> decltype(ctx.out()) {
        auto out = fmt::format_to(ctx.out(), "{}: {}", dmctl::error_kind_to_string(e.kind), e.message);
        if (e.os_error != 0) {
            out = fmt::format_to(out, " ({})", std::strerror(e.os_error));
        }
        return out;
    }
};

#endif  // ERROR_HPP
