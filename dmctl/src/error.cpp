#include "dmctl/error.hpp"

#include <utility>  // for move

using namespace std::string_view_literals;

namespace dmctl {

auto error_kind_to_string(ErrorKind kind) noexcept -> std::string_view {
    switch (kind) {
    case ErrorKind::InvalidArgument:
        return "invalid argument"sv;
    case ErrorKind::ContextInit:
        return "context init"sv;
    case ErrorKind::Ioctl:
        return "ioctl"sv;
    }
    return "unknown"sv;
}

auto make_invalid_argument(std::string message) noexcept -> std::unexpected<DmError> {
    return std::unexpected(DmError{.kind = ErrorKind::InvalidArgument, .message = std::move(message)});
}

auto make_context_error(std::string message, int os_error) noexcept -> std::unexpected<DmError> {
    return std::unexpected(DmError{.kind = ErrorKind::ContextInit, .message = std::move(message), .os_error = os_error});
}

auto make_ioctl_error(std::string message, int os_error, const layout::IoctlHeader& sent) noexcept -> std::unexpected<DmError> {
    return std::unexpected(DmError{
        .kind     = ErrorKind::Ioctl,
        .message  = std::move(message),
        .os_error = os_error,
        .info     = DeviceInfo{sent},
    });
}

}  // namespace dmctl
