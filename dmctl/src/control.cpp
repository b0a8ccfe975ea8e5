#include "dmctl/control.hpp"

#include <fcntl.h>      // for open, O_RDWR, O_CLOEXEC
#include <sys/ioctl.h>  // for ioctl, _IOWR
#include <unistd.h>     // for close

#include <algorithm>  // for max, min, clamp, copy
#include <cerrno>     // for errno
#include <cstring>    // for strerror
#include <string>     // for string
#include <utility>    // for move, exchange

#include <fmt/compile.h>
#include <fmt/format.h>

#include <spdlog/spdlog.h>

using namespace std::string_view_literals;

namespace dmctl {

auto request_code(Command cmd) noexcept -> unsigned long {
    return _IOWR(DM_IOCTL, static_cast<unsigned int>(cmd), struct dm_ioctl);
}

auto command_to_string(Command cmd) noexcept -> std::string_view {
    switch (cmd) {
    case Command::Version:
        return "DM_VERSION"sv;
    case Command::RemoveAll:
        return "DM_REMOVE_ALL"sv;
    case Command::ListDevices:
        return "DM_LIST_DEVICES"sv;
    case Command::DevCreate:
        return "DM_DEV_CREATE"sv;
    case Command::DevRemove:
        return "DM_DEV_REMOVE"sv;
    case Command::DevRename:
        return "DM_DEV_RENAME"sv;
    case Command::DevSuspend:
        return "DM_DEV_SUSPEND"sv;
    case Command::DevStatus:
        return "DM_DEV_STATUS"sv;
    case Command::DevWait:
        return "DM_DEV_WAIT"sv;
    case Command::TableLoad:
        return "DM_TABLE_LOAD"sv;
    case Command::TableClear:
        return "DM_TABLE_CLEAR"sv;
    case Command::TableDeps:
        return "DM_TABLE_DEPS"sv;
    case Command::TableStatus:
        return "DM_TABLE_STATUS"sv;
    case Command::ListVersions:
        return "DM_LIST_VERSIONS"sv;
    case Command::TargetMsg:
        return "DM_TARGET_MSG"sv;
    case Command::DevArmPoll:
        return "DM_DEV_ARM_POLL"sv;
    }
    return "DM_UNKNOWN"sv;
}

auto initialize_header(DmFlags flags) noexcept -> layout::IoctlHeader {
    layout::IoctlHeader hdr{};
    hdr.version    = {layout::VERSION_MAJOR, layout::VERSION_MINOR, layout::VERSION_PATCHLEVEL};
    hdr.flags      = flags.bits();
    hdr.data_start = static_cast<std::uint32_t>(layout::header::SIZE);
    return hdr;
}

auto ControlChannel::open(std::string_view path, std::size_t min_buffer_size) noexcept -> DmResult<ControlChannel> {
    const std::string path_str{path};
    const int fd = ::open(path_str.c_str(), O_RDWR | O_CLOEXEC);
    if (fd < 0) {
        const int err = errno;
        spdlog::error("[CONTROL] '{}' open failed: {}", path, std::strerror(err));
        return make_context_error(fmt::format(FMT_COMPILE("failed to open '{}'"), path), err);
    }
    return ControlChannel{fd, min_buffer_size};
}

ControlChannel::ControlChannel(int fd, std::size_t min_buffer_size) noexcept
  : m_fd(fd), m_min_buffer_size(std::max(min_buffer_size, layout::header::SIZE)) { }

ControlChannel::ControlChannel(ioctl_handler handler, std::size_t min_buffer_size) noexcept
  : m_handler(std::move(handler)), m_min_buffer_size(std::max(min_buffer_size, layout::header::SIZE)) { }

ControlChannel::ControlChannel(ControlChannel&& other) noexcept
  : m_fd(std::exchange(other.m_fd, -1)), m_handler(std::move(other.m_handler)), m_min_buffer_size(other.m_min_buffer_size) { }

auto ControlChannel::operator=(ControlChannel&& other) noexcept -> ControlChannel& {
    if (this != &other) {
        if (m_fd >= 0) {
            ::close(m_fd);
        }
        m_fd              = std::exchange(other.m_fd, -1);
        m_handler         = std::move(other.m_handler);
        m_min_buffer_size = other.m_min_buffer_size;
    }
    return *this;
}

ControlChannel::~ControlChannel() {
    if (m_fd >= 0) {
        ::close(m_fd);
    }
}

auto ControlChannel::do_ioctl(unsigned long request, std::span<std::byte> buffer) const noexcept -> int {
    if (m_handler) {
        return m_handler(request, buffer);
    }
    return ::ioctl(m_fd, request, buffer.data());
}

auto ControlChannel::execute(Command cmd, layout::IoctlHeader& hdr, std::span<const std::byte> payload) const noexcept
    -> DmResult<std::vector<std::byte>> {
    const auto request = request_code(cmd);

    // header, then payload, then zeroes
    std::vector<std::byte> buffer{};
    const auto fill_buffer = [&](std::size_t size) {
        hdr.data_size = static_cast<std::uint32_t>(size);
        buffer.assign(size, std::byte{0});
        layout::encode_header(hdr, buffer);
        std::ranges::copy(payload, buffer.begin() + static_cast<std::ptrdiff_t>(layout::header::SIZE));
    };
    fill_buffer(std::max(m_min_buffer_size, layout::header::SIZE + payload.size()));

    spdlog::debug("[CONTROL] {} name:'{}' uuid:'{}' flags:{} payload:{} bytes", command_to_string(cmd),
        layout::field_to_string_view(hdr.name), layout::field_to_string_view(hdr.uuid), DmFlags{hdr.flags}, payload.size());

    while (true) {
        if (do_ioctl(request, buffer) < 0) {
            const int err = errno;
            spdlog::error("[CONTROL] {} failed for name:'{}' uuid:'{}': {}", command_to_string(cmd),
                layout::field_to_string_view(hdr.name), layout::field_to_string_view(hdr.uuid), std::strerror(err));
            return make_ioctl_error(fmt::format(FMT_COMPILE("{} failed"), command_to_string(cmd)), err, hdr);
        }

        const auto reply_flags = DmFlags{layout::load<std::uint32_t>(buffer, layout::header::FLAGS)};
        if (!reply_flags.contains(flags::BUFFER_FULL)) {
            break;
        }

        // The partial reply may have overwritten the request, so it is
        // rebuilt from scratch in a buffer twice the size.
        fill_buffer(buffer.size() * 2);
        spdlog::debug("[CONTROL] {} reply did not fit, retrying with {} bytes", command_to_string(cmd), buffer.size());
    }

    hdr = layout::decode_header(buffer);

    const auto begin = std::min<std::size_t>(hdr.data_start, buffer.size());
    const auto end   = std::clamp<std::size_t>(hdr.data_size, begin, buffer.size());
    return std::vector<std::byte>(buffer.begin() + static_cast<std::ptrdiff_t>(begin), buffer.begin() + static_cast<std::ptrdiff_t>(end));
}

}  // namespace dmctl
