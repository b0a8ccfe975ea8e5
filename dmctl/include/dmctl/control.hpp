#ifndef CONTROL_HPP
#define CONTROL_HPP

#include "dmctl/error.hpp"
#include "dmctl/layout.hpp"

#include <cstddef>      // for byte, size_t
#include <cstdint>      // for uint8_t
#include <functional>   // for function
#include <span>         // for span
#include <string_view>  // for string_view
#include <vector>       // for vector

#include <linux/dm-ioctl.h>

namespace dmctl {

/// Default location of the device-mapper control node.
inline constexpr std::string_view DM_CTL_PATH{"/dev/mapper/control"};

/// Device-mapper ioctl commands.
enum class Command : std::uint8_t {
    Version      = DM_VERSION_CMD,
    RemoveAll    = DM_REMOVE_ALL_CMD,
    ListDevices  = DM_LIST_DEVICES_CMD,
    DevCreate    = DM_DEV_CREATE_CMD,
    DevRemove    = DM_DEV_REMOVE_CMD,
    DevRename    = DM_DEV_RENAME_CMD,
    DevSuspend   = DM_DEV_SUSPEND_CMD,
    DevStatus    = DM_DEV_STATUS_CMD,
    DevWait      = DM_DEV_WAIT_CMD,
    TableLoad    = DM_TABLE_LOAD_CMD,
    TableClear   = DM_TABLE_CLEAR_CMD,
    TableDeps    = DM_TABLE_DEPS_CMD,
    TableStatus  = DM_TABLE_STATUS_CMD,
    ListVersions = DM_LIST_VERSIONS_CMD,
    TargetMsg    = DM_TARGET_MSG_CMD,
    DevArmPoll   = DM_DEV_ARM_POLL_CMD,
};

/// The _IOWR request number for a command.
[[nodiscard]] auto request_code(Command cmd) noexcept -> unsigned long;

[[nodiscard]] auto command_to_string(Command cmd) noexcept -> std::string_view;

/// A fresh header: protocol version stamped, flags set, payload right
/// after the header. Every request header is built here.
[[nodiscard]] auto initialize_header(DmFlags flags = {}) noexcept -> layout::IoctlHeader;

/// @brief Owns the open control node and runs ioctl round-trips on it.
///
/// The kernel signals a reply that did not fit with BUFFER_FULL instead of
/// reporting the needed size, so execute() keeps doubling the buffer until
/// the flag clears.
class ControlChannel final {
 public:
    /// Issues the syscall. Gets the request number and the whole buffer,
    /// header first. Returns -1 and sets errno on failure, like ioctl(2).
    using ioctl_handler = std::function<int(unsigned long request, std::span<std::byte> buffer)>;

    /// Start large enough that BUFFER_FULL is rare. libdevmapper does the same.
    static constexpr std::size_t MIN_BUF_SIZE = 16 * 1024;

    /// @brief Opens the control node.
    /// @return ErrorKind::ContextInit if the node can not be opened.
    static auto open(std::string_view path = DM_CTL_PATH, std::size_t min_buffer_size = MIN_BUF_SIZE) noexcept -> DmResult<ControlChannel>;

    /// A channel without a descriptor that hands every request to handler.
    explicit ControlChannel(ioctl_handler handler, std::size_t min_buffer_size = MIN_BUF_SIZE) noexcept;

    ControlChannel(const ControlChannel&)                    = delete;
    auto operator=(const ControlChannel&) -> ControlChannel& = delete;
    ControlChannel(ControlChannel&& other) noexcept;
    auto operator=(ControlChannel&& other) noexcept -> ControlChannel&;
    ~ControlChannel();

    /// The control node descriptor, -1 when a handler is used. Exposed so
    /// callers can poll it for device events.
    [[nodiscard]] auto fd() const noexcept -> int { return m_fd; }

    [[nodiscard]] auto min_buffer_size() const noexcept -> std::size_t { return m_min_buffer_size; }

    /// @brief Runs one command.
    /// @param cmd Which command to issue.
    /// @param hdr The request header. Replaced with the kernel's reply header on success.
    /// @param payload Bytes placed right after the header.
    /// @return The reply payload between data_start and data_size.
    auto execute(Command cmd, layout::IoctlHeader& hdr, std::span<const std::byte> payload = {}) const noexcept
        -> DmResult<std::vector<std::byte>>;

 private:
    ControlChannel(int fd, std::size_t min_buffer_size) noexcept;

    auto do_ioctl(unsigned long request, std::span<std::byte> buffer) const noexcept -> int;

    int m_fd{-1};
    ioctl_handler m_handler{};
    std::size_t m_min_buffer_size{MIN_BUF_SIZE};
};

}  // namespace dmctl

#endif  // CONTROL_HPP
