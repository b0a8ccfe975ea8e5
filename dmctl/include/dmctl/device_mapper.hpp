#ifndef DEVICE_MAPPER_HPP
#define DEVICE_MAPPER_HPP

#include "dmctl/control.hpp"
#include "dmctl/device.hpp"
#include "dmctl/device_info.hpp"
#include "dmctl/error.hpp"
#include "dmctl/flags.hpp"
#include "dmctl/records.hpp"
#include "dmctl/types.hpp"
#include "dmctl/units.hpp"

#include <cstddef>      // for size_t
#include <optional>     // for optional
#include <span>         // for span
#include <string>       // for string
#include <string_view>  // for string_view
#include <vector>       // for vector

namespace dmctl {

/// Reply of DM_TABLE_STATUS and DM_DEV_WAIT.
struct TableStatus {
    DeviceInfo info;
    std::vector<TargetLine> targets;
};

/// Reply of DM_TARGET_MSG. output is set only when the target answered.
struct MessageReply {
    DeviceInfo info;
    std::optional<std::string> output;
};

/// Copy a validated name or uuid into the header's fixed-width field.
void set_identifier(layout::IoctlHeader& hdr, const DevId& id) noexcept;

/// @brief The device-mapper control interface, one method per command.
///
/// Every method builds a fresh header, masks the caller's flags down to
/// the ones the command accepts and decodes the reply. No state is kept
/// between calls beyond the control channel itself.
class DeviceMapper final {
 public:
    /// Open the control node and wrap it.
    static auto open(std::string_view path = DM_CTL_PATH, std::size_t min_buffer_size = ControlChannel::MIN_BUF_SIZE) noexcept
        -> DmResult<DeviceMapper>;

    explicit DeviceMapper(ControlChannel channel) noexcept;

    /// Control node descriptor for poll(2). Re-arm with arm_poll() after
    /// each wakeup.
    [[nodiscard]] auto fd() const noexcept -> int { return m_channel.fd(); }

    /// Kernel ioctl interface version.
    auto version() const noexcept -> DmResult<Version>;

    /// Remove every device not in use. Accepts DEFERRED_REMOVE.
    auto remove_all(DmFlags flags = {}) const noexcept -> DmResult<void>;

    auto list_devices() const noexcept -> DmResult<std::vector<ListedDevice>>;

    /// @brief Create a device. It starts suspended with no tables.
    /// @param flags READONLY and PERSISTENT_DEV are honoured.
    /// @param device Ask for this minor, implies PERSISTENT_DEV. The kernel
    /// picks the major.
    auto device_create(const DmName& name, const std::optional<DmUuid>& uuid = std::nullopt, DmFlags flags = {},
        std::optional<Device> device = std::nullopt) const noexcept -> DmResult<DeviceInfo>;

    /// Remove a device and its tables. With DEFERRED_REMOVE an open device
    /// is removed on last close instead of failing with EBUSY.
    auto device_remove(const DevId& id, DmFlags flags = {}) const noexcept -> DmResult<DeviceInfo>;

    /// @brief Change a device's name, or set its uuid.
    ///
    /// A uuid can only be set on a device that has none.
    /// @return The info of the device under its old identity.
    auto device_rename(const DmName& old_name, const DevId& new_id) const noexcept -> DmResult<DeviceInfo>;

    /// Suspend with SUSPEND, resume without it. Resuming also makes the
    /// inactive table live. NOFLUSH and SKIP_LOCKFS are honoured.
    auto device_suspend(const DevId& id, DmFlags flags = {}) const noexcept -> DmResult<DeviceInfo>;

    auto device_info(const DevId& id) const noexcept -> DmResult<DeviceInfo>;

    /// Block until the device's event counter moves, then report its status.
    auto device_wait(const DevId& id, DmFlags flags = {}) const noexcept -> DmResult<TableStatus>;

    /// Load targets into the inactive table slot.
    auto table_load(const DevId& id, std::span<const TargetLine> targets) const noexcept -> DmResult<DeviceInfo>;

    /// Drop the inactive table.
    auto table_clear(const DevId& id) const noexcept -> DmResult<DeviceInfo>;

    /// Devices the table maps onto. QUERY_INACTIVE_TABLE selects the slot.
    auto table_deps(const DevId& id, DmFlags flags = {}) const noexcept -> DmResult<std::vector<Device>>;

    /// @brief Target status lines, or the table itself with STATUS_TABLE.
    /// @param flags NOFLUSH, STATUS_TABLE and QUERY_INACTIVE_TABLE are honoured.
    auto table_status(const DevId& id, DmFlags flags = {}) const noexcept -> DmResult<TableStatus>;

    /// Target types registered with the kernel.
    auto list_versions() const noexcept -> DmResult<std::vector<TargetVersion>>;

    /// Send a message to the target at sector, or to the device when
    /// sector is unset.
    auto target_msg(const DevId& id, std::optional<Sectors> sector, std::string_view message) const noexcept -> DmResult<MessageReply>;

    /// Re-arm event readiness on fd().
    auto arm_poll() const noexcept -> DmResult<DeviceInfo>;

 private:
    // header for a command addressing one device
    [[nodiscard]] static auto device_header(const DevId& id, DmFlags flags = {}) noexcept -> layout::IoctlHeader;

    ControlChannel m_channel;
};

}  // namespace dmctl

#endif  // DEVICE_MAPPER_HPP
