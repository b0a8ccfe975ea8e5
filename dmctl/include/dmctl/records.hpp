#ifndef RECORDS_HPP
#define RECORDS_HPP

#include "dmctl/device.hpp"
#include "dmctl/device_info.hpp"
#include "dmctl/types.hpp"
#include "dmctl/units.hpp"

#include <cstddef>      // for byte
#include <cstdint>      // for uint32_t
#include <optional>     // for optional
#include <span>         // for span
#include <string>       // for string
#include <string_view>  // for string_view
#include <vector>       // for vector

#include <fmt/format.h>

namespace dmctl {

/// One entry of DM_LIST_DEVICES.
struct ListedDevice {
    DmName name;
    Device device;
    // Absent on kernels older than interface 4.36.
    std::optional<std::uint32_t> event_nr{};
};

/// One entry of DM_LIST_VERSIONS.
struct TargetVersion {
    std::string name;
    Version version;
};

}  // namespace dmctl

// Reply payload parsers and request payload builders. Parsers expect a reply
// the kernel accepted; a malformed one terminates the process.
namespace dmctl::records {

/// Walk dm_name_list records. kernel_minor is the minor interface version
/// from the reply header, it decides where the event number sits.
auto parse_name_list(std::span<const std::byte> data, std::uint32_t kernel_minor) noexcept -> std::vector<ListedDevice>;

/// Walk dm_target_versions records.
auto parse_target_versions(std::span<const std::byte> data) noexcept -> std::vector<TargetVersion>;

/// Read a dm_target_deps record.
auto parse_target_deps(std::span<const std::byte> data) noexcept -> std::vector<Device>;

/// Read exactly count dm_target_spec records, each followed by its
/// parameter string. next offsets count from the start of data.
auto parse_table_status(std::uint32_t count, std::span<const std::byte> data) noexcept -> std::vector<TargetLine>;

/// Pack target lines for DM_TABLE_LOAD, params NUL-padded to 8 bytes.
auto build_table_payload(std::span<const TargetLine> targets) noexcept -> std::vector<std::byte>;

/// NUL-terminated new name or uuid for DM_DEV_RENAME.
auto build_rename_payload(std::string_view value) noexcept -> std::vector<std::byte>;

/// dm_target_msg: sector, then the NUL-terminated message.
auto build_message_payload(std::optional<Sectors> sector, std::string_view message) noexcept -> std::vector<std::byte>;

}  // namespace dmctl::records

template <>
struct fmt::formatter<dmctl::ListedDevice> : fmt::formatter<std::string_view> {
    template <typename FormatContext>
    auto format(const dmctl::ListedDevice& d, FormatContext& ctx) const -> decltype(ctx.out()) {
        if (d.event_nr) {
            return fmt::format_to(ctx.out(), "{}\t({})\tevent {}", d.name, d.device, *d.event_nr);
        }
        return fmt::format_to(ctx.out(), "{}\t({})", d.name, d.device);
    }
};

template <>
struct fmt::formatter<dmctl::TargetVersion> : fmt::formatter<std::string_view> {
    template <typename FormatContext>
    auto format(const dmctl::TargetVersion& t, FormatContext& ctx) const -> decltype(ctx.out()) {
        return fmt::format_to(ctx.out(), "{:<16} v{}", t.name, t.version);
    }
};

#endif  // RECORDS_HPP
