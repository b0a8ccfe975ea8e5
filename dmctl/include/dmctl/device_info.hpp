#ifndef DEVICE_INFO_HPP
#define DEVICE_INFO_HPP

#include "dmctl/device.hpp"
#include "dmctl/flags.hpp"
#include "dmctl/layout.hpp"

#include <array>        // for array
#include <cstdint>      // for uint32_t, int32_t
#include <optional>     // for optional
#include <string_view>  // for string_view

#include <fmt/format.h>

namespace dmctl {

/// Version triple of the ioctl interface or of a target type.
struct Version {
    std::uint32_t major{};
    std::uint32_t minor{};
    std::uint32_t patch{};

    constexpr bool operator==(const Version&) const = default;
};

/// @brief Snapshot of a device as reported in a reply header.
///
/// Nothing is cached between calls, every operation returns a fresh one.
class DeviceInfo final {
 public:
    DeviceInfo() = default;
    explicit DeviceInfo(const layout::IoctlHeader& hdr) noexcept
      : m_hdr(hdr) { }

    /// Interface version reported by the kernel.
    [[nodiscard]] auto version() const noexcept -> Version {
        return Version{m_hdr.version[0], m_hdr.version[1], m_hdr.version[2]};
    }

    /// Device name, empty for commands that do not address a device.
    [[nodiscard]] auto name() const noexcept -> std::string_view { return layout::field_to_string_view(m_hdr.name); }

    /// Device uuid, std::nullopt when none is set.
    [[nodiscard]] auto uuid() const noexcept -> std::optional<std::string_view> {
        const auto uuid = layout::field_to_string_view(m_hdr.uuid);
        if (uuid.empty()) {
            return std::nullopt;
        }
        return uuid;
    }

    [[nodiscard]] auto device() const noexcept -> Device { return Device::from_dev_t(m_hdr.dev); }
    [[nodiscard]] auto open_count() const noexcept -> std::int32_t { return m_hdr.open_count; }
    [[nodiscard]] auto target_count() const noexcept -> std::uint32_t { return m_hdr.target_count; }
    [[nodiscard]] auto event_nr() const noexcept -> std::uint32_t { return m_hdr.event_nr; }
    [[nodiscard]] auto flags() const noexcept -> DmFlags { return DmFlags{m_hdr.flags}; }

    [[nodiscard]] auto header() const noexcept -> const layout::IoctlHeader& { return m_hdr; }

 private:
    layout::IoctlHeader m_hdr{};
};

}  // namespace dmctl

template <>
struct fmt::formatter<dmctl::Version> : fmt::formatter<std::string_view> {
    template <typename FormatContext>
    auto format(const dmctl::Version& v, FormatContext& ctx) const -> decltype(ctx.out()) {
        return fmt::format_to(ctx.out(), "{}.{}.{}", v.major, v.minor, v.patch);
    }
};

template <>
struct fmt::formatter<dmctl::DeviceInfo> : fmt::formatter<std::string_view> {
    template <typename FormatContext>
    auto format(const dmctl::DeviceInfo& i, FormatContext& ctx) const -> decltype(ctx.out()) {
        return fmt::format_to(ctx.out(), "(name:'{}', uuid:'{}', dev:{}, open_count:{}, target_count:{}, event_nr:{}, flags:{})",
            i.name(), i.uuid().value_or(""), i.device(), i.open_count(), i.target_count(), i.event_nr(), i.flags());
    }
};

#endif  // DEVICE_INFO_HPP
