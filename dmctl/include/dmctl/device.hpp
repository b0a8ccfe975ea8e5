#ifndef DEVICE_HPP
#define DEVICE_HPP

#include <cstdint>   // for uint32_t, uint64_t
#include <optional>  // for optional

#include <fmt/format.h>

namespace dmctl {

/// @brief A block device number split into major and minor parts.
struct Device {
    std::uint32_t major{};
    std::uint32_t minor{};

    constexpr bool operator==(const Device&) const = default;

    /// Decode the kernel's 32-bit packed device number, as found in
    /// dm_target_deps.
    [[nodiscard]] static constexpr auto from_kdev_t(std::uint32_t value) noexcept -> Device {
        return Device{
            .major = (value & 0xfff00u) >> 8,
            .minor = (value & 0xffu) | ((value >> 12) & 0xfff00u),
        };
    }

    /// Encode as a kernel 32-bit device number.
    /// @return std::nullopt if major or minor does not fit (12 and 20 bits).
    [[nodiscard]] constexpr auto to_kdev_t() const noexcept -> std::optional<std::uint32_t> {
        if (major > 0xfffu || minor > 0xfffffu) {
            return std::nullopt;
        }
        return (minor & 0xffu) | (major << 8) | ((minor & ~0xffu) << 12);
    }

    /// Decode a userspace dev_t, as found in dm_ioctl and dm_name_list.
    [[nodiscard]] static auto from_dev_t(std::uint64_t value) noexcept -> Device;

    /// Encode as a userspace dev_t.
    [[nodiscard]] auto to_dev_t() const noexcept -> std::uint64_t;
};

}  // namespace dmctl

template <>
struct fmt::formatter<dmctl::Device> : fmt::formatter<std::string_view> {
    template <typename FormatContext>
    auto format(const dmctl::Device& d, FormatContext& ctx) const -> decltype(ctx.out()) {
        return fmt::format_to(ctx.out(), "{}:{}", d.major, d.minor);
    }
};

#endif  // DEVICE_HPP
