#ifndef FLAGS_HPP
#define FLAGS_HPP

#include <cstdint>      // for uint32_t
#include <string>       // for string
#include <string_view>  // for string_view

#include <fmt/format.h>

namespace dmctl {

/// @brief Set of device-mapper ioctl flag bits.
///
/// The same word is used in both directions. Some bits request a mode,
/// some report status, some do both. Every operation masks the caller's
/// flags with the subset it accepts, see flags::accepted.
class DmFlags final {
 public:
    constexpr DmFlags() noexcept = default;
    constexpr explicit DmFlags(std::uint32_t bits) noexcept
      : m_bits(bits) { }

    [[nodiscard]] constexpr auto bits() const noexcept -> std::uint32_t { return m_bits; }
    [[nodiscard]] constexpr bool empty() const noexcept { return m_bits == 0; }
    [[nodiscard]] constexpr bool contains(DmFlags other) const noexcept { return (m_bits & other.m_bits) == other.m_bits; }
    [[nodiscard]] constexpr bool intersects(DmFlags other) const noexcept { return (m_bits & other.m_bits) != 0; }

    constexpr bool operator==(const DmFlags&) const noexcept = default;

    constexpr auto operator|=(DmFlags rhs) noexcept -> DmFlags& {
        m_bits |= rhs.m_bits;
        return *this;
    }
    constexpr auto operator&=(DmFlags rhs) noexcept -> DmFlags& {
        m_bits &= rhs.m_bits;
        return *this;
    }

    friend constexpr auto operator|(DmFlags lhs, DmFlags rhs) noexcept -> DmFlags { return DmFlags{lhs.m_bits | rhs.m_bits}; }
    friend constexpr auto operator&(DmFlags lhs, DmFlags rhs) noexcept -> DmFlags { return DmFlags{lhs.m_bits & rhs.m_bits}; }
    friend constexpr auto operator~(DmFlags flags) noexcept -> DmFlags { return DmFlags{~flags.m_bits}; }

 private:
    std::uint32_t m_bits{};
};

namespace flags {

// In: device should be read-only. Out: device is read-only.
inline constexpr DmFlags READONLY{1u << 0};
// In: device should be suspended. Out: device is suspended.
inline constexpr DmFlags SUSPEND{1u << 1};
// In: use the passed-in device number.
inline constexpr DmFlags PERSISTENT_DEV{1u << 3};
// In: STATUS returns the table instead of target status.
inline constexpr DmFlags STATUS_TABLE{1u << 4};
// Out: active table is present.
inline constexpr DmFlags ACTIVE_PRESENT{1u << 5};
// Out: inactive table is present.
inline constexpr DmFlags INACTIVE_PRESENT{1u << 6};
// Out: passed-in buffer was too small.
inline constexpr DmFlags BUFFER_FULL{1u << 8};
// Obsolete.
inline constexpr DmFlags SKIP_BDGET{1u << 9};
// In: avoid freezing the filesystem when suspending.
inline constexpr DmFlags SKIP_LOCKFS{1u << 10};
// In: suspend without flushing queued I/O. For status, avoid metadata writes.
inline constexpr DmFlags NOFLUSH{1u << 11};
// In: query the inactive table instead of the active one.
inline constexpr DmFlags QUERY_INACTIVE_TABLE{1u << 12};
// Out: a uevent was generated, the caller may need to wait for it.
inline constexpr DmFlags UEVENT_GENERATED{1u << 13};
// In: rename changes the uuid instead of the name.
inline constexpr DmFlags UUID{1u << 14};
// In: wipe kernel buffers after use, for key material.
inline constexpr DmFlags SECURE_DATA{1u << 15};
// Out: a target message produced output.
inline constexpr DmFlags DATA_OUT{1u << 16};
// In: do not remove in-use devices. Out: device is scheduled for removal on close.
inline constexpr DmFlags DEFERRED_REMOVE{1u << 17};
// Out: device is suspended internally.
inline constexpr DmFlags INTERNAL_SUSPEND{1u << 18};

/// Flags each operation honours on input. Anything else is dropped.
namespace accepted {
inline constexpr DmFlags REMOVE_ALL{DEFERRED_REMOVE};
inline constexpr DmFlags DEVICE_CREATE{READONLY | PERSISTENT_DEV};
inline constexpr DmFlags DEVICE_REMOVE{DEFERRED_REMOVE};
inline constexpr DmFlags DEVICE_SUSPEND{SUSPEND | NOFLUSH | SKIP_LOCKFS};
inline constexpr DmFlags DEVICE_WAIT{QUERY_INACTIVE_TABLE};
inline constexpr DmFlags TABLE_DEPS{QUERY_INACTIVE_TABLE};
inline constexpr DmFlags TABLE_STATUS{NOFLUSH | STATUS_TABLE | QUERY_INACTIVE_TABLE};
}  // namespace accepted

}  // namespace flags

/// Names of the set bits joined with '|', e.g. "READONLY|SUSPEND".
/// Unknown bits are rendered as a hex value.
[[nodiscard]] auto flags_to_string(DmFlags flags) noexcept -> std::string;

}  // namespace dmctl

template <>
struct fmt::formatter<dmctl::DmFlags> : fmt::formatter<std::string_view> {
    template <typename FormatContext>
    auto format(const dmctl::DmFlags& f, FormatContext& ctx) const -> decltype(ctx.out()) {
        return fmt::formatter<std::string_view>::format(dmctl::flags_to_string(f), ctx);
    }
};

#endif  // FLAGS_HPP
