#ifndef UNITS_HPP
#define UNITS_HPP

#include <compare>      // for strong_ordering
#include <concepts>     // for unsigned_integral
#include <cstdint>      // for uint64_t
#include <type_traits>  // for is_same_v

#include <fmt/format.h>

namespace dmctl {

/// Size of a device-mapper sector in bytes.
inline constexpr std::uint64_t SECTOR_SIZE = 512;

/// IEC binary multipliers.
namespace IEC {
inline constexpr std::uint64_t Ki = 1024;
inline constexpr std::uint64_t Mi = 1024 * Ki;
inline constexpr std::uint64_t Gi = 1024 * Mi;
inline constexpr std::uint64_t Ti = 1024 * Gi;
}  // namespace IEC

namespace detail {

/// @brief A 64-bit unsigned count tagged with its unit.
///
/// Counts of different units never mix implicitly, only through the
/// conversion functions below.
template <typename Tag>
class Count final {
 public:
    constexpr Count() noexcept = default;
    constexpr explicit Count(std::uint64_t value) noexcept
      : m_value(value) { }

    [[nodiscard]] constexpr auto value() const noexcept -> std::uint64_t { return m_value; }

    constexpr auto operator<=>(const Count&) const noexcept = default;

    constexpr auto operator+=(Count rhs) noexcept -> Count& {
        m_value += rhs.m_value;
        return *this;
    }
    constexpr auto operator-=(Count rhs) noexcept -> Count& {
        m_value -= rhs.m_value;
        return *this;
    }

    friend constexpr auto operator+(Count lhs, Count rhs) noexcept -> Count { return Count{lhs.m_value + rhs.m_value}; }
    friend constexpr auto operator-(Count lhs, Count rhs) noexcept -> Count { return Count{lhs.m_value - rhs.m_value}; }

    template <std::unsigned_integral T>
    friend constexpr auto operator*(Count lhs, T rhs) noexcept -> Count { return Count{lhs.m_value * static_cast<std::uint64_t>(rhs)}; }
    template <std::unsigned_integral T>
    friend constexpr auto operator*(T lhs, Count rhs) noexcept -> Count { return Count{static_cast<std::uint64_t>(lhs) * rhs.m_value}; }
    template <std::unsigned_integral T>
    friend constexpr auto operator/(Count lhs, T rhs) noexcept -> Count { return Count{lhs.m_value / static_cast<std::uint64_t>(rhs)}; }
    template <std::unsigned_integral T>
    friend constexpr auto operator%(Count lhs, T rhs) noexcept -> Count { return Count{lhs.m_value % static_cast<std::uint64_t>(rhs)}; }

 private:
    std::uint64_t m_value{};
};

struct SectorsTag;
struct BytesTag;
struct DataBlocksTag;

}  // namespace detail

/// Count of 512-byte sectors.
using Sectors = detail::Count<detail::SectorsTag>;
/// Count of bytes.
using Bytes = detail::Count<detail::BytesTag>;
/// Count of thin-pool data blocks, whose size is pool specific.
using DataBlocks = detail::Count<detail::DataBlocksTag>;

/// The number of bytes in these sectors.
[[nodiscard]] constexpr auto to_bytes(Sectors sectors) noexcept -> Bytes {
    return Bytes{sectors.value() * SECTOR_SIZE};
}

/// The number of sectors fully contained in these bytes.
[[nodiscard]] constexpr auto to_sectors(Bytes bytes) noexcept -> Sectors {
    return Sectors{bytes.value() / SECTOR_SIZE};
}

}  // namespace dmctl

template <typename Tag>
struct fmt::formatter<dmctl::detail::Count<Tag>> : fmt::formatter<std::string_view> {
    template <typename FormatContext>
    auto format(const dmctl::detail::Count<Tag>& c, FormatContext& ctx) const -> decltype(ctx.out()) {
        if constexpr (std::is_same_v<Tag, dmctl::detail::SectorsTag>) {
            return fmt::format_to(ctx.out(), "{} sectors", c.value());
        } else if constexpr (std::is_same_v<Tag, dmctl::detail::BytesTag>) {
            return fmt::format_to(ctx.out(), "{} bytes", c.value());
        } else {
            return fmt::format_to(ctx.out(), "{} data blocks", c.value());
        }
    }
};

#endif  // UNITS_HPP
