#ifndef LAYOUT_HPP
#define LAYOUT_HPP

#include <array>        // for array
#include <cstddef>      // for byte, size_t
#include <cstdint>      // for uint32_t, uint64_t, int32_t
#include <cstring>      // for memcpy
#include <optional>     // for optional
#include <span>         // for span
#include <string_view>  // for string_view

#include <linux/dm-ioctl.h>

namespace dmctl::layout {

// Interface version this client speaks.
inline constexpr std::uint32_t VERSION_MAJOR      = 4;
inline constexpr std::uint32_t VERSION_MINOR      = 30;
inline constexpr std::uint32_t VERSION_PATCHLEVEL = 0;

inline constexpr std::size_t NAME_LEN      = DM_NAME_LEN;
inline constexpr std::size_t UUID_LEN      = DM_UUID_LEN;
inline constexpr std::size_t TYPE_NAME_LEN = DM_MAX_TYPE_NAME;

// struct dm_ioctl
namespace header {
inline constexpr std::size_t VERSION      = 0;
inline constexpr std::size_t DATA_SIZE    = 12;
inline constexpr std::size_t DATA_START   = 16;
inline constexpr std::size_t TARGET_COUNT = 20;
inline constexpr std::size_t OPEN_COUNT   = 24;
inline constexpr std::size_t FLAGS        = 28;
inline constexpr std::size_t EVENT_NR     = 32;
inline constexpr std::size_t DEV          = 40;
inline constexpr std::size_t NAME         = 48;
inline constexpr std::size_t UUID         = NAME + NAME_LEN;
inline constexpr std::size_t SIZE         = 312;
}  // namespace header

// struct dm_target_spec
namespace target_spec {
inline constexpr std::size_t SECTOR_START = 0;
inline constexpr std::size_t LENGTH       = 8;
inline constexpr std::size_t STATUS       = 16;
inline constexpr std::size_t NEXT         = 20;
inline constexpr std::size_t TARGET_TYPE  = 24;
inline constexpr std::size_t SIZE         = 40;
}  // namespace target_spec

// struct dm_target_msg
namespace target_msg {
inline constexpr std::size_t SECTOR  = 0;
inline constexpr std::size_t MESSAGE = 8;
}  // namespace target_msg

// struct dm_name_list
namespace name_list {
inline constexpr std::size_t DEV  = 0;
inline constexpr std::size_t NEXT = 8;
inline constexpr std::size_t NAME = 12;
// sizeof including tail padding, which some kernels used to locate event_nr
inline constexpr std::size_t SIZE = 16;
}  // namespace name_list

// struct dm_target_versions
namespace target_versions {
inline constexpr std::size_t NEXT    = 0;
inline constexpr std::size_t VERSION = 4;
inline constexpr std::size_t NAME    = 16;
}  // namespace target_versions

// struct dm_target_deps
namespace target_deps {
inline constexpr std::size_t COUNT = 0;
inline constexpr std::size_t DEV   = 8;
}  // namespace target_deps

static_assert(sizeof(dm_ioctl) == header::SIZE);
static_assert(offsetof(dm_ioctl, data_size) == header::DATA_SIZE);
static_assert(offsetof(dm_ioctl, data_start) == header::DATA_START);
static_assert(offsetof(dm_ioctl, target_count) == header::TARGET_COUNT);
static_assert(offsetof(dm_ioctl, open_count) == header::OPEN_COUNT);
static_assert(offsetof(dm_ioctl, flags) == header::FLAGS);
static_assert(offsetof(dm_ioctl, event_nr) == header::EVENT_NR);
static_assert(offsetof(dm_ioctl, dev) == header::DEV);
static_assert(offsetof(dm_ioctl, name) == header::NAME);
static_assert(offsetof(dm_ioctl, uuid) == header::UUID);
static_assert(sizeof(dm_target_spec) == target_spec::SIZE);
static_assert(offsetof(dm_target_spec, next) == target_spec::NEXT);
static_assert(offsetof(dm_target_spec, target_type) == target_spec::TARGET_TYPE);
static_assert(offsetof(dm_target_msg, message) == target_msg::MESSAGE);
static_assert(offsetof(dm_name_list, next) == name_list::NEXT);
static_assert(offsetof(dm_name_list, name) == name_list::NAME);
static_assert(sizeof(dm_name_list) == name_list::SIZE);
static_assert(offsetof(dm_target_versions, version) == target_versions::VERSION);
static_assert(offsetof(dm_target_versions, name) == target_versions::NAME);
static_assert(offsetof(dm_target_deps, dev) == target_deps::DEV);

/// Decoded struct dm_ioctl.
struct IoctlHeader {
    std::array<std::uint32_t, 3> version{};
    std::uint32_t data_size{};
    std::uint32_t data_start{};
    std::uint32_t target_count{};
    std::int32_t open_count{};
    std::uint32_t flags{};
    std::uint32_t event_nr{};
    std::uint64_t dev{};
    std::array<char, NAME_LEN> name{};
    std::array<char, UUID_LEN> uuid{};
};

/// Decoded struct dm_target_spec, without the trailing parameter string.
struct TargetSpec {
    std::uint64_t sector_start{};
    std::uint64_t length{};
    std::int32_t status{};
    std::uint32_t next{};
    std::array<char, TYPE_NAME_LEN> target_type{};
};

/* clang-format off */

template <typename T>
inline void store(std::span<std::byte> out, std::size_t offset, T value) noexcept
{ std::memcpy(out.data() + offset, &value, sizeof(T)); }

template <typename T>
[[nodiscard]] inline auto load(std::span<const std::byte> in, std::size_t offset) noexcept -> T {
    T value{};
    std::memcpy(&value, in.data() + offset, sizeof(T));
    return value;
}

/* clang-format on */

/// Round num up to the next multiple of align, which must be a power of two.
[[nodiscard]] constexpr auto align_to(std::size_t num, std::size_t align) noexcept -> std::size_t {
    const auto mask = align - 1;
    return (num + mask) & ~mask;
}

// Write header into the first header::SIZE bytes of out.
void encode_header(const IoctlHeader& hdr, std::span<std::byte> out) noexcept;
// Read header from the first header::SIZE bytes of in.
auto decode_header(std::span<const std::byte> in) noexcept -> IoctlHeader;

void encode_target_spec(const TargetSpec& spec, std::span<std::byte> out) noexcept;
auto decode_target_spec(std::span<const std::byte> in) noexcept -> TargetSpec;

/// @brief Returns the bytes of in up to, not including, the first NUL.
/// @return std::nullopt if there is no NUL in the slice.
auto slice_to_null(std::span<const std::byte> in) noexcept -> std::optional<std::span<const std::byte>>;

/// Copies str into a fixed-width field, NUL-padding the remainder.
/// str must be shorter than the field.
template <std::size_t N>
inline void copy_to_field(std::string_view str, std::array<char, N>& field) noexcept {
    field.fill('\0');
    std::memcpy(field.data(), str.data(), str.size() < N ? str.size() : N - 1);
}

/// The NUL-terminated contents of a fixed-width field.
template <std::size_t N>
[[nodiscard]] inline auto field_to_string_view(const std::array<char, N>& field) noexcept -> std::string_view {
    const auto* end = static_cast<const char*>(std::memchr(field.data(), '\0', N));
    return {field.data(), end != nullptr ? static_cast<std::size_t>(end - field.data()) : N};
}

}  // namespace dmctl::layout

#endif  // LAYOUT_HPP
