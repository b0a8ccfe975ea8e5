#ifndef TYPES_HPP
#define TYPES_HPP

#include "dmctl/error.hpp"
#include "dmctl/layout.hpp"
#include "dmctl/units.hpp"

#include <compare>      // for strong_ordering
#include <cstddef>      // for size_t
#include <optional>     // for optional
#include <string>       // for string
#include <string_view>  // for string_view
#include <utility>      // for move
#include <variant>      // for variant

#include <fmt/format.h>

namespace dmctl {

/// @brief Checks a string against the kernel's rules for a fixed-width field.
/// @return An error message, or std::nullopt if the value is acceptable.
auto validate_identifier(std::string_view value, std::size_t max_len, std::string_view kind) noexcept -> std::optional<std::string>;

/// @brief A string validated once at construction to fit a kernel field.
///
/// Non-empty, at most Traits::max_len bytes, no embedded NUL. There is no
/// way to build an invalid one, so copying it into a header never truncates.
template <typename Traits>
class Identifier final {
 public:
    static auto create(std::string_view value) noexcept -> DmResult<Identifier> {
        if (auto err = validate_identifier(value, Traits::max_len, Traits::kind)) {
            return make_invalid_argument(std::move(*err));
        }
        return Identifier{std::string{value}};
    }

    [[nodiscard]] auto as_string_view() const noexcept -> std::string_view { return m_value; }
    [[nodiscard]] auto size() const noexcept -> std::size_t { return m_value.size(); }

    auto operator<=>(const Identifier&) const noexcept = default;

 private:
    explicit Identifier(std::string value) noexcept
      : m_value(std::move(value)) { }

    std::string m_value;
};

struct NameTraits {
    static constexpr std::size_t max_len = layout::NAME_LEN - 1;
    static constexpr std::string_view kind{"device name"};
};
struct UuidTraits {
    static constexpr std::size_t max_len = layout::UUID_LEN - 1;
    static constexpr std::string_view kind{"device uuid"};
};
struct TargetTypeTraits {
    static constexpr std::size_t max_len = layout::TYPE_NAME_LEN - 1;
    static constexpr std::string_view kind{"target type"};
};

using DmName     = Identifier<NameTraits>;
using DmUuid     = Identifier<UuidTraits>;
using TargetType = Identifier<TargetTypeTraits>;

/// Addresses a device either by name or by uuid, never both.
using DevId = std::variant<DmName, DmUuid>;

/// @brief One row of a device's mapping table.
///
/// params is opaque here, its grammar belongs to the target type.
struct TargetLine {
    Sectors start;
    Sectors length;
    TargetType target_type;
    std::string params;

    bool operator==(const TargetLine&) const = default;
};

}  // namespace dmctl

template <typename Traits>
struct fmt::formatter<dmctl::Identifier<Traits>> : fmt::formatter<std::string_view> {
    template <typename FormatContext>
    auto format(const dmctl::Identifier<Traits>& id, FormatContext& ctx) const -> decltype(ctx.out()) {
        return fmt::formatter<std::string_view>::format(id.as_string_view(), ctx);
    }
};

template <>
struct fmt::formatter<dmctl::DevId> : fmt::formatter<std::string_view> {
    template <typename FormatContext>
    auto format(const dmctl::DevId& id, FormatContext& ctx) const -> decltype(ctx.out()) {
        if (const auto* name = std::get_if<dmctl::DmName>(&id)) {
            return fmt::format_to(ctx.out(), "name '{}'", name->as_string_view());
        }
        return fmt::format_to(ctx.out(), "uuid '{}'", std::get<dmctl::DmUuid>(id).as_string_view());
    }
};

template <>
struct fmt::formatter<dmctl::TargetLine> : fmt::formatter<std::string_view> {
    template <typename FormatContext>
    auto format(const dmctl::TargetLine& t, FormatContext& ctx) const -> decltype(ctx.out()) {
        return fmt::format_to(ctx.out(), "(start:{}, length:{}, type:'{}', params:'{}')",
            t.start.value(), t.length.value(), t.target_type.as_string_view(), t.params);
    }
};

#endif  // TYPES_HPP
