#include "dmctl/table.hpp"
#include "dmctl/string_utils.hpp"

#include <charconv>  // for from_chars
#include <cstdint>   // for uint64_t
#include <optional>  // for optional
#include <utility>   // for move

#include <fmt/compile.h>
#include <fmt/format.h>

namespace {

auto parse_u64(std::string_view str) noexcept -> std::optional<std::uint64_t> {
    std::uint64_t value{};
    const auto* end = str.data() + str.size();
    auto [ptr, ec]  = std::from_chars(str.data(), end, value);
    if (ec != std::errc{} || ptr != end) {
        return std::nullopt;
    }
    return value;
}

// Split off the next whitespace separated word.
auto next_word(std::string_view& str) noexcept -> std::string_view {
    str             = dmctl::utils::ltrim(str);
    const auto pos  = str.find_first_of(dmctl::utils::WHITESPACE);
    const auto word = str.substr(0, pos);
    str.remove_prefix(word.size());
    return word;
}

}  // namespace

namespace dmctl::table {

auto parse_table(std::string_view text) noexcept -> std::expected<std::vector<TargetLine>, std::string> {
    std::vector<TargetLine> targets{};

    const auto lines = utils::split_keep_empty(text, '\n');
    for (std::size_t i = 0; i < lines.size(); ++i) {
        const auto line_nr = i + 1;
        auto rest          = utils::trim(lines[i]);
        if (rest.empty() || rest.starts_with('#')) {
            continue;
        }

        const auto start_str  = next_word(rest);
        const auto length_str = next_word(rest);
        const auto type_str   = next_word(rest);
        if (type_str.empty()) {
            return std::unexpected(fmt::format(FMT_COMPILE("line {}: expected '<start> <length> <type> [params]'"), line_nr));
        }

        const auto start = parse_u64(start_str);
        if (!start) {
            return std::unexpected(fmt::format(FMT_COMPILE("line {}: invalid start sector '{}'"), line_nr, start_str));
        }
        const auto length = parse_u64(length_str);
        if (!length) {
            return std::unexpected(fmt::format(FMT_COMPILE("line {}: invalid length '{}'"), line_nr, length_str));
        }
        auto target_type = TargetType::create(type_str);
        if (!target_type) {
            return std::unexpected(fmt::format(FMT_COMPILE("line {}: {}"), line_nr, target_type.error().message));
        }

        targets.emplace_back(TargetLine{
            .start       = Sectors{*start},
            .length      = Sectors{*length},
            .target_type = std::move(*target_type),
            .params      = std::string{utils::trim(rest)},
        });
    }
    return targets;
}

auto format_table(std::span<const TargetLine> targets) noexcept -> std::string {
    std::string result{};
    for (const auto& target : targets) {
        if (target.params.empty()) {
            result += fmt::format(FMT_COMPILE("{} {} {}\n"), target.start.value(), target.length.value(), target.target_type);
        } else {
            result += fmt::format(FMT_COMPILE("{} {} {} {}\n"), target.start.value(), target.length.value(), target.target_type, target.params);
        }
    }
    return result;
}

}  // namespace dmctl::table
