#include "dmctl/string_utils.hpp"

#include <cstdint>  // for uint8_t

using namespace std::string_view_literals;

namespace {

// U+FFFD REPLACEMENT CHARACTER
static constexpr auto REPLACEMENT_CHAR = "\xEF\xBF\xBD"sv;

struct SequenceRule {
    std::size_t length{};
    // allowed range of the second byte, the rest are always 0x80..0xBF
    std::uint8_t lower{0x80};
    std::uint8_t upper{0xBF};
};

// Well-formed UTF-8 byte sequences, Unicode table 3-7.
constexpr auto sequence_rule(std::uint8_t lead) noexcept -> SequenceRule {
    if (lead >= 0xC2 && lead <= 0xDF) {
        return {.length = 2};
    }
    if (lead == 0xE0) {
        return {.length = 3, .lower = 0xA0};
    }
    if (lead == 0xED) {
        return {.length = 3, .upper = 0x9F};
    }
    if (lead >= 0xE1 && lead <= 0xEF) {
        return {.length = 3};
    }
    if (lead == 0xF0) {
        return {.length = 4, .lower = 0x90};
    }
    if (lead >= 0xF1 && lead <= 0xF3) {
        return {.length = 4};
    }
    if (lead == 0xF4) {
        return {.length = 4, .upper = 0x8F};
    }
    return {.length = 0};
}

}  // namespace

namespace dmctl::utils {

auto split_keep_empty(std::string_view str, char delim) noexcept -> std::vector<std::string_view> {
    std::vector<std::string_view> pieces{};
    std::size_t begin{};
    while (true) {
        const auto pos = str.find(delim, begin);
        if (pos == std::string_view::npos) {
            pieces.emplace_back(str.substr(begin));
            break;
        }
        pieces.emplace_back(str.substr(begin, pos - begin));
        begin = pos + 1;
    }
    return pieces;
}

auto from_utf8_lossy(std::span<const std::byte> bytes) noexcept -> std::string {
    std::string result{};
    result.reserve(bytes.size());

    std::size_t pos{};
    while (pos < bytes.size()) {
        const auto lead = static_cast<std::uint8_t>(bytes[pos]);
        if (lead < 0x80) {
            result += static_cast<char>(lead);
            ++pos;
            continue;
        }

        const auto rule = sequence_rule(lead);
        if (rule.length == 0) {
            result += REPLACEMENT_CHAR;
            ++pos;
            continue;
        }

        // Count how many bytes of the sequence are valid. An invalid or
        // truncated sequence is replaced as a whole, up to the offending byte.
        std::size_t valid{1};
        for (; valid < rule.length && pos + valid < bytes.size(); ++valid) {
            const auto cont  = static_cast<std::uint8_t>(bytes[pos + valid]);
            const auto lower = (valid == 1) ? rule.lower : std::uint8_t{0x80};
            const auto upper = (valid == 1) ? rule.upper : std::uint8_t{0xBF};
            if (cont < lower || cont > upper) {
                break;
            }
        }

        if (valid == rule.length) {
            for (std::size_t i = 0; i < valid; ++i) {
                result += static_cast<char>(bytes[pos + i]);
            }
        } else {
            result += REPLACEMENT_CHAR;
        }
        pos += valid;
    }
    return result;
}

}  // namespace dmctl::utils
