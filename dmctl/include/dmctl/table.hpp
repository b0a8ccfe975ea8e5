#ifndef TABLE_HPP
#define TABLE_HPP

#include "dmctl/types.hpp"

#include <expected>     // for expected
#include <span>         // for span
#include <string>       // for string
#include <string_view>  // for string_view
#include <vector>       // for vector

namespace dmctl::table {

/// @brief Parse dmsetup table text.
///
/// One target per line: "<start> <length> <type> [params...]". Blank lines
/// and lines starting with '#' are skipped. Params are kept verbatim apart
/// from surrounding whitespace.
/// @return The targets in order, or an error naming the offending line.
auto parse_table(std::string_view text) noexcept -> std::expected<std::vector<TargetLine>, std::string>;

/// Render targets as table text, one line each.
auto format_table(std::span<const TargetLine> targets) noexcept -> std::string;

}  // namespace dmctl::table

#endif  // TABLE_HPP
