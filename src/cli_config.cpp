#include "cli_config.hpp"

#include "dmctl/layout.hpp"

#include <expected>     // for expected, unexpected
#include <utility>      // for move
#include <string_view>  // for string_view

#if defined(__clang__)
#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Wold-style-cast"
#elif defined(__GNUC__)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wuseless-cast"
#pragma GCC diagnostic ignored "-Wold-style-cast"
#endif

#include <rapidjson/document.h>

#if defined(__clang__)
#pragma clang diagnostic pop
#elif defined(__GNUC__)
#pragma GCC diagnostic pop
#endif

#include <fmt/compile.h>
#include <fmt/format.h>

using namespace std::string_view_literals;

namespace {

auto parse_string_field(const rapidjson::Document& doc, const char* key, std::string& out) noexcept -> std::expected<void, std::string> {
    if (!doc.HasMember(key)) {
        return {};
    }
    if (!doc[key].IsString()) {
        return std::unexpected(fmt::format(FMT_COMPILE("'{}' must be a string"), key));
    }
    out = doc[key].GetString();
    return {};
}

}  // namespace

namespace cli {

auto get_default_config() noexcept -> CliConfig {
    return CliConfig{
        .control_path    = "/dev/mapper/control",
        .min_buffer_size = 16 * 1024,
        .log_level       = "warn",
    };
}

auto parse_cli_config(std::string_view json_content) noexcept
    -> std::expected<CliConfig, std::string> {
    if (json_content.empty()) {
        return get_default_config();
    }

    rapidjson::Document doc;
    doc.Parse(json_content.data(), json_content.size());
    if (doc.HasParseError()) {
        return std::unexpected(fmt::format(FMT_COMPILE("JSON parse error at offset {}"), doc.GetErrorOffset()));
    }
    if (!doc.IsObject()) {
        return std::unexpected("JSON root must be an object");
    }

    auto config = get_default_config();

    if (auto res = parse_string_field(doc, "control_path", config.control_path); !res) {
        return std::unexpected(std::move(res.error()));
    }
    if (config.control_path.empty()) {
        return std::unexpected("'control_path' must not be empty");
    }

    // Parse min_buffer_size (optional)
    if (doc.HasMember("min_buffer_size")) {
        if (!doc["min_buffer_size"].IsUint64()) {
            return std::unexpected("'min_buffer_size' must be a positive integer");
        }
        const auto size = doc["min_buffer_size"].GetUint64();
        if (size < dmctl::layout::header::SIZE) {
            return std::unexpected(fmt::format(FMT_COMPILE("'min_buffer_size' must be at least {}"), dmctl::layout::header::SIZE));
        }
        config.min_buffer_size = static_cast<std::size_t>(size);
    }

    if (auto res = parse_string_field(doc, "log_level", config.log_level); !res) {
        return std::unexpected(std::move(res.error()));
    }

    // Parse log_file (optional)
    if (doc.HasMember("log_file")) {
        if (!doc["log_file"].IsString()) {
            return std::unexpected("'log_file' must be a string");
        }
        config.log_file = doc["log_file"].GetString();
    }

    return config;
}

}  // namespace cli
