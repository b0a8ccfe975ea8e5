#include "dmctl/file_utils.hpp"

#include <cerrno>   // for errno
#include <cstdio>   // for fopen, fread, fseek, ftell, fclose
#include <cstring>  // for strerror

#include <spdlog/spdlog.h>

namespace dmctl::file_utils {

auto read_whole_file(std::string_view filepath) noexcept -> std::optional<std::string> {
    const std::string path{filepath};

    // Use std::fopen because it's faster than std::ifstream
    auto* file = std::fopen(path.c_str(), "rb");
    if (file == nullptr) {
        spdlog::error("[READWHOLEFILE] '{}' open failed: {}", filepath, std::strerror(errno));
        return std::nullopt;
    }

    const auto size = (std::fseek(file, 0, SEEK_END) == 0) ? std::ftell(file) : -1L;
    if (size < 0 || std::fseek(file, 0, SEEK_SET) != 0) {
        spdlog::error("[READWHOLEFILE] '{}' is not seekable: {}", filepath, std::strerror(errno));
        std::fclose(file);
        return std::nullopt;
    }

    std::string buf;
    buf.resize(static_cast<std::size_t>(size));

    const std::size_t read = std::fread(buf.data(), sizeof(char), buf.size(), file);
    std::fclose(file);
    if (read != buf.size()) {
        spdlog::error("[READWHOLEFILE] '{}' read failed: {}", filepath, std::strerror(errno));
        return std::nullopt;
    }

    return buf;
}

}  // namespace dmctl::file_utils
