#include "dmctl/layout.hpp"

#include <algorithm>  // for find

namespace dmctl::layout {

void encode_header(const IoctlHeader& hdr, std::span<std::byte> out) noexcept {
    for (std::size_t i = 0; i < hdr.version.size(); ++i) {
        store(out, header::VERSION + i * sizeof(std::uint32_t), hdr.version[i]);
    }
    store(out, header::DATA_SIZE, hdr.data_size);
    store(out, header::DATA_START, hdr.data_start);
    store(out, header::TARGET_COUNT, hdr.target_count);
    store(out, header::OPEN_COUNT, hdr.open_count);
    store(out, header::FLAGS, hdr.flags);
    store(out, header::EVENT_NR, hdr.event_nr);
    store(out, header::EVENT_NR + sizeof(std::uint32_t), std::uint32_t{0});
    store(out, header::DEV, hdr.dev);
    std::memcpy(out.data() + header::NAME, hdr.name.data(), hdr.name.size());
    std::memcpy(out.data() + header::UUID, hdr.uuid.data(), hdr.uuid.size());

    // trailing padding
    const auto tail = header::UUID + UUID_LEN;
    std::memset(out.data() + tail, 0, header::SIZE - tail);
}

auto decode_header(std::span<const std::byte> in) noexcept -> IoctlHeader {
    IoctlHeader hdr{};
    for (std::size_t i = 0; i < hdr.version.size(); ++i) {
        hdr.version[i] = load<std::uint32_t>(in, header::VERSION + i * sizeof(std::uint32_t));
    }
    hdr.data_size    = load<std::uint32_t>(in, header::DATA_SIZE);
    hdr.data_start   = load<std::uint32_t>(in, header::DATA_START);
    hdr.target_count = load<std::uint32_t>(in, header::TARGET_COUNT);
    hdr.open_count   = load<std::int32_t>(in, header::OPEN_COUNT);
    hdr.flags        = load<std::uint32_t>(in, header::FLAGS);
    hdr.event_nr     = load<std::uint32_t>(in, header::EVENT_NR);
    hdr.dev          = load<std::uint64_t>(in, header::DEV);
    std::memcpy(hdr.name.data(), in.data() + header::NAME, hdr.name.size());
    std::memcpy(hdr.uuid.data(), in.data() + header::UUID, hdr.uuid.size());
    return hdr;
}

void encode_target_spec(const TargetSpec& spec, std::span<std::byte> out) noexcept {
    store(out, target_spec::SECTOR_START, spec.sector_start);
    store(out, target_spec::LENGTH, spec.length);
    store(out, target_spec::STATUS, spec.status);
    store(out, target_spec::NEXT, spec.next);
    std::memcpy(out.data() + target_spec::TARGET_TYPE, spec.target_type.data(), spec.target_type.size());
}

auto decode_target_spec(std::span<const std::byte> in) noexcept -> TargetSpec {
    TargetSpec spec{};
    spec.sector_start = load<std::uint64_t>(in, target_spec::SECTOR_START);
    spec.length       = load<std::uint64_t>(in, target_spec::LENGTH);
    spec.status       = load<std::int32_t>(in, target_spec::STATUS);
    spec.next         = load<std::uint32_t>(in, target_spec::NEXT);
    std::memcpy(spec.target_type.data(), in.data() + target_spec::TARGET_TYPE, spec.target_type.size());
    return spec;
}

auto slice_to_null(std::span<const std::byte> in) noexcept -> std::optional<std::span<const std::byte>> {
    const auto it = std::ranges::find(in, std::byte{0});
    if (it == in.end()) {
        return std::nullopt;
    }
    return in.first(static_cast<std::size_t>(it - in.begin()));
}

}  // namespace dmctl::layout
