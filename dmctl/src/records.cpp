#include "dmctl/records.hpp"
#include "dmctl/layout.hpp"
#include "dmctl/string_utils.hpp"

#include <algorithm>  // for copy
#include <exception>  // for terminate
#include <utility>    // for move

#include <fmt/compile.h>
#include <fmt/format.h>

#include <spdlog/spdlog.h>

using namespace std::string_view_literals;

namespace {

namespace layout = dmctl::layout;

// The kernel accepted the request but handed back something we can not
// walk. Nothing sensible can be done with the rest of the reply.
[[noreturn]] void malformed_reply(std::string_view what) noexcept {
    spdlog::critical("[DM] malformed reply from the kernel: {}", what);
    std::terminate();
}

auto checked_subspan(std::span<const std::byte> data, std::size_t offset, std::size_t length, std::string_view what) noexcept
    -> std::span<const std::byte> {
    if (offset > data.size() || length > data.size() - offset) {
        malformed_reply(fmt::format(FMT_COMPILE("{} at offset {} (+{}) overruns a {} byte payload"), what, offset, length, data.size()));
    }
    return data.subspan(offset, length);
}

template <typename T>
auto checked_load(std::span<const std::byte> data, std::size_t offset, std::string_view what) noexcept -> T {
    return layout::load<T>(checked_subspan(data, offset, sizeof(T), what), 0);
}

// Bytes from offset up to the next NUL, decoded permissively.
auto checked_c_string(std::span<const std::byte> data, std::size_t offset, std::string_view what) noexcept -> std::string {
    const auto tail  = checked_subspan(data, offset, data.size() - std::min(offset, data.size()), what);
    const auto slice = layout::slice_to_null(tail);
    if (!slice) {
        malformed_reply(fmt::format(FMT_COMPILE("{} at offset {} is not NUL-terminated"), what, offset));
    }
    return dmctl::utils::from_utf8_lossy(*slice);
}

// Visit a chain of records linked by a relative u32 'next' field. The chain
// ends at the first record whose next is 0.
template <typename Func>
void walk_linked_records(std::span<const std::byte> data, std::size_t next_field, std::string_view what, Func&& func) noexcept {
    std::size_t offset{};
    while (true) {
        const auto next = checked_load<std::uint32_t>(data, offset + next_field, what);
        func(offset);
        if (next == 0) {
            break;
        }
        offset += next;
    }
}

template <typename Id>
auto kernel_identifier(std::string_view value, std::string_view what) noexcept -> Id {
    auto id = Id::create(value);
    if (!id) {
        malformed_reply(fmt::format(FMT_COMPILE("{} '{}': {}"), what, value, id.error().message));
    }
    return std::move(*id);
}

void append_bytes(std::vector<std::byte>& out, std::string_view str) noexcept {
    const auto* first = reinterpret_cast<const std::byte*>(str.data());
    out.insert(out.end(), first, first + str.size());
}

}  // namespace

namespace dmctl::records {

auto parse_name_list(std::span<const std::byte> data, std::uint32_t kernel_minor) noexcept -> std::vector<ListedDevice> {
    std::vector<ListedDevice> devices{};
    if (data.empty()) {
        return devices;
    }

    walk_linked_records(data, layout::name_list::NEXT, "name list record"sv, [&](std::size_t offset) {
        const auto dev  = checked_load<std::uint64_t>(data, offset + layout::name_list::DEV, "name list dev"sv);
        auto name       = checked_c_string(data, offset + layout::name_list::NAME, "name list name"sv);
        const auto nlen = name.size();

        // Interface 4.36 placed event_nr past sizeof(dm_name_list) plus an
        // extra align mask, later versions right after the name.
        std::optional<std::uint32_t> event_nr{};
        if (kernel_minor == 36) {
            const auto event_off = layout::align_to(layout::name_list::SIZE + nlen + 1 + 7, sizeof(std::uint64_t));
            event_nr             = checked_load<std::uint32_t>(data, offset + event_off, "name list event_nr"sv);
        } else if (kernel_minor > 36) {
            const auto event_off = layout::align_to(layout::name_list::NAME + nlen + 1, sizeof(std::uint64_t));
            event_nr             = checked_load<std::uint32_t>(data, offset + event_off, "name list event_nr"sv);
        }

        devices.emplace_back(ListedDevice{
            .name     = kernel_identifier<DmName>(name, "device name"sv),
            .device   = Device::from_dev_t(dev),
            .event_nr = event_nr,
        });
    });
    return devices;
}

auto parse_target_versions(std::span<const std::byte> data) noexcept -> std::vector<TargetVersion> {
    std::vector<TargetVersion> targets{};
    if (data.empty()) {
        return targets;
    }

    walk_linked_records(data, layout::target_versions::NEXT, "target version record"sv, [&](std::size_t offset) {
        const auto base = offset + layout::target_versions::VERSION;
        Version version{
            .major = checked_load<std::uint32_t>(data, base, "target version"sv),
            .minor = checked_load<std::uint32_t>(data, base + 4, "target version"sv),
            .patch = checked_load<std::uint32_t>(data, base + 8, "target version"sv),
        };
        targets.emplace_back(TargetVersion{
            .name    = checked_c_string(data, offset + layout::target_versions::NAME, "target version name"sv),
            .version = version,
        });
    });
    return targets;
}

auto parse_target_deps(std::span<const std::byte> data) noexcept -> std::vector<Device> {
    // no table selected, the kernel writes no dm_target_deps at all
    if (data.empty()) {
        return {};
    }

    const auto count = checked_load<std::uint32_t>(data, layout::target_deps::COUNT, "deps count"sv);

    std::vector<Device> devices{};
    devices.reserve(count);
    for (std::uint32_t i = 0; i < count; ++i) {
        // 64-bit slots, only the low 32 bits carry the kdev_t
        const auto slot = checked_load<std::uint64_t>(data, layout::target_deps::DEV + i * sizeof(std::uint64_t), "deps entry"sv);
        devices.emplace_back(Device::from_kdev_t(static_cast<std::uint32_t>(slot)));
    }
    return devices;
}

auto parse_table_status(std::uint32_t count, std::span<const std::byte> data) noexcept -> std::vector<TargetLine> {
    std::vector<TargetLine> targets{};
    if (data.empty()) {
        return targets;
    }

    std::size_t offset{};
    for (std::uint32_t i = 0; i < count; ++i) {
        const auto spec = layout::decode_target_spec(checked_subspan(data, offset, layout::target_spec::SIZE, "target spec"sv));

        const auto type_name = layout::field_to_string_view(spec.target_type);
        if (type_name.size() == spec.target_type.size()) {
            malformed_reply("target type is not NUL-terminated"sv);
        }
        auto params = checked_c_string(data, offset + layout::target_spec::SIZE, "target params"sv);

        targets.emplace_back(TargetLine{
            .start       = Sectors{spec.sector_start},
            .length      = Sectors{spec.length},
            .target_type = kernel_identifier<TargetType>(utils::from_utf8_lossy(std::as_bytes(std::span{type_name})), "target type"sv),
            .params      = std::string{utils::rtrim(params)},
        });

        // relative to the first record, unlike the linked lists
        offset = spec.next;
    }
    return targets;
}

auto build_table_payload(std::span<const TargetLine> targets) noexcept -> std::vector<std::byte> {
    std::vector<std::byte> payload{};
    for (const auto& target : targets) {
        const auto params_len = target.params.size();
        const auto padding    = layout::align_to(params_len + 1, sizeof(std::uint64_t)) - params_len;

        layout::TargetSpec spec{
            .sector_start = target.start.value(),
            .length       = target.length.value(),
            .status       = 0,
            .next         = static_cast<std::uint32_t>(layout::target_spec::SIZE + params_len + padding),
        };
        layout::copy_to_field(target.target_type.as_string_view(), spec.target_type);

        const auto record_start = payload.size();
        payload.resize(record_start + layout::target_spec::SIZE);
        layout::encode_target_spec(spec, std::span{payload}.subspan(record_start));

        append_bytes(payload, target.params);
        payload.resize(payload.size() + padding, std::byte{0});
    }
    return payload;
}

auto build_rename_payload(std::string_view value) noexcept -> std::vector<std::byte> {
    std::vector<std::byte> payload{};
    payload.reserve(value.size() + 1);
    append_bytes(payload, value);
    payload.emplace_back(std::byte{0});
    return payload;
}

auto build_message_payload(std::optional<Sectors> sector, std::string_view message) noexcept -> std::vector<std::byte> {
    std::vector<std::byte> payload(layout::target_msg::MESSAGE, std::byte{0});
    layout::store(payload, layout::target_msg::SECTOR, sector.value_or(Sectors{}).value());
    append_bytes(payload, message);
    payload.emplace_back(std::byte{0});
    return payload;
}

}  // namespace dmctl::records
