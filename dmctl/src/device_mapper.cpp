#include "dmctl/device_mapper.hpp"
#include "dmctl/string_utils.hpp"

#include <utility>  // for move
#include <variant>  // for get_if, get

#include <fmt/format.h>

#include <spdlog/spdlog.h>

namespace dmctl {

void set_identifier(layout::IoctlHeader& hdr, const DevId& id) noexcept {
    if (const auto* name = std::get_if<DmName>(&id)) {
        layout::copy_to_field(name->as_string_view(), hdr.name);
    } else {
        layout::copy_to_field(std::get<DmUuid>(id).as_string_view(), hdr.uuid);
    }
}

auto DeviceMapper::open(std::string_view path, std::size_t min_buffer_size) noexcept -> DmResult<DeviceMapper> {
    auto channel = ControlChannel::open(path, min_buffer_size);
    if (!channel) {
        return std::unexpected(std::move(channel.error()));
    }
    return DeviceMapper{std::move(*channel)};
}

DeviceMapper::DeviceMapper(ControlChannel channel) noexcept
  : m_channel(std::move(channel)) { }

auto DeviceMapper::device_header(const DevId& id, DmFlags flags) noexcept -> layout::IoctlHeader {
    auto hdr = initialize_header(flags);
    set_identifier(hdr, id);
    return hdr;
}

auto DeviceMapper::version() const noexcept -> DmResult<Version> {
    auto hdr = initialize_header();
    if (auto reply = m_channel.execute(Command::Version, hdr); !reply) {
        return std::unexpected(std::move(reply.error()));
    }
    return DeviceInfo{hdr}.version();
}

auto DeviceMapper::remove_all(DmFlags flags) const noexcept -> DmResult<void> {
    auto hdr = initialize_header(flags & flags::accepted::REMOVE_ALL);
    if (auto reply = m_channel.execute(Command::RemoveAll, hdr); !reply) {
        return std::unexpected(std::move(reply.error()));
    }
    return {};
}

auto DeviceMapper::list_devices() const noexcept -> DmResult<std::vector<ListedDevice>> {
    auto hdr   = initialize_header();
    auto reply = m_channel.execute(Command::ListDevices, hdr);
    if (!reply) {
        return std::unexpected(std::move(reply.error()));
    }
    return records::parse_name_list(*reply, hdr.version[1]);
}

auto DeviceMapper::device_create(const DmName& name, const std::optional<DmUuid>& uuid, DmFlags flags, std::optional<Device> device) const noexcept
    -> DmResult<DeviceInfo> {
    if (device) {
        // the kernel decodes dev as a 32-bit packed number
        if (!device->to_kdev_t()) {
            return make_invalid_argument(fmt::format("device number {} out of range", *device));
        }
        flags |= flags::PERSISTENT_DEV;
    }

    auto hdr = initialize_header(flags & flags::accepted::DEVICE_CREATE);
    layout::copy_to_field(name.as_string_view(), hdr.name);
    if (uuid) {
        layout::copy_to_field(uuid->as_string_view(), hdr.uuid);
    }
    if (device) {
        hdr.dev = device->to_dev_t();
    }

    if (auto reply = m_channel.execute(Command::DevCreate, hdr); !reply) {
        return std::unexpected(std::move(reply.error()));
    }
    spdlog::debug("[DM] created '{}' as {}", name, DeviceInfo{hdr}.device());
    return DeviceInfo{hdr};
}

auto DeviceMapper::device_remove(const DevId& id, DmFlags flags) const noexcept -> DmResult<DeviceInfo> {
    auto hdr = device_header(id, flags & flags::accepted::DEVICE_REMOVE);
    if (auto reply = m_channel.execute(Command::DevRemove, hdr); !reply) {
        return std::unexpected(std::move(reply.error()));
    }
    return DeviceInfo{hdr};
}

auto DeviceMapper::device_rename(const DmName& old_name, const DevId& new_id) const noexcept -> DmResult<DeviceInfo> {
    const auto* new_uuid = std::get_if<DmUuid>(&new_id);

    // The new identity travels in the payload, the header names the device.
    auto hdr = initialize_header(new_uuid != nullptr ? flags::UUID : DmFlags{});
    layout::copy_to_field(old_name.as_string_view(), hdr.name);

    const auto payload = (new_uuid != nullptr)
        ? records::build_rename_payload(new_uuid->as_string_view())
        : records::build_rename_payload(std::get<DmName>(new_id).as_string_view());

    if (auto reply = m_channel.execute(Command::DevRename, hdr, payload); !reply) {
        return std::unexpected(std::move(reply.error()));
    }
    return DeviceInfo{hdr};
}

auto DeviceMapper::device_suspend(const DevId& id, DmFlags flags) const noexcept -> DmResult<DeviceInfo> {
    auto hdr = device_header(id, flags & flags::accepted::DEVICE_SUSPEND);
    if (auto reply = m_channel.execute(Command::DevSuspend, hdr); !reply) {
        return std::unexpected(std::move(reply.error()));
    }
    return DeviceInfo{hdr};
}

auto DeviceMapper::device_info(const DevId& id) const noexcept -> DmResult<DeviceInfo> {
    auto hdr = device_header(id);
    if (auto reply = m_channel.execute(Command::DevStatus, hdr); !reply) {
        return std::unexpected(std::move(reply.error()));
    }
    return DeviceInfo{hdr};
}

auto DeviceMapper::device_wait(const DevId& id, DmFlags flags) const noexcept -> DmResult<TableStatus> {
    auto hdr = device_header(id, flags & flags::accepted::DEVICE_WAIT);

    spdlog::debug("[DM] waiting for an event on {}", id);
    auto reply = m_channel.execute(Command::DevWait, hdr);
    if (!reply) {
        return std::unexpected(std::move(reply.error()));
    }
    auto targets = records::parse_table_status(hdr.target_count, *reply);
    return TableStatus{.info = DeviceInfo{hdr}, .targets = std::move(targets)};
}

auto DeviceMapper::table_load(const DevId& id, std::span<const TargetLine> targets) const noexcept -> DmResult<DeviceInfo> {
    const auto payload = records::build_table_payload(targets);

    auto hdr         = device_header(id);
    hdr.target_count = static_cast<std::uint32_t>(targets.size());

    if (auto reply = m_channel.execute(Command::TableLoad, hdr, payload); !reply) {
        return std::unexpected(std::move(reply.error()));
    }
    return DeviceInfo{hdr};
}

auto DeviceMapper::table_clear(const DevId& id) const noexcept -> DmResult<DeviceInfo> {
    auto hdr = device_header(id);
    if (auto reply = m_channel.execute(Command::TableClear, hdr); !reply) {
        return std::unexpected(std::move(reply.error()));
    }
    return DeviceInfo{hdr};
}

auto DeviceMapper::table_deps(const DevId& id, DmFlags flags) const noexcept -> DmResult<std::vector<Device>> {
    auto hdr   = device_header(id, flags & flags::accepted::TABLE_DEPS);
    auto reply = m_channel.execute(Command::TableDeps, hdr);
    if (!reply) {
        return std::unexpected(std::move(reply.error()));
    }
    return records::parse_target_deps(*reply);
}

auto DeviceMapper::table_status(const DevId& id, DmFlags flags) const noexcept -> DmResult<TableStatus> {
    auto hdr   = device_header(id, flags & flags::accepted::TABLE_STATUS);
    auto reply = m_channel.execute(Command::TableStatus, hdr);
    if (!reply) {
        return std::unexpected(std::move(reply.error()));
    }
    auto targets = records::parse_table_status(hdr.target_count, *reply);
    return TableStatus{.info = DeviceInfo{hdr}, .targets = std::move(targets)};
}

auto DeviceMapper::list_versions() const noexcept -> DmResult<std::vector<TargetVersion>> {
    auto hdr   = initialize_header();
    auto reply = m_channel.execute(Command::ListVersions, hdr);
    if (!reply) {
        return std::unexpected(std::move(reply.error()));
    }
    return records::parse_target_versions(*reply);
}

auto DeviceMapper::target_msg(const DevId& id, std::optional<Sectors> sector, std::string_view message) const noexcept
    -> DmResult<MessageReply> {
    const auto payload = records::build_message_payload(sector, message);

    auto hdr   = device_header(id);
    auto reply = m_channel.execute(Command::TargetMsg, hdr, payload);
    if (!reply) {
        return std::unexpected(std::move(reply.error()));
    }

    std::optional<std::string> output{};
    if (DmFlags{hdr.flags}.contains(flags::DATA_OUT)) {
        // up to the terminating NUL, or all of it if the kernel left none
        const auto bytes = std::span<const std::byte>{*reply};
        output           = utils::from_utf8_lossy(layout::slice_to_null(bytes).value_or(bytes));
    }
    return MessageReply{.info = DeviceInfo{hdr}, .output = std::move(output)};
}

auto DeviceMapper::arm_poll() const noexcept -> DmResult<DeviceInfo> {
    auto hdr = initialize_header();
    if (auto reply = m_channel.execute(Command::DevArmPoll, hdr); !reply) {
        return std::unexpected(std::move(reply.error()));
    }
    return DeviceInfo{hdr};
}

}  // namespace dmctl
