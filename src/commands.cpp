#include "commands.hpp"

#include "dmctl/file_utils.hpp"
#include "dmctl/table.hpp"

#include <charconv>  // for from_chars
#include <cstdint>   // for uint32_t, uint64_t
#include <exception>  // for exception
#include <iostream>  // for cin
#include <iterator>  // for istreambuf_iterator
#include <map>       // for map
#include <memory>    // for unique_ptr, make_unique
#include <optional>  // for optional
#include <sstream>   // for ostringstream
#include <utility>   // for move, forward

#include <boost/program_options.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <spdlog/spdlog.h>

namespace po = boost::program_options;

using namespace std::string_view_literals;

namespace {

void report_error(const dmctl::DmError& err) noexcept {
    fmt::print(stderr, "dmctl: {}\n", err);
}

auto dev_id_from(const po::variables_map& vm) noexcept -> dmctl::DmResult<dmctl::DevId> {
    const auto& value = vm["device"].as<std::string>();
    if (vm.count("by-uuid") != 0) {
        auto uuid = dmctl::DmUuid::create(value);
        if (!uuid) {
            return std::unexpected(std::move(uuid.error()));
        }
        return dmctl::DevId{std::move(*uuid)};
    }
    auto name = dmctl::DmName::create(value);
    if (!name) {
        return std::unexpected(std::move(name.error()));
    }
    return dmctl::DevId{std::move(*name)};
}

void print_info(std::FILE* out, const dmctl::DeviceInfo& info) noexcept {
    const auto flags = info.flags();

    std::string_view tables{"None"};
    if (flags.contains(dmctl::flags::ACTIVE_PRESENT | dmctl::flags::INACTIVE_PRESENT)) {
        tables = "LIVE & INACTIVE"sv;
    } else if (flags.contains(dmctl::flags::ACTIVE_PRESENT)) {
        tables = "LIVE"sv;
    } else if (flags.contains(dmctl::flags::INACTIVE_PRESENT)) {
        tables = "INACTIVE"sv;
    }

    /* clang-format off */
    fmt::print(out, "Name:              {}\n", info.name());
    fmt::print(out, "State:             {}{}\n", flags.contains(dmctl::flags::SUSPEND) ? "SUSPENDED"sv : "ACTIVE"sv,
        flags.contains(dmctl::flags::READONLY) ? " (READ-ONLY)"sv : ""sv);
    fmt::print(out, "Tables present:    {}\n", tables);
    fmt::print(out, "Open count:        {}\n", info.open_count());
    fmt::print(out, "Event number:      {}\n", info.event_nr());
    fmt::print(out, "Major, minor:      {}, {}\n", info.device().major, info.device().minor);
    fmt::print(out, "Number of targets: {}\n", info.target_count());
    if (const auto uuid = info.uuid()) {
        fmt::print(out, "UUID:              {}\n", *uuid);
    }
    /* clang-format on */
}

void print_targets(std::FILE* out, const std::vector<dmctl::TargetLine>& targets) noexcept {
    fmt::print(out, "{}", dmctl::table::format_table(targets));
}

/// @brief One dmctl command: its options, usage text and action.
class ArgsProc {
 public:
    explicit ArgsProc(std::string usage)
      : m_usage(std::move(usage)) {
        m_desc.add_options()("help,h", "Print usage for command.");
    }
    virtual ~ArgsProc() = default;

    void print_usage(std::FILE* out) const {
        std::ostringstream desc;
        desc << m_desc;
        fmt::print(out, "\t{}\n{}\n", m_usage, desc.str());
    }

    auto process(const std::vector<std::string>& args, const cli::mapper_factory& open_mapper, std::FILE* out) -> int {
        po::options_description all;
        all.add(m_desc).add(m_hidden);

        po::variables_map vm;
        po::store(po::command_line_parser(args).options(all).positional(m_positional).run(), vm);
        if (vm.count("help") != 0) {
            print_usage(out);
            return 0;
        }
        po::notify(vm);

        auto dm = open_mapper();
        if (!dm) {
            report_error(dm.error());
            return 1;
        }
        return execute(vm, *dm, out);
    }

    virtual auto execute(const po::variables_map& vm, const dmctl::DeviceMapper& dm, std::FILE* out) -> int = 0;

 protected:
    // positional argument, hidden from the option list
    void add_positional(const char* name, int max_count = 1) {
        if (max_count == -1) {
            m_hidden.add_options()(name, po::value<std::vector<std::string>>()->required());
        } else {
            m_hidden.add_options()(name, po::value<std::string>()->required());
        }
        m_positional.add(name, max_count);
    }

    // <dev> argument, a name unless --by-uuid is given
    void add_device() {
        add_positional("device");
        m_desc.add_options()("by-uuid,u", "Address the device by uuid.");
    }

    po::options_description m_desc{"Options"};
    po::options_description m_hidden;
    po::positional_options_description m_positional;
    std::string m_usage;
};

class VersionArgsProc final : public ArgsProc {
 public:
    VersionArgsProc()
      : ArgsProc("Print the kernel driver interface version.") { }

    auto execute(const po::variables_map&, const dmctl::DeviceMapper& dm, std::FILE* out) -> int override {
        const auto version = dm.version();
        if (!version) {
            report_error(version.error());
            return 1;
        }
        fmt::print(out, "Driver version:    {}\n", *version);
        return 0;
    }
};

class TargetsArgsProc final : public ArgsProc {
 public:
    TargetsArgsProc()
      : ArgsProc("List the target types registered with the kernel.") { }

    auto execute(const po::variables_map&, const dmctl::DeviceMapper& dm, std::FILE* out) -> int override {
        const auto targets = dm.list_versions();
        if (!targets) {
            report_error(targets.error());
            return 1;
        }
        for (const auto& target : *targets) {
            fmt::print(out, "{}\n", target);
        }
        return 0;
    }
};

class LsArgsProc final : public ArgsProc {
 public:
    LsArgsProc()
      : ArgsProc("List devices.") { }

    auto execute(const po::variables_map&, const dmctl::DeviceMapper& dm, std::FILE* out) -> int override {
        const auto devices = dm.list_devices();
        if (!devices) {
            report_error(devices.error());
            return 1;
        }
        if (devices->empty()) {
            fmt::print(out, "No devices found\n");
        }
        for (const auto& device : *devices) {
            fmt::print(out, "{}\n", device);
        }
        return 0;
    }
};

class CreateArgsProc final : public ArgsProc {
 public:
    CreateArgsProc()
      : ArgsProc("create <name>: Create a device. It starts suspended with no table.") {
        add_positional("name");
        m_desc.add_options()
            ("uuid", po::value<std::string>(), "Set the device uuid.")
            ("minor,m", po::value<std::uint32_t>(), "Ask for this minor number.")
            ("readonly,r", "Create a read-only device.");
    }

    auto execute(const po::variables_map& vm, const dmctl::DeviceMapper& dm, std::FILE* out) -> int override {
        auto name = dmctl::DmName::create(vm["name"].as<std::string>());
        if (!name) {
            report_error(name.error());
            return 1;
        }

        std::optional<dmctl::DmUuid> uuid{};
        if (vm.count("uuid") != 0) {
            auto parsed = dmctl::DmUuid::create(vm["uuid"].as<std::string>());
            if (!parsed) {
                report_error(parsed.error());
                return 1;
            }
            uuid = std::move(*parsed);
        }

        std::optional<dmctl::Device> device{};
        if (vm.count("minor") != 0) {
            device = dmctl::Device{.major = 0, .minor = vm["minor"].as<std::uint32_t>()};
        }

        const auto flags = (vm.count("readonly") != 0) ? dmctl::flags::READONLY : dmctl::DmFlags{};
        const auto info  = dm.device_create(*name, uuid, flags, device);
        if (!info) {
            report_error(info.error());
            return 1;
        }
        print_info(out, *info);
        return 0;
    }
};

class RemoveArgsProc final : public ArgsProc {
 public:
    RemoveArgsProc()
      : ArgsProc("remove <dev>: Remove a device.") {
        add_device();
        m_desc.add_options()("deferred", "Remove on last close if the device is in use.");
    }

    auto execute(const po::variables_map& vm, const dmctl::DeviceMapper& dm, std::FILE*) -> int override {
        const auto id = dev_id_from(vm);
        if (!id) {
            report_error(id.error());
            return 1;
        }
        const auto flags = (vm.count("deferred") != 0) ? dmctl::flags::DEFERRED_REMOVE : dmctl::DmFlags{};
        if (auto info = dm.device_remove(*id, flags); !info) {
            report_error(info.error());
            return 1;
        }
        return 0;
    }
};

class RemoveAllArgsProc final : public ArgsProc {
 public:
    RemoveAllArgsProc()
      : ArgsProc("Remove every device that is not in use.") {
        m_desc.add_options()("deferred", "Remove in-use devices on last close.");
    }

    auto execute(const po::variables_map& vm, const dmctl::DeviceMapper& dm, std::FILE*) -> int override {
        const auto flags = (vm.count("deferred") != 0) ? dmctl::flags::DEFERRED_REMOVE : dmctl::DmFlags{};
        if (auto res = dm.remove_all(flags); !res) {
            report_error(res.error());
            return 1;
        }
        return 0;
    }
};

class RenameArgsProc final : public ArgsProc {
 public:
    RenameArgsProc()
      : ArgsProc("rename <name> <new>: Rename a device, or set its uuid with --set-uuid.") {
        add_positional("name");
        add_positional("new");
        m_desc.add_options()("set-uuid", "<new> is a uuid for a device that has none.");
    }

    auto execute(const po::variables_map& vm, const dmctl::DeviceMapper& dm, std::FILE*) -> int override {
        auto old_name = dmctl::DmName::create(vm["name"].as<std::string>());
        if (!old_name) {
            report_error(old_name.error());
            return 1;
        }

        const auto& new_value = vm["new"].as<std::string>();
        const auto to_dev_id  = [](auto&& id) { return dmctl::DevId{std::forward<decltype(id)>(id)}; };
        const auto new_id     = (vm.count("set-uuid") != 0)
            ? dmctl::DmUuid::create(new_value).transform(to_dev_id)
            : dmctl::DmName::create(new_value).transform(to_dev_id);
        if (!new_id) {
            report_error(new_id.error());
            return 1;
        }

        if (auto info = dm.device_rename(*old_name, *new_id); !info) {
            report_error(info.error());
            return 1;
        }
        return 0;
    }
};

class SuspendArgsProc final : public ArgsProc {
 public:
    SuspendArgsProc()
      : ArgsProc("suspend <dev>: Suspend a device.") {
        add_device();
        m_desc.add_options()
            ("noflush", "Do not flush outstanding I/O.")
            ("nolockfs", "Do not freeze the filesystem.");
    }

    auto execute(const po::variables_map& vm, const dmctl::DeviceMapper& dm, std::FILE*) -> int override {
        const auto id = dev_id_from(vm);
        if (!id) {
            report_error(id.error());
            return 1;
        }
        auto flags = dmctl::flags::SUSPEND;
        if (vm.count("noflush") != 0) {
            flags |= dmctl::flags::NOFLUSH;
        }
        if (vm.count("nolockfs") != 0) {
            flags |= dmctl::flags::SKIP_LOCKFS;
        }
        if (auto info = dm.device_suspend(*id, flags); !info) {
            report_error(info.error());
            return 1;
        }
        return 0;
    }
};

class ResumeArgsProc final : public ArgsProc {
 public:
    ResumeArgsProc()
      : ArgsProc("resume <dev>: Resume a device, making a loaded table live.") {
        add_device();
    }

    auto execute(const po::variables_map& vm, const dmctl::DeviceMapper& dm, std::FILE*) -> int override {
        const auto id = dev_id_from(vm);
        if (!id) {
            report_error(id.error());
            return 1;
        }
        if (auto info = dm.device_suspend(*id, dmctl::DmFlags{}); !info) {
            report_error(info.error());
            return 1;
        }
        return 0;
    }
};

class InfoArgsProc final : public ArgsProc {
 public:
    InfoArgsProc()
      : ArgsProc("info <dev>: Show device state.") {
        add_device();
    }

    auto execute(const po::variables_map& vm, const dmctl::DeviceMapper& dm, std::FILE* out) -> int override {
        const auto id = dev_id_from(vm);
        if (!id) {
            report_error(id.error());
            return 1;
        }
        const auto info = dm.device_info(*id);
        if (!info) {
            report_error(info.error());
            return 1;
        }
        print_info(out, *info);
        return 0;
    }
};

class WaitArgsProc final : public ArgsProc {
 public:
    WaitArgsProc()
      : ArgsProc("wait <dev>: Block until the device posts an event, then show its status.") {
        add_device();
        m_desc.add_options()("inactive", "Report the inactive table.");
    }

    auto execute(const po::variables_map& vm, const dmctl::DeviceMapper& dm, std::FILE* out) -> int override {
        const auto id = dev_id_from(vm);
        if (!id) {
            report_error(id.error());
            return 1;
        }
        const auto flags  = (vm.count("inactive") != 0) ? dmctl::flags::QUERY_INACTIVE_TABLE : dmctl::DmFlags{};
        const auto status = dm.device_wait(*id, flags);
        if (!status) {
            report_error(status.error());
            return 1;
        }
        fmt::print(out, "Event number:      {}\n", status->info.event_nr());
        print_targets(out, status->targets);
        return 0;
    }
};

class LoadArgsProc final : public ArgsProc {
 public:
    LoadArgsProc()
      : ArgsProc("load <dev> <table-file|->: Load a table into the inactive slot.") {
        add_device();
        add_positional("table");
    }

    auto execute(const po::variables_map& vm, const dmctl::DeviceMapper& dm, std::FILE*) -> int override {
        const auto id = dev_id_from(vm);
        if (!id) {
            report_error(id.error());
            return 1;
        }

        const auto& table_path = vm["table"].as<std::string>();
        std::optional<std::string> text{};
        if (table_path == "-"sv) {
            text = std::string{std::istreambuf_iterator<char>{std::cin}, std::istreambuf_iterator<char>{}};
        } else {
            text = dmctl::file_utils::read_whole_file(table_path);
        }
        if (!text) {
            fmt::print(stderr, "dmctl: unable to read table '{}'\n", table_path);
            return 1;
        }

        const auto targets = dmctl::table::parse_table(*text);
        if (!targets) {
            fmt::print(stderr, "dmctl: {}: {}\n", table_path, targets.error());
            return 1;
        }
        if (auto info = dm.table_load(*id, *targets); !info) {
            report_error(info.error());
            return 1;
        }
        return 0;
    }
};

class ClearArgsProc final : public ArgsProc {
 public:
    ClearArgsProc()
      : ArgsProc("clear <dev>: Drop the inactive table.") {
        add_device();
    }

    auto execute(const po::variables_map& vm, const dmctl::DeviceMapper& dm, std::FILE*) -> int override {
        const auto id = dev_id_from(vm);
        if (!id) {
            report_error(id.error());
            return 1;
        }
        if (auto info = dm.table_clear(*id); !info) {
            report_error(info.error());
            return 1;
        }
        return 0;
    }
};

class DepsArgsProc final : public ArgsProc {
 public:
    DepsArgsProc()
      : ArgsProc("deps <dev>: List the devices a table maps onto.") {
        add_device();
        m_desc.add_options()("inactive", "Use the inactive table.");
    }

    auto execute(const po::variables_map& vm, const dmctl::DeviceMapper& dm, std::FILE* out) -> int override {
        const auto id = dev_id_from(vm);
        if (!id) {
            report_error(id.error());
            return 1;
        }
        const auto flags = (vm.count("inactive") != 0) ? dmctl::flags::QUERY_INACTIVE_TABLE : dmctl::DmFlags{};
        const auto deps  = dm.table_deps(*id, flags);
        if (!deps) {
            report_error(deps.error());
            return 1;
        }
        fmt::print(out, "{} dependencies\t: {}\n", deps->size(), fmt::join(*deps, " "));
        return 0;
    }
};

class StatusArgsProc final : public ArgsProc {
 public:
    StatusArgsProc()
      : ArgsProc("status <dev>: Show the status of each target.") {
        add_device();
        m_desc.add_options()
            ("inactive", "Use the inactive table.")
            ("noflush", "Do not flush to gather the status.");
    }

    auto execute(const po::variables_map& vm, const dmctl::DeviceMapper& dm, std::FILE* out) -> int override {
        const auto id = dev_id_from(vm);
        if (!id) {
            report_error(id.error());
            return 1;
        }
        dmctl::DmFlags flags{};
        if (vm.count("inactive") != 0) {
            flags |= dmctl::flags::QUERY_INACTIVE_TABLE;
        }
        if (vm.count("noflush") != 0) {
            flags |= dmctl::flags::NOFLUSH;
        }
        const auto status = dm.table_status(*id, flags);
        if (!status) {
            report_error(status.error());
            return 1;
        }
        print_targets(out, status->targets);
        return 0;
    }
};

class TableArgsProc final : public ArgsProc {
 public:
    TableArgsProc()
      : ArgsProc("table <dev>: Show the table.") {
        add_device();
        m_desc.add_options()("inactive", "Show the inactive table.");
    }

    auto execute(const po::variables_map& vm, const dmctl::DeviceMapper& dm, std::FILE* out) -> int override {
        const auto id = dev_id_from(vm);
        if (!id) {
            report_error(id.error());
            return 1;
        }
        auto flags = dmctl::flags::STATUS_TABLE;
        if (vm.count("inactive") != 0) {
            flags |= dmctl::flags::QUERY_INACTIVE_TABLE;
        }
        const auto status = dm.table_status(*id, flags);
        if (!status) {
            report_error(status.error());
            return 1;
        }
        print_targets(out, status->targets);
        return 0;
    }
};

class MessageArgsProc final : public ArgsProc {
 public:
    MessageArgsProc()
      : ArgsProc("message <dev> <sector|-> <message...>: Send a message to a target.") {
        add_device();
        add_positional("sector");
        add_positional("message", -1);
    }

    auto execute(const po::variables_map& vm, const dmctl::DeviceMapper& dm, std::FILE* out) -> int override {
        const auto id = dev_id_from(vm);
        if (!id) {
            report_error(id.error());
            return 1;
        }

        std::optional<dmctl::Sectors> sector{};
        if (const auto& sector_str = vm["sector"].as<std::string>(); sector_str != "-"sv) {
            std::uint64_t value{};
            const auto* end = sector_str.data() + sector_str.size();
            auto [ptr, ec]  = std::from_chars(sector_str.data(), end, value);
            if (ec != std::errc{} || ptr != end) {
                fmt::print(stderr, "dmctl: invalid sector '{}'\n", sector_str);
                return 1;
            }
            sector = dmctl::Sectors{value};
        }

        const auto message = fmt::format("{}", fmt::join(vm["message"].as<std::vector<std::string>>(), " "));
        const auto reply   = dm.target_msg(*id, sector, message);
        if (!reply) {
            report_error(reply.error());
            return 1;
        }
        if (reply->output) {
            fmt::print(out, "{}\n", *reply->output);
        }
        return 0;
    }
};

auto make_commands() -> std::map<std::string_view, std::unique_ptr<ArgsProc>> {
    std::map<std::string_view, std::unique_ptr<ArgsProc>> commands{};
    commands.emplace("version"sv, std::make_unique<VersionArgsProc>());
    commands.emplace("targets"sv, std::make_unique<TargetsArgsProc>());
    commands.emplace("ls"sv, std::make_unique<LsArgsProc>());
    commands.emplace("create"sv, std::make_unique<CreateArgsProc>());
    commands.emplace("remove"sv, std::make_unique<RemoveArgsProc>());
    commands.emplace("remove-all"sv, std::make_unique<RemoveAllArgsProc>());
    commands.emplace("rename"sv, std::make_unique<RenameArgsProc>());
    commands.emplace("suspend"sv, std::make_unique<SuspendArgsProc>());
    commands.emplace("resume"sv, std::make_unique<ResumeArgsProc>());
    commands.emplace("info"sv, std::make_unique<InfoArgsProc>());
    commands.emplace("wait"sv, std::make_unique<WaitArgsProc>());
    commands.emplace("load"sv, std::make_unique<LoadArgsProc>());
    commands.emplace("clear"sv, std::make_unique<ClearArgsProc>());
    commands.emplace("deps"sv, std::make_unique<DepsArgsProc>());
    commands.emplace("status"sv, std::make_unique<StatusArgsProc>());
    commands.emplace("table"sv, std::make_unique<TableArgsProc>());
    commands.emplace("message"sv, std::make_unique<MessageArgsProc>());
    return commands;
}

}  // namespace

namespace cli {

auto command_names() noexcept -> std::vector<std::string_view> {
    std::vector<std::string_view> names{};
    for (const auto& [name, proc] : make_commands()) {
        names.emplace_back(name);
    }
    return names;
}

void print_usage(std::FILE* out) noexcept {
    fmt::print(out, "Usage: dmctl [--config FILE] [--control PATH] [--verbose] <command> [arguments]\n\n");
    fmt::print(out, "Available commands with arguments:\n");
    for (const auto& [name, proc] : make_commands()) {
        fmt::print(out, "{}:\n", name);
        proc->print_usage(out);
    }
}

auto run_command(std::string_view name, const std::vector<std::string>& args, const mapper_factory& open_mapper, std::FILE* out) noexcept -> int {
    try {
        const auto commands = make_commands();

        const auto it = commands.find(name);
        if (it == commands.end()) {
            spdlog::error("[CLI] unknown command '{}'", name);
            fmt::print(stderr, "dmctl: unknown command '{}', see 'dmctl --help'\n", name);
            return 1;
        }

        try {
            return it->second->process(args, open_mapper, out);
        } catch (const po::error& e) {
            fmt::print(stderr, "dmctl {}: {}\n", name, e.what());
            it->second->print_usage(stderr);
            return 1;
        }
    } catch (const std::exception& e) {
        spdlog::error("[CLI] command '{}' failed: {}", name, e.what());
        fmt::print(stderr, "dmctl {}: {}\n", name, e.what());
        return 1;
    }
}

}  // namespace cli
