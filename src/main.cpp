#include "cli_config.hpp"  // for CliConfig, parse_cli_config
#include "commands.hpp"    // for run_command, print_usage

// import dmctl
#include "dmctl/device_mapper.hpp"
#include "dmctl/file_utils.hpp"
#include "dmctl/logger.hpp"

#include <chrono>    // for seconds
#include <cstdio>    // for stderr, stdout
#include <memory>    // for shared_ptr
#include <optional>  // for optional
#include <string>    // for string
#include <utility>   // for move
#include <vector>    // for vector

#include <boost/program_options.hpp>

#include <fmt/format.h>

#include <spdlog/async.h>                     // for create_async
#include <spdlog/common.h>                    // for debug
#include <spdlog/sinks/basic_file_sink.h>     // for basic_file_sink_mt
#include <spdlog/sinks/stdout_color_sinks.h>  // for stderr_color_mt
#include <spdlog/spdlog.h>                    // for set_default_logger, set_level

namespace po = boost::program_options;

namespace {

struct GlobalArgs {
    std::optional<std::string> config_path{};
    std::optional<std::string> control_path{};
    bool verbose{false};
    bool help{false};
    std::string command{};
    std::vector<std::string> command_args{};
};

auto parse_global_args(int argc, char** argv) -> GlobalArgs {
    po::options_description global("Global options");
    /* clang-format off */
    global.add_options()
        ("help,h", "Print this usage.")
        ("config,c", po::value<std::string>(), "JSON configuration file.")
        ("control", po::value<std::string>(), "Device-mapper control node.")
        ("verbose,v", "Log every ioctl.")
        ("command", po::value<std::string>(), "Command to execute.")
        ("args", po::value<std::vector<std::string>>(), "Arguments for command.");
    /* clang-format on */

    po::positional_options_description positional;
    positional.add("command", 1).add("args", -1);

    // Everything after the command belongs to the command.
    const auto parsed = po::command_line_parser(argc, argv).options(global).positional(positional).allow_unregistered().run();

    po::variables_map vm;
    po::store(parsed, vm);
    po::notify(vm);

    GlobalArgs args{};
    args.help    = vm.count("help") != 0;
    args.verbose = vm.count("verbose") != 0;
    if (vm.count("config") != 0) {
        args.config_path = vm["config"].as<std::string>();
    }
    if (vm.count("control") != 0) {
        args.control_path = vm["control"].as<std::string>();
    }
    if (vm.count("command") != 0) {
        args.command      = vm["command"].as<std::string>();
        args.command_args = po::collect_unrecognized(parsed.options, po::include_positional);
        // drop the command name itself
        args.command_args.erase(args.command_args.begin());
    }
    return args;
}

auto load_config(const GlobalArgs& args) -> std::optional<cli::CliConfig> {
    if (!args.config_path) {
        return cli::get_default_config();
    }
    const auto content = dmctl::file_utils::read_whole_file(*args.config_path);
    if (!content) {
        fmt::print(stderr, "dmctl: unable to read config '{}'\n", *args.config_path);
        return std::nullopt;
    }
    auto config = cli::parse_cli_config(*content);
    if (!config) {
        fmt::print(stderr, "dmctl: {}: {}\n", *args.config_path, config.error());
        return std::nullopt;
    }
    return std::move(*config);
}

}  // namespace

int main(int argc, char** argv) {
    GlobalArgs args{};
    try {
        args = parse_global_args(argc, argv);
    } catch (const po::error& e) {
        fmt::print(stderr, "dmctl: {}\n", e.what());
        return 1;
    }
    if (args.command.empty()) {
        cli::print_usage(stdout);
        return args.help ? 0 : 1;
    }
    if (args.help) {
        // "dmctl <command> --help" asks for the command's usage
        args.command_args.emplace_back("--help");
    }

    auto config = load_config(args);
    if (!config) {
        return 1;
    }
    if (args.control_path) {
        config->control_path = *args.control_path;
    }

    // Initialize logger.
    std::shared_ptr<spdlog::logger> logger{};
    if (config->log_file) {
        logger = spdlog::create_async<spdlog::sinks::basic_file_sink_mt>("dmctl_logger", *config->log_file);
    } else {
        logger = spdlog::stderr_color_mt("dmctl_logger");
    }
    spdlog::set_default_logger(logger);
    spdlog::set_pattern("[%r][%^---%L---%$] %v");
    spdlog::flush_every(std::chrono::seconds(5));

    // Set dmctl logger.
    dmctl::logger::set_logger(logger);
    if (!dmctl::logger::set_level(args.verbose ? "debug" : config->log_level)) {
        fmt::print(stderr, "dmctl: unknown log level '{}'\n", config->log_level);
        spdlog::shutdown();
        return 1;
    }

    const auto open_mapper = [&config]() {
        return dmctl::DeviceMapper::open(config->control_path, config->min_buffer_size);
    };
    const int ret = cli::run_command(args.command, args.command_args, open_mapper);

    spdlog::shutdown();
    return ret;
}
