#include "doctest_compatibility.h"

#include "fake_kernel.hpp"

#include "dmctl/control.hpp"
#include "dmctl/logger.hpp"

#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <utility>

#include <fmt/format.h>

#include <spdlog/sinks/callback_sink.h>
#include <spdlog/spdlog.h>

using namespace std::string_view_literals;

using dmctl::Command;
using dmctl::testing::FakeKernel;

TEST_CASE("control channel test")
{
    auto callback_sink = std::make_shared<spdlog::sinks::callback_sink_mt>([](const spdlog::details::log_msg&) {
        // noop
    });
    auto logger        = std::make_shared<spdlog::logger>("default", callback_sink);
    spdlog::set_default_logger(logger);
    dmctl::logger::set_logger(logger);

    SECTION("request codes")
    {
        REQUIRE_EQ(dmctl::request_code(Command::Version), static_cast<unsigned long>(DM_VERSION));
        REQUIRE_EQ(dmctl::request_code(Command::TableLoad), static_cast<unsigned long>(DM_TABLE_LOAD));
        REQUIRE_EQ(dmctl::request_code(Command::DevArmPoll), static_cast<unsigned long>(DM_DEV_ARM_POLL));
        REQUIRE_EQ(dmctl::command_to_string(Command::DevSuspend), "DM_DEV_SUSPEND"sv);
    }
    SECTION("fresh header")
    {
        const auto hdr = dmctl::initialize_header(dmctl::flags::READONLY);
        REQUIRE_EQ(hdr.version[0], 4);
        REQUIRE_EQ(hdr.version[1], dmctl::layout::VERSION_MINOR);
        REQUIRE_EQ(hdr.data_start, 312);
        REQUIRE_EQ(hdr.flags, dmctl::flags::READONLY.bits());
        REQUIRE(dmctl::layout::field_to_string_view(hdr.name).empty());
    }
    SECTION("missing control node")
    {
        const auto channel = dmctl::ControlChannel::open("/nonexistent/dmctl/control"sv);
        REQUIRE_FALSE(channel.has_value());
        REQUIRE_EQ(channel.error().kind, dmctl::ErrorKind::ContextInit);
        REQUIRE_EQ(channel.error().os_error, ENOENT);
    }
    SECTION("reply without data")
    {
        FakeKernel kernel{};
        const auto channel = kernel.channel();

        auto hdr         = dmctl::initialize_header();
        const auto reply = channel.execute(Command::Version, hdr);
        REQUIRE(reply.has_value());
        REQUIRE(reply->empty());
        REQUIRE_EQ(hdr.version[1], 48);
        REQUIRE_EQ(hdr.data_size, FakeKernel::NO_DATA_SIZE);

        REQUIRE_EQ(kernel.calls.size(), 1);
        REQUIRE_EQ(kernel.calls[0].buffer_size, dmctl::ControlChannel::MIN_BUF_SIZE);
    }
    SECTION("small buffers are clamped to the header")
    {
        FakeKernel kernel{};
        const auto channel = kernel.channel(16);
        REQUIRE_EQ(channel.min_buffer_size(), dmctl::layout::header::SIZE);
        REQUIRE_EQ(channel.fd(), -1);
    }
    SECTION("buffer grows until the reply fits")
    {
        FakeKernel kernel{};
        for (int i = 0; i < 40; ++i) {
            const auto name = fmt::format("device-with-a-long-name-{:04}", i);
            kernel.devices[name] = dmctl::testing::FakeDevice{.name = name, .minor = static_cast<std::uint32_t>(i)};
        }
        const auto channel = kernel.channel(1024);

        auto hdr         = dmctl::initialize_header();
        const auto reply = channel.execute(Command::ListDevices, hdr);
        REQUIRE(reply.has_value());
        REQUIRE_FALSE(reply->empty());
        REQUIRE_FALSE(dmctl::DmFlags{hdr.flags}.contains(dmctl::flags::BUFFER_FULL));

        REQUIRE_EQ(kernel.calls.size(), 3);
        REQUIRE_EQ(kernel.calls[0].buffer_size, 1024);
        REQUIRE_EQ(kernel.calls[1].buffer_size, 2048);
        REQUIRE_EQ(kernel.calls[2].buffer_size, 4096);
        // every attempt carries the same request
        REQUIRE_EQ(kernel.calls[2].header.data_size, 4096);
        REQUIRE_EQ(kernel.calls[2].header.flags, 0);
    }
    SECTION("payload follows the header")
    {
        FakeKernel kernel{};
        kernel.devices["a"] = dmctl::testing::FakeDevice{.name = "a"};
        const auto channel  = kernel.channel();

        auto hdr = dmctl::initialize_header();
        dmctl::layout::copy_to_field("a"sv, hdr.name);
        const std::string new_name{"b"};
        const auto payload = std::as_bytes(std::span{new_name.c_str(), new_name.size() + 1});
        REQUIRE(channel.execute(Command::DevRename, hdr, payload).has_value());

        REQUIRE_EQ(kernel.calls[0].payload[0], std::byte{'b'});
        REQUIRE(kernel.devices.contains("b"));
    }
    SECTION("errno is reported with the request")
    {
        FakeKernel kernel{};
        kernel.fail_next   = EPERM;
        const auto channel = kernel.channel();

        auto hdr = dmctl::initialize_header(dmctl::flags::NOFLUSH);
        dmctl::layout::copy_to_field("locked"sv, hdr.name);
        const auto reply = channel.execute(Command::DevSuspend, hdr);
        REQUIRE_FALSE(reply.has_value());
        REQUIRE_EQ(reply.error().kind, dmctl::ErrorKind::Ioctl);
        REQUIRE_EQ(reply.error().os_error, EPERM);
        REQUIRE_EQ(reply.error().message, "DM_DEV_SUSPEND failed");
        REQUIRE(reply.error().info.has_value());
        REQUIRE_EQ(reply.error().info->name(), "locked"sv);
        REQUIRE_EQ(reply.error().info->flags(), dmctl::flags::NOFLUSH);
        REQUIRE_EQ(fmt::format("{}", reply.error()), fmt::format("ioctl: DM_DEV_SUSPEND failed ({})", std::strerror(EPERM)));
    }
    SECTION("move leaves the source empty")
    {
        FakeKernel kernel{};
        auto first  = kernel.channel();
        auto second = std::move(first);
        auto hdr    = dmctl::initialize_header();
        REQUIRE(second.execute(Command::Version, hdr).has_value());
        REQUIRE_EQ(first.fd(), -1);
    }
}

TEST_CASE("logger level test")
{
    auto callback_sink = std::make_shared<spdlog::sinks::callback_sink_mt>([](const spdlog::details::log_msg&) {
        // noop
    });
    dmctl::logger::set_logger(std::make_shared<spdlog::logger>("default", callback_sink));

    REQUIRE(dmctl::logger::set_level("debug"sv));
    REQUIRE_EQ(spdlog::get_level(), spdlog::level::debug);
    REQUIRE(dmctl::logger::set_level("error"sv));
    REQUIRE_EQ(spdlog::get_level(), spdlog::level::err);
    REQUIRE_FALSE(dmctl::logger::set_level("loud"sv));
    REQUIRE_EQ(spdlog::get_level(), spdlog::level::err);
    REQUIRE(dmctl::logger::set_level("warn"sv));
}
