#include "dmctl/device.hpp"

#include <sys/sysmacros.h>  // for major, minor, makedev

namespace dmctl {

auto Device::from_dev_t(std::uint64_t value) noexcept -> Device {
    return Device{.major = major(value), .minor = minor(value)};
}

auto Device::to_dev_t() const noexcept -> std::uint64_t {
    return makedev(major, minor);
}

}  // namespace dmctl
