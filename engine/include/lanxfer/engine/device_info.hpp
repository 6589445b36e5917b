#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace lanxfer::engine
{

    struct DeviceInfo
    {
        std::string device_id;
        std::string device_name;
        std::uint16_t port{};
    };

    /// Hostname, or "Unknown Device" when it cannot be read.
    std::string local_device_name();

    /// First non-loopback, non-zero hardware address under /sys/class/net, or empty.
    std::string primary_mac_address();

    // Stable across restarts: derived from hostname and hardware address.
    std::string derive_device_id(const std::string &hostname, const std::string &mac_address);

    DeviceInfo detect_device_info(const std::optional<std::string> &name_override, std::uint16_t port);

} // namespace lanxfer::engine
