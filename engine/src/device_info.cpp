#include "lanxfer/engine/device_info.hpp"

#include <unistd.h>

#include <algorithm>
#include <array>
#include <filesystem>
#include <fstream>
#include <system_error>
#include <vector>

#include <spdlog/spdlog.h>

#include "lanxfer/crypto.hpp"

namespace lanxfer::engine
{

    namespace
    {
        constexpr std::size_t kDeviceIdLength = 32;
        constexpr std::string_view kZeroMac = "00:00:00:00:00:00";
    } // namespace

    std::string local_device_name()
    {
        std::array<char, 256> buffer{};
        if (::gethostname(buffer.data(), buffer.size() - 1) != 0 || buffer[0] == '\0')
        {
            return "Unknown Device";
        }
        return std::string(buffer.data());
    }

    std::string primary_mac_address()
    {
        const std::filesystem::path net_root{"/sys/class/net"};
        std::error_code ec;
        std::vector<std::filesystem::path> interfaces;
        for (const auto &entry : std::filesystem::directory_iterator(net_root, ec))
        {
            if (entry.path().filename() != "lo")
            {
                interfaces.push_back(entry.path());
            }
        }
        if (ec)
        {
            spdlog::debug("Cannot enumerate network interfaces: {}", ec.message());
            return {};
        }
        std::sort(interfaces.begin(), interfaces.end());

        for (const auto &interface_path : interfaces)
        {
            std::ifstream input(interface_path / "address");
            std::string address;
            if (!std::getline(input, address) || address.empty() || address == kZeroMac)
            {
                continue;
            }
            return address;
        }
        return {};
    }

    std::string derive_device_id(const std::string &hostname, const std::string &mac_address)
    {
        const auto digest = crypto::sha256_hex(hostname + "-" + mac_address + "-file");
        return digest.substr(0, kDeviceIdLength);
    }

    DeviceInfo detect_device_info(const std::optional<std::string> &name_override, std::uint16_t port)
    {
        const auto hostname = local_device_name();
        DeviceInfo info{
            .device_id = derive_device_id(hostname, primary_mac_address()),
            .device_name = name_override.value_or(hostname),
            .port = port,
        };
        return info;
    }

} // namespace lanxfer::engine
