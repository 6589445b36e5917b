#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace lanxfer::engine
{

    constexpr std::uint16_t kDefaultTransferPort = 45679;

    /// What to do with a packet that cannot be handled.
    enum class PacketPolicy : std::uint8_t
    {
        Drop,
        ReplyError
    };

    std::string_view to_string(PacketPolicy policy) noexcept;
    std::optional<PacketPolicy> packet_policy_from_string(std::string_view value) noexcept;

    struct TransferConfig
    {
        std::string address{"0.0.0.0"};
        std::uint16_t port{kDefaultTransferPort};
        std::size_t port_fallback_attempts{1};
        std::size_t chunk_size{64 * 1024};
        std::size_t max_packet_size{16 * 1024 * 1024};
        std::chrono::milliseconds settle_delay{100};
        std::chrono::milliseconds entry_delay{50};
        std::chrono::milliseconds chunk_delay{1};
        PacketPolicy malformed_packet_policy{PacketPolicy::Drop};
        PacketPolicy unknown_packet_policy{PacketPolicy::Drop};
        std::optional<std::string> device_name;
    };

} // namespace lanxfer::engine
