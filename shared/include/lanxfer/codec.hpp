/**
 * lanxfer - Length-prefixed JSON framing.
 *
 * A frame is a 4-byte big-endian payload length followed by the UTF-8 JSON
 * payload. FrameDecoder keeps the carry-over state for a single byte stream.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "lanxfer/protocol.hpp"

namespace lanxfer::protocol
{

    constexpr std::size_t kFrameHeaderSize = sizeof(std::uint32_t);

    struct DecodedFrame
    {
        std::string payload;
        std::size_t bytes_consumed{};
    };

    std::vector<std::uint8_t> encode_frame(const nlohmann::json &message);

    std::vector<std::uint8_t> encode_packet(const Packet &packet);

    // max_payload of 0 disables the size check.
    std::optional<DecodedFrame> try_decode_frame(std::span<const std::uint8_t> buffer, std::size_t max_payload = 0);

    Packet decode_packet(std::string_view payload);

    class FrameDecoder
    {
    public:
        explicit FrameDecoder(std::size_t max_payload = 0);

        // Appends data and returns every payload completed by it. Throws
        // TransferError(PacketTooLarge) when a header exceeds the cap.
        std::vector<std::string> feed(std::span<const std::uint8_t> data);

        std::size_t buffered() const noexcept { return buffer_.size(); }
        std::optional<std::uint32_t> expected_length() const noexcept { return expected_length_; }

    private:
        std::size_t max_payload_;
        std::vector<std::uint8_t> buffer_;
        std::optional<std::uint32_t> expected_length_;
    };

} // namespace lanxfer::protocol
