#include "lanxfer/codec.hpp"

#include <algorithm>
#include <limits>
#include <string>

#include "lanxfer/error_codes.hpp"

namespace lanxfer::protocol
{

    namespace
    {
        std::uint32_t read_u32_be(std::span<const std::uint8_t> buffer)
        {
            return (static_cast<std::uint32_t>(buffer[0]) << 24) |
                   (static_cast<std::uint32_t>(buffer[1]) << 16) |
                   (static_cast<std::uint32_t>(buffer[2]) << 8) |
                   static_cast<std::uint32_t>(buffer[3]);
        }

        void write_u32_be(std::uint32_t value, std::span<std::uint8_t> buffer)
        {
            buffer[0] = static_cast<std::uint8_t>((value >> 24) & 0xFF);
            buffer[1] = static_cast<std::uint8_t>((value >> 16) & 0xFF);
            buffer[2] = static_cast<std::uint8_t>((value >> 8) & 0xFF);
            buffer[3] = static_cast<std::uint8_t>(value & 0xFF);
        }

        void check_payload_size(std::uint32_t size, std::size_t max_payload)
        {
            if (max_payload != 0 && size > max_payload)
            {
                throw TransferError(ErrorCode::PacketTooLarge,
                                    "Frame of " + std::to_string(size) + " bytes exceeds limit of " +
                                        std::to_string(max_payload));
            }
        }
    } // namespace

    std::vector<std::uint8_t> encode_frame(const nlohmann::json &message)
    {
        const auto text = message.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
        if (text.size() > std::numeric_limits<std::uint32_t>::max())
        {
            throw TransferError(ErrorCode::PacketTooLarge, "JSON message too large to frame");
        }
        std::vector<std::uint8_t> frame(kFrameHeaderSize + text.size());
        write_u32_be(static_cast<std::uint32_t>(text.size()), std::span<std::uint8_t>(frame).first<kFrameHeaderSize>());
        std::copy(text.begin(), text.end(), frame.begin() + static_cast<std::ptrdiff_t>(kFrameHeaderSize));
        return frame;
    }

    std::vector<std::uint8_t> encode_packet(const Packet &packet)
    {
        return encode_frame(nlohmann::json(packet));
    }

    std::optional<DecodedFrame> try_decode_frame(std::span<const std::uint8_t> buffer, std::size_t max_payload)
    {
        if (buffer.size() < kFrameHeaderSize)
        {
            return std::nullopt;
        }
        const auto payload_size = read_u32_be(buffer.first<kFrameHeaderSize>());
        check_payload_size(payload_size, max_payload);
        if (buffer.size() < kFrameHeaderSize + payload_size)
        {
            return std::nullopt;
        }
        const auto payload_begin = buffer.begin() + static_cast<std::ptrdiff_t>(kFrameHeaderSize);
        DecodedFrame result{
            .payload = std::string(payload_begin, payload_begin + payload_size),
            .bytes_consumed = kFrameHeaderSize + payload_size,
        };
        return result;
    }

    Packet decode_packet(std::string_view payload)
    {
        nlohmann::json json;
        try
        {
            json = nlohmann::json::parse(payload);
        }
        catch (const nlohmann::json::parse_error &ex)
        {
            throw TransferError(ErrorCode::InvalidPacket, ex.what());
        }
        return json.get<Packet>();
    }

    FrameDecoder::FrameDecoder(std::size_t max_payload) : max_payload_(max_payload) {}

    std::vector<std::string> FrameDecoder::feed(std::span<const std::uint8_t> data)
    {
        buffer_.insert(buffer_.end(), data.begin(), data.end());

        std::vector<std::string> payloads;
        std::size_t offset = 0;
        while (true)
        {
            const auto available = buffer_.size() - offset;
            if (!expected_length_)
            {
                if (available < kFrameHeaderSize)
                {
                    break;
                }
                const auto length = read_u32_be(std::span<const std::uint8_t>(buffer_).subspan(offset, kFrameHeaderSize));
                check_payload_size(length, max_payload_);
                expected_length_ = length;
            }
            if (available < kFrameHeaderSize + *expected_length_)
            {
                break;
            }
            const auto payload_begin = buffer_.begin() + static_cast<std::ptrdiff_t>(offset + kFrameHeaderSize);
            payloads.emplace_back(payload_begin, payload_begin + *expected_length_);
            offset += kFrameHeaderSize + *expected_length_;
            expected_length_.reset();
        }

        // Partial header or payload stays buffered for the next read.
        buffer_.erase(buffer_.begin(), buffer_.begin() + static_cast<std::ptrdiff_t>(offset));
        return payloads;
    }

} // namespace lanxfer::protocol
