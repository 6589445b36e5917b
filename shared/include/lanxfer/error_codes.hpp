/**
 * lanxfer - Error codes shared by the codec, the session engine and the CLI.
 */
#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace lanxfer
{

    enum class ErrorCode : std::uint16_t
    {
        Ok = 0,
        InvalidPacket = 1,
        UnknownPacket = 2,
        PacketTooLarge = 3,
        PathRejected = 4,
        NotFound = 5,
        IoError = 6,
        ConnectionFailed = 7,
        ConnectionClosed = 8,
        PeerError = 9,
        Cancelled = 10,
        NotRunning = 11,
        InternalError = 12
    };

    std::string_view to_string(ErrorCode code) noexcept;

    constexpr std::uint16_t to_int(ErrorCode code) noexcept
    {
        return static_cast<std::uint16_t>(code);
    }

    ErrorCode error_code_from_int(std::uint16_t value) noexcept;

    class TransferError : public std::runtime_error
    {
    public:
        TransferError(ErrorCode code, std::string message);

        ErrorCode code() const noexcept { return code_; }

    private:
        ErrorCode code_;
    };

} // namespace lanxfer
