#include "lanxfer/error_codes.hpp"

#include <array>
#include <utility>

namespace lanxfer
{

    namespace
    {
        struct ErrorCodeDescription
        {
            ErrorCode code;
            std::string_view description;
        };

        constexpr std::array<ErrorCodeDescription, 13> kDescriptions{{
            {ErrorCode::Ok, "ok"},
            {ErrorCode::InvalidPacket, "invalid_packet"},
            {ErrorCode::UnknownPacket, "unknown_packet"},
            {ErrorCode::PacketTooLarge, "packet_too_large"},
            {ErrorCode::PathRejected, "path_rejected"},
            {ErrorCode::NotFound, "not_found"},
            {ErrorCode::IoError, "io_error"},
            {ErrorCode::ConnectionFailed, "connection_failed"},
            {ErrorCode::ConnectionClosed, "connection_closed"},
            {ErrorCode::PeerError, "peer_error"},
            {ErrorCode::Cancelled, "cancelled"},
            {ErrorCode::NotRunning, "not_running"},
            {ErrorCode::InternalError, "internal_error"},
        }};
    } // namespace

    std::string_view to_string(ErrorCode code) noexcept
    {
        for (const auto &entry : kDescriptions)
        {
            if (entry.code == code)
            {
                return entry.description;
            }
        }
        return "unknown";
    }

    ErrorCode error_code_from_int(std::uint16_t value) noexcept
    {
        for (const auto &entry : kDescriptions)
        {
            if (to_int(entry.code) == value)
            {
                return entry.code;
            }
        }
        return ErrorCode::InternalError;
    }

    TransferError::TransferError(ErrorCode code, std::string message)
        : std::runtime_error(std::move(message)), code_(code) {}

} // namespace lanxfer
