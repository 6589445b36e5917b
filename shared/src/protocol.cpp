#include "lanxfer/protocol.hpp"

#include <array>
#include <utility>

#include "lanxfer/error_codes.hpp"

namespace lanxfer::protocol
{

    namespace
    {

        struct PacketTypeMapping
        {
            PacketType type;
            std::string_view label;
        };

        constexpr std::array<PacketTypeMapping, 8> kPacketTypeMappings{{
            {PacketType::Request, "request"},
            {PacketType::Handshake, "handshake"},
            {PacketType::FileInfo, "file-info"},
            {PacketType::FileData, "file-data"},
            {PacketType::FileEnd, "file-end"},
            {PacketType::Ack, "ack"},
            {PacketType::Error, "error"},
            {PacketType::Cancel, "cancel"},
        }};

    } // namespace

    std::string_view to_string(PacketType type) noexcept
    {
        for (const auto &mapping : kPacketTypeMappings)
        {
            if (mapping.type == type)
            {
                return mapping.label;
            }
        }
        return "unknown";
    }

    std::optional<PacketType> packet_type_from_string(std::string_view value) noexcept
    {
        for (const auto &mapping : kPacketTypeMappings)
        {
            if (mapping.label == value)
            {
                return mapping.type;
            }
        }
        return std::nullopt;
    }

    void to_json(nlohmann::json &json, const Packet &packet)
    {
        json = {
            {"type", to_string(packet.type)},
            {"sessionId", packet.session_id},
            {"data", packet.data},
        };
    }

    void from_json(const nlohmann::json &json, Packet &packet)
    {
        if (!json.is_object())
        {
            throw TransferError(ErrorCode::InvalidPacket, "Packet is not a JSON object");
        }
        const auto type_it = json.find("type");
        if (type_it == json.end() || !type_it->is_string())
        {
            throw TransferError(ErrorCode::InvalidPacket, "Packet has no type");
        }
        const auto label = type_it->get<std::string>();
        const auto type = packet_type_from_string(label);
        if (!type)
        {
            throw TransferError(ErrorCode::UnknownPacket, "Unknown packet type: " + label);
        }
        const auto id_it = json.find("sessionId");
        if (id_it == json.end() || !id_it->is_string())
        {
            throw TransferError(ErrorCode::InvalidPacket, "Packet has no sessionId");
        }
        packet.type = *type;
        packet.session_id = id_it->get<std::string>();
        const auto data_it = json.find("data");
        if (data_it == json.end() || data_it->is_null())
        {
            packet.data = nlohmann::json::object();
        }
        else if (data_it->is_object())
        {
            packet.data = *data_it;
        }
        else
        {
            throw TransferError(ErrorCode::InvalidPacket, "Packet data must be an object");
        }
    }

    Packet make_packet(PacketType type, std::string session_id, nlohmann::json data)
    {
        Packet packet;
        packet.type = type;
        packet.session_id = std::move(session_id);
        packet.data = std::move(data);
        return packet;
    }

    void to_json(nlohmann::json &json, const FileEntry &entry)
    {
        json = {
            {"name", entry.name},
            {"relativePath", entry.relative_path},
            {"size", entry.size},
            {"isDirectory", entry.is_directory},
        };
    }

    void from_json(const nlohmann::json &json, FileEntry &entry)
    {
        entry.name = json.value("name", std::string{});
        entry.relative_path = json.at("relativePath").get<std::string>();
        entry.size = json.value("size", 0ULL);
        entry.is_directory = json.value("isDirectory", false);
    }

    void to_json(nlohmann::json &json, const RequestData &request)
    {
        json = {
            {"pairingCode", request.pairing_code},
            {"deviceId", request.device_id},
            {"deviceName", request.device_name},
            {"savePath", request.save_path},
        };
    }

    void from_json(const nlohmann::json &json, RequestData &request)
    {
        request.pairing_code = json.at("pairingCode").get<std::string>();
        request.device_id = json.value("deviceId", std::string{});
        request.device_name = json.value("deviceName", std::string{});
        request.save_path = json.value("savePath", std::string{});
    }

    void to_json(nlohmann::json &json, const HandshakeData &handshake)
    {
        json = {
            {"senderSessionId", handshake.sender_session_id},
            {"files", handshake.files},
            {"totalSize", handshake.total_size},
        };
    }

    void from_json(const nlohmann::json &json, HandshakeData &handshake)
    {
        handshake.sender_session_id = json.at("senderSessionId").get<std::string>();
        handshake.files = json.at("files").get<std::vector<FileEntry>>();
        handshake.total_size = json.at("totalSize").get<std::uint64_t>();
    }

    void to_json(nlohmann::json &json, const FileChunk &chunk)
    {
        json = {{"chunk", chunk.chunk}};
    }

    void from_json(const nlohmann::json &json, FileChunk &chunk)
    {
        chunk.chunk = json.at("chunk").get<std::string>();
    }

    void to_json(nlohmann::json &json, const FileEnd &end)
    {
        json = {{"name", end.name}};
    }

    void from_json(const nlohmann::json &json, FileEnd &end)
    {
        end.name = json.value("name", std::string{});
    }

    void to_json(nlohmann::json &json, const Ack &ack)
    {
        json = nlohmann::json::object();
        if (ack.ready)
        {
            json["ready"] = *ack.ready;
        }
        if (ack.file_complete)
        {
            json["fileComplete"] = *ack.file_complete;
        }
    }

    void from_json(const nlohmann::json &json, Ack &ack)
    {
        if (auto it = json.find("ready"); it != json.end() && it->is_boolean())
        {
            ack.ready = it->get<bool>();
        }
        else
        {
            ack.ready.reset();
        }
        if (auto it = json.find("fileComplete"); it != json.end() && it->is_boolean())
        {
            ack.file_complete = it->get<bool>();
        }
        else
        {
            ack.file_complete.reset();
        }
    }

    void to_json(nlohmann::json &json, const ErrorMessage &error)
    {
        json = {{"message", error.message}};
    }

    void from_json(const nlohmann::json &json, ErrorMessage &error)
    {
        error.message = json.value("message", std::string{"Unknown error"});
    }

} // namespace lanxfer::protocol
