/**
 * lanxfer - Packet schema for the LAN transfer protocol.
 *
 * Every packet is an envelope {type, sessionId, data}. The payload structs below
 * describe the `data` member for each packet type.
 */
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace lanxfer::protocol
{

    enum class PacketType : std::uint8_t
    {
        Request,
        Handshake,
        FileInfo,
        FileData,
        FileEnd,
        Ack,
        Error,
        Cancel
    };

    std::string_view to_string(PacketType type) noexcept;
    std::optional<PacketType> packet_type_from_string(std::string_view value) noexcept;

    struct Packet
    {
        PacketType type{};
        std::string session_id;
        nlohmann::json data{nlohmann::json::object()};

        bool operator==(const Packet &) const = default;
    };

    // Throws TransferError: UnknownPacket for an unrecognised type, InvalidPacket
    // when the envelope itself is malformed.
    void to_json(nlohmann::json &json, const Packet &packet);
    void from_json(const nlohmann::json &json, Packet &packet);

    Packet make_packet(PacketType type, std::string session_id, nlohmann::json data = nlohmann::json::object());

    /// One node of the sender's manifest; also the body of `file-info`.
    struct FileEntry
    {
        std::string name;
        std::string relative_path;
        std::uint64_t size{};
        bool is_directory{};

        bool operator==(const FileEntry &) const = default;
    };

    void to_json(nlohmann::json &json, const FileEntry &entry);
    void from_json(const nlohmann::json &json, FileEntry &entry);

    struct RequestData
    {
        std::string pairing_code;
        std::string device_id;
        std::string device_name;
        std::string save_path;
    };

    void to_json(nlohmann::json &json, const RequestData &request);
    void from_json(const nlohmann::json &json, RequestData &request);

    struct HandshakeData
    {
        std::string sender_session_id;
        std::vector<FileEntry> files;
        std::uint64_t total_size{};
    };

    void to_json(nlohmann::json &json, const HandshakeData &handshake);
    void from_json(const nlohmann::json &json, HandshakeData &handshake);

    struct FileChunk
    {
        std::string chunk;
    };

    void to_json(nlohmann::json &json, const FileChunk &chunk);
    void from_json(const nlohmann::json &json, FileChunk &chunk);

    struct FileEnd
    {
        std::string name;
    };

    void to_json(nlohmann::json &json, const FileEnd &end);
    void from_json(const nlohmann::json &json, FileEnd &end);

    struct Ack
    {
        std::optional<bool> ready{};
        std::optional<bool> file_complete{};
    };

    void to_json(nlohmann::json &json, const Ack &ack);
    void from_json(const nlohmann::json &json, Ack &ack);

    struct ErrorMessage
    {
        std::string message;
    };

    void to_json(nlohmann::json &json, const ErrorMessage &error);
    void from_json(const nlohmann::json &json, ErrorMessage &error);

} // namespace lanxfer::protocol
