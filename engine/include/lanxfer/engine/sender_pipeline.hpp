#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "lanxfer/engine/connection.hpp"
#include "lanxfer/engine/services.hpp"
#include "lanxfer/protocol.hpp"

namespace lanxfer::engine
{

    struct PreparedTransfer
    {
        std::string session_id;
        std::vector<protocol::FileEntry> files;
        std::uint64_t total_size{};
    };

    /// Sender half: registers waiting sessions and streams them once a receiver binds.
    class SenderPipeline
    {
    public:
        explicit SenderPipeline(EngineServices services) : services_(services) {}

        PreparedTransfer prepare(const std::vector<std::filesystem::path> &paths, const std::string &pairing_code);

        void handle_request(const std::shared_ptr<Connection> &connection, const protocol::Packet &packet);
        void handle_ack(Session &session, const protocol::Packet &packet);

    private:
        EngineServices services_;
    };

} // namespace lanxfer::engine
