#pragma once

#include <cstdint>
#include <filesystem>
#include <future>
#include <string>

#include "lanxfer/engine/services.hpp"
#include "lanxfer/protocol.hpp"

namespace lanxfer::engine
{

    /// Receiver half: dials a sender and rebuilds its manifest under the save path.
    class ReceiverPipeline
    {
    public:
        explicit ReceiverPipeline(EngineServices services) : services_(services) {}

        // Registers a transferring receive session immediately and connects in the
        // background. The future yields the local session id once the sender's
        // handshake arrives, or a TransferError.
        std::future<std::string> request(const std::string &address, std::uint16_t port,
                                         const std::string &pairing_code, const std::filesystem::path &save_path);

        void handle_handshake(Session &session, const protocol::Packet &packet);
        void handle_file_info(Session &session, const protocol::Packet &packet);
        void handle_file_data(Session &session, const protocol::Packet &packet);
        void handle_file_end(Session &session, const protocol::Packet &packet);

    private:
        void acknowledge(Session &session, protocol::Ack ack);
        void complete_if_finished(Session &session);

        EngineServices services_;
    };

} // namespace lanxfer::engine
