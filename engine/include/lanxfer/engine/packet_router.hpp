#pragma once

#include <memory>

#include "lanxfer/engine/config.hpp"
#include "lanxfer/engine/connection.hpp"
#include "lanxfer/engine/lifecycle.hpp"
#include "lanxfer/engine/receiver_pipeline.hpp"
#include "lanxfer/engine/sender_pipeline.hpp"
#include "lanxfer/engine/session_registry.hpp"

namespace lanxfer::engine
{

    // Routes each decoded packet to the session bound to its connection. Packets
    // for terminal sessions, or carrying a session id other than the one bound to
    // the socket, are ignored.
    class PacketRouter : public ConnectionHandler
    {
    public:
        PacketRouter(const TransferConfig &config, SessionRegistry &registry, SessionLifecycle &lifecycle,
                     SenderPipeline &sender, ReceiverPipeline &receiver)
            : config_(config), registry_(registry), lifecycle_(lifecycle), sender_(sender), receiver_(receiver) {}

        void on_packet(const std::shared_ptr<Connection> &connection, protocol::Packet packet) override;
        void on_invalid_packet(const std::shared_ptr<Connection> &connection, const TransferError &error) override;
        void on_closed(const std::shared_ptr<Connection> &connection, const std::error_code &ec) override;

    private:
        void dispatch(const std::shared_ptr<Connection> &connection, Session &session, const protocol::Packet &packet);
        void handle_peer_error(const std::shared_ptr<Connection> &connection, Session &session,
                               const protocol::Packet &packet);
        void handle_peer_cancel(const std::shared_ptr<Connection> &connection, Session &session);

        void apply_policy(PacketPolicy policy, const std::shared_ptr<Connection> &connection, const std::string &reason);
        void fail_session(const std::shared_ptr<Connection> &connection, Session &session, ErrorCode code,
                          const std::string &message);

        const TransferConfig &config_;
        SessionRegistry &registry_;
        SessionLifecycle &lifecycle_;
        SenderPipeline &sender_;
        ReceiverPipeline &receiver_;
    };

} // namespace lanxfer::engine
