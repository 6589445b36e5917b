#include "lanxfer/engine/packet_router.hpp"

#include <nlohmann/json.hpp>

#include <spdlog/spdlog.h>

namespace lanxfer::engine
{

    void PacketRouter::on_packet(const std::shared_ptr<Connection> &connection, protocol::Packet packet)
    {
        if (packet.type == protocol::PacketType::Request)
        {
            try
            {
                sender_.handle_request(connection, packet);
            }
            catch (const nlohmann::json::exception &ex)
            {
                apply_policy(config_.malformed_packet_policy, connection,
                             std::string("Malformed request: ") + ex.what());
            }
            return;
        }

        auto session = registry_.find(connection->session_id());
        if (!session || session->connection != connection)
        {
            spdlog::debug("Dropping {} from {}: connection has no session", protocol::to_string(packet.type),
                          connection->remote_address());
            return;
        }
        if (session->terminal())
        {
            spdlog::debug("Session {}: ignoring {} after {}", session->id, protocol::to_string(packet.type),
                          to_string(session->status));
            return;
        }
        if (packet.session_id != session->wire_session_id())
        {
            spdlog::warn("Session {}: dropping {} addressed to {}", session->id, protocol::to_string(packet.type),
                         packet.session_id);
            return;
        }

        try
        {
            dispatch(connection, *session, packet);
        }
        catch (const nlohmann::json::exception &ex)
        {
            apply_policy(config_.malformed_packet_policy, connection,
                         "Malformed " + std::string(protocol::to_string(packet.type)) + ": " + ex.what());
        }
        catch (const TransferError &ex)
        {
            if (ex.code() == ErrorCode::InvalidPacket)
            {
                apply_policy(config_.malformed_packet_policy, connection, ex.what());
                return;
            }
            fail_session(connection, *session, ex.code(), ex.what());
        }
        catch (const std::exception &ex)
        {
            fail_session(connection, *session, ErrorCode::InternalError, ex.what());
        }
    }

    void PacketRouter::on_invalid_packet(const std::shared_ptr<Connection> &connection, const TransferError &error)
    {
        const auto policy = error.code() == ErrorCode::UnknownPacket ? config_.unknown_packet_policy
                                                                      : config_.malformed_packet_policy;
        apply_policy(policy, connection, error.what());
    }

    void PacketRouter::on_closed(const std::shared_ptr<Connection> &connection, const std::error_code &ec)
    {
        auto session = registry_.find(connection->session_id());
        if (!session || session->connection != connection || session->terminal())
        {
            return;
        }
        // A sender finishes by half-closing, so EOF before completion means the stream was cut short.
        const auto message = ec ? ec.message() : std::string("Connection closed by peer");
        lifecycle_.fail(*session, ErrorCode::ConnectionClosed, message);
    }

    void PacketRouter::dispatch(const std::shared_ptr<Connection> &connection, Session &session,
                                const protocol::Packet &packet)
    {
        using protocol::PacketType;

        switch (packet.type)
        {
        case PacketType::Error:
            handle_peer_error(connection, session, packet);
            return;
        case PacketType::Cancel:
            handle_peer_cancel(connection, session);
            return;
        default:
            break;
        }

        if (session.role == Role::Send)
        {
            if (packet.type == PacketType::Ack)
            {
                sender_.handle_ack(session, packet);
                return;
            }
        }
        else if (packet.type == PacketType::Handshake)
        {
            receiver_.handle_handshake(session, packet);
            return;
        }
        else if (session.handshake_received)
        {
            switch (packet.type)
            {
            case PacketType::FileInfo:
                receiver_.handle_file_info(session, packet);
                return;
            case PacketType::FileData:
                receiver_.handle_file_data(session, packet);
                return;
            case PacketType::FileEnd:
                receiver_.handle_file_end(session, packet);
                return;
            default:
                break;
            }
        }

        spdlog::debug("Session {}: unexpected {} for a {} session dropped", session.id, protocol::to_string(packet.type),
                      to_string(session.role));
    }

    void PacketRouter::handle_peer_error(const std::shared_ptr<Connection> &connection, Session &session,
                                         const protocol::Packet &packet)
    {
        std::string message = "Peer reported an error";
        if (const auto it = packet.data.find("message"); it != packet.data.end() && it->is_string())
        {
            message = it->get<std::string>();
        }
        lifecycle_.fail(session, ErrorCode::PeerError, message);
        connection->close();
    }

    void PacketRouter::handle_peer_cancel(const std::shared_ptr<Connection> &connection, Session &session)
    {
        lifecycle_.cancel(session);
        connection->close();
    }

    void PacketRouter::apply_policy(PacketPolicy policy, const std::shared_ptr<Connection> &connection,
                                    const std::string &reason)
    {
        if (policy == PacketPolicy::Drop)
        {
            spdlog::warn("Dropped packet from {}: {}", connection->remote_address(), reason);
            return;
        }

        std::string wire_id;
        if (auto session = registry_.find(connection->session_id()))
        {
            wire_id = session->wire_session_id();
        }
        spdlog::warn("Rejected packet from {}: {}", connection->remote_address(), reason);
        connection->send(protocol::make_packet(protocol::PacketType::Error, wire_id,
                                               protocol::ErrorMessage{.message = reason}));
    }

    void PacketRouter::fail_session(const std::shared_ptr<Connection> &connection, Session &session, ErrorCode code,
                                    const std::string &message)
    {
        if (lifecycle_.fail(session, code, message))
        {
            connection->send_and_close(protocol::make_packet(protocol::PacketType::Error, session.wire_session_id(),
                                                             protocol::ErrorMessage{.message = message}));
        }
    }

} // namespace lanxfer::engine
