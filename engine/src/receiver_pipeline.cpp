#include "lanxfer/engine/receiver_pipeline.hpp"

#include <asio/connect.hpp>
#include <asio/ip/tcp.hpp>

#include <memory>
#include <system_error>

#include <spdlog/spdlog.h>

#include "lanxfer/crypto.hpp"
#include "lanxfer/encoding/base64.hpp"
#include "lanxfer/engine/connection.hpp"
#include "lanxfer/engine/filesystem.hpp"
#include "lanxfer/engine/transfer_server.hpp"
#include "lanxfer/error_codes.hpp"

namespace lanxfer::engine
{

    std::future<std::string> ReceiverPipeline::request(const std::string &address, std::uint16_t port,
                                                       const std::string &pairing_code,
                                                       const std::filesystem::path &save_path)
    {
        auto session = std::make_shared<Session>(crypto::random_uuid(), Role::Receive, SessionStatus::Transferring);
        session->pairing_code = pairing_code;
        session->save_path = save_path;
        session->peer_address = address;
        session->pending_request = std::make_shared<std::promise<std::string>>();
        auto future = session->pending_request->get_future();
        services_.registry.add(session);

        spdlog::info("Session {}: connecting to {}:{} with code {}", session->id, address, port, pairing_code);

        auto resolver = std::make_shared<asio::ip::tcp::resolver>(services_.io_context);
        auto socket = std::make_shared<asio::ip::tcp::socket>(services_.io_context);
        auto services = services_;

        resolver->async_resolve(
            address, std::to_string(port),
            [services, session, resolver, socket](const std::error_code &resolve_ec,
                                                  const asio::ip::tcp::resolver::results_type &endpoints)
            {
                if (session->terminal())
                {
                    return;
                }
                if (resolve_ec)
                {
                    services.lifecycle.fail(*session, ErrorCode::ConnectionFailed,
                                            "Cannot resolve " + session->peer_address + ": " + resolve_ec.message());
                    return;
                }
                asio::async_connect(
                    *socket, endpoints,
                    [services, session, socket](const std::error_code &connect_ec, const asio::ip::tcp::endpoint &)
                    {
                        if (session->terminal())
                        {
                            return;
                        }
                        if (connect_ec)
                        {
                            services.lifecycle.fail(*session, ErrorCode::ConnectionFailed,
                                                    "Cannot connect to " + session->peer_address + ": " +
                                                        connect_ec.message());
                            return;
                        }

                        auto connection = std::make_shared<Connection>(std::move(*socket), services.handler,
                                                                       services.config.max_packet_size);
                        connection->bind_session(session->id);
                        session->connection = connection;
                        services.server.track(connection);
                        connection->start();

                        connection->send(protocol::make_packet(protocol::PacketType::Request, session->id,
                                                               protocol::RequestData{
                                                                   .pairing_code = session->pairing_code,
                                                                   .device_id = services.device.device_id,
                                                                   .device_name = services.device.device_name,
                                                                   .save_path = session->save_path.string(),
                                                               }));
                    });
            });

        return future;
    }

    void ReceiverPipeline::handle_handshake(Session &session, const protocol::Packet &packet)
    {
        if (session.handshake_received)
        {
            spdlog::debug("Session {}: ignoring repeated handshake", session.id);
            return;
        }
        auto handshake = packet.data.get<protocol::HandshakeData>();

        std::error_code ec;
        std::filesystem::create_directories(session.save_path, ec);
        if (ec)
        {
            throw TransferError(ErrorCode::IoError, "Cannot create " + session.save_path.string() + ": " + ec.message());
        }

        session.files = std::move(handshake.files);
        session.total_size = handshake.total_size;
        session.sender_session_id = std::move(handshake.sender_session_id);
        session.handshake_received = true;
        spdlog::info("Session {}: handshake from sender {}, {} entries, {} bytes", session.id, session.sender_session_id,
                     session.files.size(), session.total_size);

        if (session.pending_request)
        {
            auto promise = std::move(session.pending_request);
            promise->set_value(session.id);
        }
        services_.lifecycle.publish(NotificationKind::TransferStarted, session);

        complete_if_finished(session);
    }

    void ReceiverPipeline::handle_file_info(Session &session, const protocol::Packet &packet)
    {
        const auto entry = packet.data.get<protocol::FileEntry>();
        const auto target = resolve_under(session.save_path, entry.relative_path);
        ++session.entries_received;

        std::error_code ec;
        if (entry.is_directory)
        {
            std::filesystem::create_directories(target, ec);
            if (ec)
            {
                throw TransferError(ErrorCode::IoError, "Cannot create " + target.string() + ": " + ec.message());
            }
            acknowledge(session, protocol::Ack{.ready = true, .file_complete = std::nullopt});
            complete_if_finished(session);
            return;
        }

        std::filesystem::create_directories(target.parent_path(), ec);
        if (ec)
        {
            throw TransferError(ErrorCode::IoError,
                                "Cannot create " + target.parent_path().string() + ": " + ec.message());
        }
        if (session.current_file)
        {
            spdlog::warn("Session {}: {} started before {} ended", session.id, target.string(),
                         session.current_file->path.string());
            session.close_current_file();
        }

        std::ofstream stream(target, std::ios::binary | std::ios::trunc);
        if (!stream)
        {
            throw TransferError(ErrorCode::IoError, "Cannot open " + target.string() + " for writing");
        }
        session.current_file = CurrentFile{
            .path = target,
            .size = entry.size,
            .received = 0,
            .stream = std::move(stream),
        };
        spdlog::debug("Session {}: receiving {} ({} bytes)", session.id, entry.relative_path, entry.size);
        acknowledge(session, protocol::Ack{.ready = true, .file_complete = std::nullopt});
    }

    void ReceiverPipeline::handle_file_data(Session &session, const protocol::Packet &packet)
    {
        if (!session.current_file)
        {
            spdlog::warn("Session {}: file-data with no open file dropped", session.id);
            return;
        }
        const auto chunk = packet.data.get<protocol::FileChunk>();
        const auto bytes = encoding::decode_base64(chunk.chunk);
        if (!bytes)
        {
            throw TransferError(ErrorCode::InvalidPacket, "file-data chunk is not valid base64");
        }

        auto &file = *session.current_file;
        file.stream.write(reinterpret_cast<const char *>(bytes->data()), static_cast<std::streamsize>(bytes->size()));
        if (!file.stream)
        {
            throw TransferError(ErrorCode::IoError, "Write failed for " + file.path.string());
        }
        file.received += bytes->size();
        session.transferred_size += bytes->size();
        services_.lifecycle.publish_progress(session);
    }

    void ReceiverPipeline::handle_file_end(Session &session, const protocol::Packet &packet)
    {
        const auto end = packet.data.get<protocol::FileEnd>();
        if (session.current_file)
        {
            const auto &file = *session.current_file;
            if (file.received != file.size)
            {
                spdlog::warn("Session {}: {} ended at {} of {} bytes", session.id, file.path.string(), file.received,
                             file.size);
            }
            session.close_current_file();
            ++session.files_finished;
            spdlog::debug("Session {}: finished {}", session.id, end.name);
        }

        acknowledge(session, protocol::Ack{.ready = std::nullopt, .file_complete = true});
        complete_if_finished(session);
    }

    void ReceiverPipeline::acknowledge(Session &session, protocol::Ack ack)
    {
        if (session.connection)
        {
            session.connection->send(protocol::make_packet(protocol::PacketType::Ack, session.wire_session_id(), ack));
        }
    }

    // Every manifest entry has arrived, every regular file has ended and the byte
    // count has reached the announced total.
    void ReceiverPipeline::complete_if_finished(Session &session)
    {
        if (!session.handshake_received || session.current_file || session.entries_received < session.files.size())
        {
            return;
        }
        if (session.files_finished < session.regular_file_count() || session.transferred_size < session.total_size)
        {
            return;
        }
        services_.lifecycle.complete(session);
    }

} // namespace lanxfer::engine
