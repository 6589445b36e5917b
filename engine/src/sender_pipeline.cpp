#include "lanxfer/engine/sender_pipeline.hpp"

#include <asio/steady_timer.hpp>

#include <algorithm>
#include <fstream>
#include <span>
#include <vector>

#include <spdlog/spdlog.h>

#include "lanxfer/crypto.hpp"
#include "lanxfer/encoding/base64.hpp"
#include "lanxfer/engine/filesystem.hpp"
#include "lanxfer/error_codes.hpp"

namespace lanxfer::engine
{

    namespace
    {

        constexpr std::string_view kNoMatchMessage = "Invalid pairing code or no pending transfer";

        // A send session completes once its stream has ended and the receiver has
        // confirmed every regular file with ack{fileComplete}.
        void complete_if_acknowledged(EngineServices &services, Session &session)
        {
            if (!session.stream_finished || session.files_acknowledged < session.regular_file_count())
            {
                return;
            }
            if (services.lifecycle.complete(session) && session.connection)
            {
                // Half-close once everything queued is written; the receiver closes on EOF.
                session.connection->shutdown_after_flush();
            }
        }

        // Walks one bound session's manifest: file-info, then file-data chunks, then
        // file-end for each entry, strictly one file at a time. The next chunk is read
        // only after the previous one has been written to the socket.
        class OutboundStream : public std::enable_shared_from_this<OutboundStream>
        {
        public:
            OutboundStream(EngineServices services, std::shared_ptr<Session> session, std::shared_ptr<Connection> connection)
                : services_(services),
                  session_(std::move(session)),
                  connection_(std::move(connection)),
                  timer_(services_.io_context),
                  buffer_(std::max<std::size_t>(services_.config.chunk_size, 1)) {}

            void start()
            {
                after(services_.config.settle_delay, [](OutboundStream &self)
                      { self.begin(); });
            }

        private:
            using Step = void (*)(OutboundStream &);

            bool active() const
            {
                return session_->status == SessionStatus::Transferring && connection_->is_open() &&
                       session_->connection == connection_;
            }

            void after(std::chrono::milliseconds delay, Step step)
            {
                timer_.expires_after(delay);
                auto self = shared_from_this();
                timer_.async_wait([self, step](const std::error_code &ec)
                                  {
                                      if (ec || !self->active())
                                      {
                                          return;
                                      }
                                      step(*self); });
            }

            void begin()
            {
                spdlog::info("Session {}: streaming {} entries ({} bytes) to {}", session_->id, session_->files.size(),
                             session_->total_size, session_->peer_address);
                services_.lifecycle.publish(NotificationKind::TransferStarted, *session_);
                next_entry();
            }

            void next_entry()
            {
                if (index_ >= session_->files.size())
                {
                    finish();
                    return;
                }
                const auto &entry = session_->files[index_];
                send(protocol::PacketType::FileInfo, entry);
                after(services_.config.entry_delay, [](OutboundStream &self)
                      { self.open_entry(); });
            }

            void open_entry()
            {
                const auto &entry = session_->files[index_];
                if (entry.is_directory)
                {
                    ++index_;
                    next_entry();
                    return;
                }

                input_.open(session_->sources[index_], std::ios::binary);
                if (!input_)
                {
                    abort_with(ErrorCode::IoError, "Cannot open " + session_->sources[index_].string());
                    return;
                }
                remaining_ = entry.size;
                send_chunk();
            }

            void send_chunk()
            {
                if (remaining_ == 0)
                {
                    end_entry();
                    return;
                }

                const auto wanted = static_cast<std::size_t>(std::min<std::uint64_t>(remaining_, buffer_.size()));
                input_.read(reinterpret_cast<char *>(buffer_.data()), static_cast<std::streamsize>(wanted));
                const auto got = static_cast<std::size_t>(input_.gcount());
                if (input_.bad())
                {
                    abort_with(ErrorCode::IoError, "Read failed for " + session_->sources[index_].string());
                    return;
                }
                if (got == 0)
                {
                    // Source shrank after the manifest was built.
                    spdlog::warn("Session {}: {} ended {} bytes early", session_->id, session_->sources[index_].string(),
                                 remaining_);
                    end_entry();
                    return;
                }

                remaining_ -= got;
                session_->transferred_size += got;
                const protocol::FileChunk chunk{
                    .chunk = encoding::encode_base64(std::span<const std::byte>(buffer_.data(), got)),
                };

                auto self = shared_from_this();
                connection_->send(protocol::make_packet(protocol::PacketType::FileData, session_->wire_session_id(), chunk),
                                  [self](const std::error_code &ec)
                                  {
                                      if (!ec)
                                      {
                                          self->after(self->services_.config.chunk_delay, [](OutboundStream &stream)
                                                      { stream.send_chunk(); });
                                      }
                                  });
                services_.lifecycle.publish_progress(*session_);
            }

            void end_entry()
            {
                input_.close();
                input_.clear();
                const auto &entry = session_->files[index_];
                send(protocol::PacketType::FileEnd, protocol::FileEnd{.name = entry.name});
                ++index_;
                next_entry();
            }

            void finish()
            {
                session_->stream_finished = true;
                spdlog::debug("Session {}: stream finished, {}/{} files confirmed", session_->id,
                              session_->files_acknowledged, session_->regular_file_count());
                complete_if_acknowledged(services_, *session_);
            }

            void abort_with(ErrorCode code, const std::string &message)
            {
                input_.close();
                services_.lifecycle.fail(*session_, code, message);
                connection_->send_and_close(protocol::make_packet(protocol::PacketType::Error, session_->wire_session_id(),
                                                                  protocol::ErrorMessage{.message = message}));
            }

            template <typename Payload>
            void send(protocol::PacketType type, const Payload &payload)
            {
                connection_->send(protocol::make_packet(type, session_->wire_session_id(), payload));
            }

            EngineServices services_;
            std::shared_ptr<Session> session_;
            std::shared_ptr<Connection> connection_;
            asio::steady_timer timer_;
            std::vector<std::byte> buffer_;
            std::ifstream input_;
            std::size_t index_{0};
            std::uint64_t remaining_{0};
        };

    } // namespace

    PreparedTransfer SenderPipeline::prepare(const std::vector<std::filesystem::path> &paths,
                                             const std::string &pairing_code)
    {
        auto manifest = build_manifest(paths);

        auto session = std::make_shared<Session>(crypto::random_uuid(), Role::Send, SessionStatus::Waiting);
        session->pairing_code = pairing_code;
        session->files = std::move(manifest.files);
        session->sources = std::move(manifest.sources);
        session->total_size = manifest.total_size;
        services_.registry.add(session);

        spdlog::info("Prepared session {} with code {}: {} entries, {} bytes", session->id, pairing_code,
                     session->files.size(), session->total_size);
        services_.lifecycle.publish(NotificationKind::TransferWaiting, *session);

        return PreparedTransfer{
            .session_id = session->id,
            .files = session->files,
            .total_size = session->total_size,
        };
    }

    void SenderPipeline::handle_request(const std::shared_ptr<Connection> &connection, const protocol::Packet &packet)
    {
        if (!connection->session_id().empty())
        {
            spdlog::warn("Ignoring repeated request on connection from {}", connection->remote_address());
            return;
        }

        const auto request = packet.data.get<protocol::RequestData>();
        auto session = services_.registry.bind_waiting_sender(
            request.pairing_code,
            [&](Session &candidate)
            {
                candidate.transition(SessionStatus::Transferring);
                candidate.connection = connection;
                candidate.receiver_session_id = packet.session_id;
                candidate.peer_id = request.device_id;
                candidate.peer_name = request.device_name;
                candidate.peer_address = connection->remote_address();
            });

        if (!session)
        {
            spdlog::warn("Rejected request from {}: no waiting session for the presented code",
                         connection->remote_address());
            connection->send_and_close(protocol::make_packet(protocol::PacketType::Error, packet.session_id,
                                                             protocol::ErrorMessage{.message = std::string(kNoMatchMessage)}));
            return;
        }

        connection->bind_session(session->id);
        spdlog::info("Session {} bound to {} ({})", session->id, session->peer_name, session->peer_address);

        connection->send(protocol::make_packet(protocol::PacketType::Handshake, session->wire_session_id(),
                                               protocol::HandshakeData{
                                                   .sender_session_id = session->id,
                                                   .files = session->files,
                                                   .total_size = session->total_size,
                                               }));
        services_.lifecycle.publish(NotificationKind::TransferConnected, *session);

        std::make_shared<OutboundStream>(services_, session, connection)->start();
    }

    void SenderPipeline::handle_ack(Session &session, const protocol::Packet &packet)
    {
        const auto ack = packet.data.get<protocol::Ack>();
        if (ack.ready.value_or(false))
        {
            services_.lifecycle.publish(NotificationKind::FileReady, session);
        }
        else if (ack.file_complete.value_or(false))
        {
            ++session.files_acknowledged;
            services_.lifecycle.publish(NotificationKind::FileSent, session);
            complete_if_acknowledged(services_, session);
        }
    }

} // namespace lanxfer::engine
