#pragma once

#include <asio/ip/tcp.hpp>

#include <array>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <string>
#include <system_error>
#include <vector>

#include "lanxfer/codec.hpp"
#include "lanxfer/error_codes.hpp"
#include "lanxfer/protocol.hpp"

namespace lanxfer::engine
{

    class Connection;

    /// Receives decoded traffic from every Connection.
    class ConnectionHandler
    {
    public:
        virtual ~ConnectionHandler() = default;

        virtual void on_packet(const std::shared_ptr<Connection> &connection, protocol::Packet packet) = 0;

        // A complete frame whose payload could not be decoded; the stream stays usable.
        virtual void on_invalid_packet(const std::shared_ptr<Connection> &connection, const TransferError &error) = 0;

        // Called once, for local and remote closes alike.
        virtual void on_closed(const std::shared_ptr<Connection> &connection, const std::error_code &ec) = 0;
    };

    /// One TCP socket with its own framing state and write queue.
    class Connection : public std::enable_shared_from_this<Connection>
    {
    public:
        using WriteHandler = std::function<void(const std::error_code &)>;

        Connection(asio::ip::tcp::socket socket, ConnectionHandler &handler, std::size_t max_packet_size);
        ~Connection();

        Connection(const Connection &) = delete;
        Connection &operator=(const Connection &) = delete;

        void start();

        // on_written runs once the frame is on the wire; it is dropped if the
        // connection closes first.
        void send(const protocol::Packet &packet, WriteHandler on_written = {});

        // Discards frames not yet started, writes this one, then closes.
        void send_and_close(const protocol::Packet &packet);

        void close_after_flush();
        void shutdown_after_flush();
        void close();

        bool is_open() const noexcept { return !closed_; }

        const std::string &remote_address() const noexcept { return remote_address_; }

        void bind_session(std::string session_id) { session_id_ = std::move(session_id); }
        const std::string &session_id() const noexcept { return session_id_; }

    private:
        enum class AfterFlush : std::uint8_t
        {
            Nothing,
            Shutdown,
            Close
        };

        struct PendingWrite
        {
            std::shared_ptr<std::vector<std::uint8_t>> frame;
            WriteHandler on_written;
        };

        void read_next();
        void on_read(const std::error_code &ec, std::size_t bytes_transferred);
        void write_next();
        void on_flushed();
        void close_with(const std::error_code &ec);

        asio::ip::tcp::socket socket_;
        ConnectionHandler &handler_;
        protocol::FrameDecoder decoder_;
        std::array<std::uint8_t, 64 * 1024> read_buffer_{};
        std::deque<PendingWrite> write_queue_;
        bool writing_{false};
        bool closed_{false};
        AfterFlush after_flush_{AfterFlush::Nothing};
        std::string remote_address_;
        std::string session_id_;
    };

} // namespace lanxfer::engine
