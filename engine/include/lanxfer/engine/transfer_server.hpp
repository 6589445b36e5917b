#pragma once

#include <asio/io_context.hpp>
#include <asio/ip/tcp.hpp>

#include <cstdint>
#include <memory>
#include <vector>

#include "lanxfer/engine/config.hpp"
#include "lanxfer/engine/connection.hpp"

namespace lanxfer::engine
{

    class TransferServer
    {
    public:
        TransferServer(asio::io_context &io_context, const TransferConfig &config, ConnectionHandler &handler);

        /// Binds the configured port, falling back to port+1... on conflict. Returns the bound port.
        std::uint16_t listen();

        void start_accept();

        /// Registers an outbound connection so close() reaches it too.
        void track(const std::shared_ptr<Connection> &connection);

        void close();

        std::uint16_t port() const noexcept { return port_; }
        bool is_listening() const { return acceptor_.is_open(); }

    private:
        void accept_next();
        void on_accept(const std::error_code &ec, asio::ip::tcp::socket socket);
        void prune();

        const TransferConfig &config_;
        ConnectionHandler &handler_;
        asio::ip::tcp::acceptor acceptor_;
        std::uint16_t port_{0};
        std::vector<std::weak_ptr<Connection>> connections_;
    };

} // namespace lanxfer::engine
