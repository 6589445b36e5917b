#include "lanxfer/engine/transfer_server.hpp"

#include <asio/ip/address.hpp>

#include <algorithm>
#include <string>

#include <spdlog/spdlog.h>

#include "lanxfer/error_codes.hpp"

namespace lanxfer::engine
{

    TransferServer::TransferServer(asio::io_context &io_context, const TransferConfig &config, ConnectionHandler &handler)
        : config_(config), handler_(handler), acceptor_(io_context) {}

    std::uint16_t TransferServer::listen()
    {
        const auto address = asio::ip::make_address(config_.address);
        const auto attempts = config_.port == 0 ? 0 : config_.port_fallback_attempts;

        std::error_code last_error;
        for (std::size_t attempt = 0; attempt <= attempts; ++attempt)
        {
            const auto candidate = static_cast<std::uint16_t>(config_.port + attempt);
            const asio::ip::tcp::endpoint endpoint(address, candidate);

            std::error_code ec;
            acceptor_.open(endpoint.protocol(), ec);
            if (!ec)
            {
                acceptor_.set_option(asio::ip::tcp::acceptor::reuse_address(true), ec);
            }
            if (!ec)
            {
                acceptor_.bind(endpoint, ec);
            }
            if (!ec)
            {
                acceptor_.listen(asio::socket_base::max_listen_connections, ec);
            }
            if (!ec)
            {
                port_ = acceptor_.local_endpoint().port();
                spdlog::info("Transfer server listening on {}:{}", config_.address, port_);
                return port_;
            }

            std::error_code ignored;
            acceptor_.close(ignored);
            last_error = ec;
            if (ec != asio::error::address_in_use)
            {
                break;
            }
            spdlog::warn("Port {} in use, trying next", candidate);
        }

        throw TransferError(ErrorCode::ConnectionFailed,
                            "Unable to listen on " + config_.address + ":" + std::to_string(config_.port) + ": " +
                                last_error.message());
    }

    void TransferServer::start_accept()
    {
        if (acceptor_.is_open())
        {
            accept_next();
        }
    }

    void TransferServer::track(const std::shared_ptr<Connection> &connection)
    {
        prune();
        connections_.push_back(connection);
    }

    void TransferServer::close()
    {
        std::error_code ec;
        acceptor_.close(ec);
        auto connections = std::move(connections_);
        connections_.clear();
        for (const auto &weak : connections)
        {
            if (auto connection = weak.lock())
            {
                connection->close();
            }
        }
    }

    void TransferServer::accept_next()
    {
        acceptor_.async_accept([this](const std::error_code &ec, asio::ip::tcp::socket socket)
                               { on_accept(ec, std::move(socket)); });
    }

    void TransferServer::on_accept(const std::error_code &ec, asio::ip::tcp::socket socket)
    {
        if (!ec)
        {
            auto connection = std::make_shared<Connection>(std::move(socket), handler_, config_.max_packet_size);
            spdlog::info("Incoming connection from {}", connection->remote_address());
            track(connection);
            connection->start();
        }
        if (ec == asio::error::operation_aborted || !acceptor_.is_open())
        {
            return;
        }
        if (ec)
        {
            spdlog::error("Accept error: {}", ec.message());
        }
        accept_next();
    }

    void TransferServer::prune()
    {
        connections_.erase(std::remove_if(connections_.begin(), connections_.end(),
                                          [](const std::weak_ptr<Connection> &weak)
                                          {
                                              auto connection = weak.lock();
                                              return !connection || !connection->is_open();
                                          }),
                           connections_.end());
    }

} // namespace lanxfer::engine
