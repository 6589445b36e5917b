#include "lanxfer/engine/connection.hpp"

#include <asio/write.hpp>

#include <span>
#include <utility>

#include <spdlog/spdlog.h>

namespace lanxfer::engine
{

    namespace
    {
        std::string describe_endpoint(const asio::ip::tcp::socket &socket)
        {
            std::error_code ec;
            const auto endpoint = socket.remote_endpoint(ec);
            if (ec)
            {
                return "unknown";
            }
            return endpoint.address().to_string();
        }
    } // namespace

    Connection::Connection(asio::ip::tcp::socket socket, ConnectionHandler &handler, std::size_t max_packet_size)
        : socket_(std::move(socket)),
          handler_(handler),
          decoder_(max_packet_size),
          remote_address_(describe_endpoint(socket_)) {}

    Connection::~Connection()
    {
        std::error_code ec;
        socket_.close(ec);
    }

    void Connection::start()
    {
        spdlog::debug("Connection with {} started", remote_address_);
        read_next();
    }

    void Connection::send(const protocol::Packet &packet, WriteHandler on_written)
    {
        if (closed_)
        {
            return;
        }
        auto frame = std::make_shared<std::vector<std::uint8_t>>(protocol::encode_packet(packet));
        write_queue_.push_back(PendingWrite{std::move(frame), std::move(on_written)});
        if (!writing_)
        {
            write_next();
        }
    }

    void Connection::send_and_close(const protocol::Packet &packet)
    {
        if (closed_)
        {
            return;
        }
        // The frame at the front is already being written when writing_ is set.
        if (writing_ && !write_queue_.empty())
        {
            write_queue_.erase(write_queue_.begin() + 1, write_queue_.end());
        }
        else
        {
            write_queue_.clear();
        }
        after_flush_ = AfterFlush::Close;
        send(packet);
    }

    void Connection::close_after_flush()
    {
        after_flush_ = AfterFlush::Close;
        if (!writing_)
        {
            on_flushed();
        }
    }

    void Connection::shutdown_after_flush()
    {
        if (after_flush_ == AfterFlush::Close)
        {
            return;
        }
        after_flush_ = AfterFlush::Shutdown;
        if (!writing_)
        {
            on_flushed();
        }
    }

    void Connection::close()
    {
        close_with(std::error_code{});
    }

    void Connection::read_next()
    {
        auto self = shared_from_this();
        socket_.async_read_some(asio::buffer(read_buffer_),
                                [this, self](const std::error_code &ec, std::size_t bytes_transferred)
                                { on_read(ec, bytes_transferred); });
    }

    void Connection::on_read(const std::error_code &ec, std::size_t bytes_transferred)
    {
        if (closed_)
        {
            return;
        }
        if (ec)
        {
            if (ec != asio::error::eof)
            {
                spdlog::warn("Read from {} failed: {}", remote_address_, ec.message());
            }
            close_with(ec);
            return;
        }

        std::vector<std::string> payloads;
        try
        {
            payloads = decoder_.feed(std::span<const std::uint8_t>(read_buffer_.data(), bytes_transferred));
        }
        catch (const TransferError &ex)
        {
            // The length prefix itself is unusable, so the stream cannot be resynchronised.
            spdlog::error("Dropping connection with {}: {}", remote_address_, ex.what());
            close_with(std::make_error_code(std::errc::message_size));
            return;
        }

        auto self = shared_from_this();
        for (const auto &payload : payloads)
        {
            if (closed_)
            {
                return;
            }
            protocol::Packet packet;
            try
            {
                packet = protocol::decode_packet(payload);
            }
            catch (const TransferError &ex)
            {
                handler_.on_invalid_packet(self, ex);
                continue;
            }
            catch (const std::exception &ex)
            {
                handler_.on_invalid_packet(self, TransferError(ErrorCode::InvalidPacket, ex.what()));
                continue;
            }
            handler_.on_packet(self, std::move(packet));
        }

        if (!closed_)
        {
            read_next();
        }
    }

    void Connection::write_next()
    {
        if (write_queue_.empty())
        {
            writing_ = false;
            on_flushed();
            return;
        }
        writing_ = true;
        auto self = shared_from_this();
        auto frame = write_queue_.front().frame;
        asio::async_write(socket_, asio::buffer(*frame),
                          [this, self, frame](const std::error_code &ec, std::size_t /*bytes_transferred*/)
                          {
                              if (closed_)
                              {
                                  return;
                              }
                              if (ec)
                              {
                                  spdlog::warn("Write to {} failed: {}", remote_address_, ec.message());
                                  close_with(ec);
                                  return;
                              }
                              auto on_written = std::move(write_queue_.front().on_written);
                              write_queue_.pop_front();
                              if (on_written)
                              {
                                  on_written(ec);
                              }
                              if (!closed_)
                              {
                                  write_next();
                              }
                          });
    }

    void Connection::on_flushed()
    {
        if (closed_)
        {
            return;
        }
        if (after_flush_ == AfterFlush::Close)
        {
            close();
        }
        else if (after_flush_ == AfterFlush::Shutdown)
        {
            std::error_code ec;
            socket_.shutdown(asio::ip::tcp::socket::shutdown_send, ec);
            if (ec)
            {
                spdlog::debug("Shutdown towards {} failed: {}", remote_address_, ec.message());
            }
            after_flush_ = AfterFlush::Nothing;
        }
    }

    void Connection::close_with(const std::error_code &ec)
    {
        if (closed_)
        {
            return;
        }
        closed_ = true;
        writing_ = false;
        write_queue_.clear();

        std::error_code ignored;
        socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ignored);
        socket_.close(ignored);
        spdlog::debug("Connection with {} closed", remote_address_);

        handler_.on_closed(shared_from_this(), ec);
    }

} // namespace lanxfer::engine
