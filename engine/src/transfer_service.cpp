#include "lanxfer/engine/transfer_service.hpp"

#include <asio/post.hpp>

#include <utility>

#include <spdlog/spdlog.h>

#include "lanxfer/crypto.hpp"
#include "lanxfer/error_codes.hpp"

namespace lanxfer::engine
{

    TransferService::TransferService(TransferConfig config)
        : config_(std::move(config)),
          lifecycle_(notifier_),
          device_(detect_device_info(config_.device_name, config_.port)),
          router_(config_, registry_, lifecycle_, sender_, receiver_),
          server_(io_context_, config_, router_),
          sender_(services()),
          receiver_(services()) {}

    TransferService::~TransferService()
    {
        try
        {
            stop();
        }
        catch (const std::exception &ex)
        {
            spdlog::error("Error while stopping transfer service: {}", ex.what());
        }
    }

    EngineServices TransferService::services()
    {
        return EngineServices{
            .io_context = io_context_,
            .config = config_,
            .registry = registry_,
            .lifecycle = lifecycle_,
            .server = server_,
            .handler = router_,
            .device = device_,
        };
    }

    template <typename Fn>
    auto TransferService::run_on_loop(Fn &&fn) -> decltype(fn())
    {
        if (!running_ || io_context_.get_executor().running_in_this_thread())
        {
            return fn();
        }
        std::packaged_task<decltype(fn())()> task(std::forward<Fn>(fn));
        auto result = task.get_future();
        asio::post(io_context_, [&task]
                   { task(); });
        return result.get();
    }

    std::uint16_t TransferService::start()
    {
        std::lock_guard lock(state_mutex_);
        if (running_)
        {
            return port_;
        }

        crypto::ensure_sodium_init();
        io_context_.restart();
        const auto bound = server_.listen();
        device_.port = bound;
        port_ = bound;
        server_.start_accept();

        work_guard_.emplace(io_context_.get_executor());
        running_ = true;
        loop_thread_ = std::thread([this]
                                   { run_loop(); });
        spdlog::info("Transfer service {} ({}) started on port {}", device_.device_name, device_.device_id, bound);
        return bound;
    }

    void TransferService::stop()
    {
        if (io_context_.get_executor().running_in_this_thread())
        {
            throw TransferError(ErrorCode::InternalError, "stop() called from the transfer loop thread");
        }

        std::lock_guard lock(state_mutex_);
        if (!running_)
        {
            return;
        }

        run_on_loop([this]
                    {
                        shutdown_sessions();
                        server_.close(); });

        running_ = false;
        work_guard_.reset();
        io_context_.stop();
        if (loop_thread_.joinable())
        {
            loop_thread_.join();
        }

        // Let aborted operations release their sessions and sockets.
        io_context_.restart();
        io_context_.poll();
        spdlog::info("Transfer service stopped");
    }

    PreparedTransfer TransferService::prepare_to_send(const std::vector<std::filesystem::path> &paths,
                                                      const std::string &pairing_code)
    {
        return run_on_loop([&]
                           { return sender_.prepare(paths, pairing_code); });
    }

    std::future<std::string> TransferService::request_files(const std::string &address, std::uint16_t port,
                                                            const std::string &pairing_code,
                                                            const std::filesystem::path &save_path)
    {
        if (!running_)
        {
            throw TransferError(ErrorCode::NotRunning, "Transfer service is not running");
        }
        return run_on_loop([&]
                           { return receiver_.request(address, port, pairing_code, save_path); });
    }

    bool TransferService::cancel_transfer(const std::string &session_id)
    {
        return run_on_loop([&]
                           {
                               auto session = registry_.find(session_id);
                               if (!session)
                               {
                                   return false;
                               }
                               const bool cancelled = lifecycle_.cancel(*session);
                               if (cancelled && session->connection)
                               {
                                   session->connection->send_and_close(protocol::make_packet(
                                       protocol::PacketType::Cancel, session->wire_session_id()));
                               }
                               return cancelled; });
    }

    std::vector<SessionSnapshot> TransferService::get_sessions()
    {
        return run_on_loop([this]
                           {
                               std::vector<SessionSnapshot> result;
                               for (const auto &session : registry_.all())
                               {
                                   result.push_back(snapshot(*session));
                               }
                               return result; });
    }

    std::optional<SessionSnapshot> TransferService::get_session(const std::string &session_id)
    {
        return run_on_loop([&]() -> std::optional<SessionSnapshot>
                           {
                               auto session = registry_.find(session_id);
                               if (!session)
                               {
                                   return std::nullopt;
                               }
                               return snapshot(*session); });
    }

    DeviceInfo TransferService::get_device_info() const
    {
        std::lock_guard lock(state_mutex_);
        return device_;
    }

    std::string TransferService::generate_pairing_code()
    {
        return crypto::random_pairing_code();
    }

    void TransferService::run_loop()
    {
        for (;;)
        {
            try
            {
                io_context_.run();
                return;
            }
            catch (const std::exception &ex)
            {
                spdlog::error("Unhandled error on transfer loop: {}", ex.what());
            }
        }
    }

    void TransferService::shutdown_sessions()
    {
        for (const auto &session : registry_.clear())
        {
            lifecycle_.cancel(*session);
            if (session->connection)
            {
                session->connection->close();
            }
        }
    }

} // namespace lanxfer::engine
