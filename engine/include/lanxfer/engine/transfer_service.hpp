/**
 * lanxfer - LAN file-transfer service.
 *
 * Owns one event loop, the listening socket and every session. Public calls may
 * come from any thread; they are executed on the loop thread. Notifications are
 * delivered on the loop thread, so callbacks must not block or call stop().
 */
#pragma once

#include <asio/executor_work_guard.hpp>
#include <asio/io_context.hpp>

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <future>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "lanxfer/engine/config.hpp"
#include "lanxfer/engine/device_info.hpp"
#include "lanxfer/engine/lifecycle.hpp"
#include "lanxfer/engine/notifier.hpp"
#include "lanxfer/engine/packet_router.hpp"
#include "lanxfer/engine/receiver_pipeline.hpp"
#include "lanxfer/engine/sender_pipeline.hpp"
#include "lanxfer/engine/session.hpp"
#include "lanxfer/engine/session_registry.hpp"
#include "lanxfer/engine/transfer_server.hpp"

namespace lanxfer::engine
{

    class TransferService
    {
    public:
        explicit TransferService(TransferConfig config = {});
        ~TransferService();

        TransferService(const TransferService &) = delete;
        TransferService &operator=(const TransferService &) = delete;

        /// Binds the listener and starts the loop thread. Returns the effective port.
        std::uint16_t start();

        /// Cancels every live session, closes all sockets and joins the loop thread.
        void stop();

        bool is_running() const noexcept { return running_; }

        PreparedTransfer prepare_to_send(const std::vector<std::filesystem::path> &paths,
                                         const std::string &pairing_code);

        std::future<std::string> request_files(const std::string &address, std::uint16_t port,
                                               const std::string &pairing_code,
                                               const std::filesystem::path &save_path);

        /// Returns false for an unknown or already finished session.
        bool cancel_transfer(const std::string &session_id);

        std::vector<SessionSnapshot> get_sessions();
        std::optional<SessionSnapshot> get_session(const std::string &session_id);

        DeviceInfo get_device_info() const;

        static std::string generate_pairing_code();

        Notifier &notifier() noexcept { return notifier_; }

        std::uint16_t port() const noexcept { return port_; }

    private:
        template <typename Fn>
        auto run_on_loop(Fn &&fn) -> decltype(fn());

        EngineServices services();
        void run_loop();
        void shutdown_sessions();

        TransferConfig config_;
        asio::io_context io_context_;
        std::optional<asio::executor_work_guard<asio::io_context::executor_type>> work_guard_;

        Notifier notifier_;
        SessionLifecycle lifecycle_;
        SessionRegistry registry_;
        DeviceInfo device_;

        PacketRouter router_;
        TransferServer server_;
        SenderPipeline sender_;
        ReceiverPipeline receiver_;

        mutable std::mutex state_mutex_;
        std::thread loop_thread_;
        std::atomic<bool> running_{false};
        std::atomic<std::uint16_t> port_{0};
    };

} // namespace lanxfer::engine
