#include <asio/io_context.hpp>
#include <asio/signal_set.hpp>

#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "lanxfer/cli/config.hpp"
#include "lanxfer/cli/logging.hpp"
#include "lanxfer/crypto.hpp"
#include "lanxfer/engine/filesystem.hpp"
#include "lanxfer/engine/progress.hpp"
#include "lanxfer/engine/transfer_service.hpp"
#include "lanxfer/error_codes.hpp"
#include "lanxfer/version.hpp"

namespace
{

    using lanxfer::engine::Notification;
    using lanxfer::engine::NotificationKind;
    using lanxfer::engine::Role;

    // Waits on the main thread until the transfer ends or a signal arrives.
    class TransferWatch
    {
    public:
        explicit TransferWatch(Role role) : role_(role), signals_(signals_context_, SIGINT, SIGTERM) {}

        void attach(const std::string &session_id)
        {
            std::lock_guard lock(mutex_);
            session_id_ = session_id;
        }

        void on_notification(const Notification &notification)
        {
            if (notification.role != role_)
            {
                return;
            }
            switch (notification.kind)
            {
            case NotificationKind::TransferConnected:
                std::cout << "Connected to " << notification.peer_name << std::endl;
                break;
            case NotificationKind::TransferProgress:
                print_progress(notification);
                break;
            case NotificationKind::TransferCompleted:
                std::cout << "\nCompleted " << notification.files.size() << " entries ("
                          << lanxfer::engine::progress::format_size(static_cast<double>(notification.total_size))
                          << ") in " << notification.duration.count() << " ms" << std::endl;
                finish(NotificationKind::TransferCompleted, {});
                break;
            case NotificationKind::TransferError:
                finish(NotificationKind::TransferError, notification.message);
                break;
            case NotificationKind::TransferCancelled:
                finish(NotificationKind::TransferCancelled, {});
                break;
            default:
                break;
            }
        }

        /// Returns the terminal notification kind, or nullopt if interrupted first.
        std::optional<NotificationKind> wait(lanxfer::engine::TransferService &service)
        {
            signals_.async_wait([this, &service](const std::error_code &ec, int signal)
                                {
                                    if (ec)
                                    {
                                        return;
                                    }
                                    spdlog::warn("Signal {} received, cancelling", signal);
                                    std::string session_id;
                                    {
                                        std::lock_guard lock(mutex_);
                                        session_id = session_id_;
                                    }
                                    if (session_id.empty() || !service.cancel_transfer(session_id))
                                    {
                                        signals_context_.stop();
                                    } });
            signals_context_.run();
            std::lock_guard lock(mutex_);
            return outcome_;
        }

        std::string error_message() const
        {
            std::lock_guard lock(mutex_);
            return error_message_;
        }

    private:
        void print_progress(const Notification &notification)
        {
            if (!notification.progress || notification.progress->percent == last_percent_)
            {
                return;
            }
            last_percent_ = notification.progress->percent;
            const auto &sample = *notification.progress;
            std::cout << "\r" << sample.percent << "% "
                      << lanxfer::engine::progress::format_size(static_cast<double>(sample.transferred_size)) << " / "
                      << lanxfer::engine::progress::format_size(static_cast<double>(sample.total_size)) << "  "
                      << sample.speed << "   " << std::flush;
        }

        void finish(NotificationKind kind, std::string message)
        {
            {
                std::lock_guard lock(mutex_);
                if (outcome_)
                {
                    return;
                }
                outcome_ = kind;
                error_message_ = std::move(message);
            }
            signals_context_.stop();
        }

        Role role_;
        asio::io_context signals_context_;
        asio::signal_set signals_;

        mutable std::mutex mutex_;
        std::string session_id_;
        std::optional<NotificationKind> outcome_;
        std::string error_message_;
        unsigned last_percent_{101};
    };

    void print_digests(const std::vector<std::filesystem::path> &files, const std::filesystem::path &base)
    {
        for (const auto &file : files)
        {
            std::error_code ec;
            const auto shown = base.empty() ? file : std::filesystem::relative(file, base, ec);
            std::cout << lanxfer::crypto::hash_file(file) << "  " << (ec ? file : shown).generic_string() << "\n";
        }
        std::cout << std::flush;
    }

    int report(const std::optional<NotificationKind> &outcome, const std::string &message)
    {
        if (outcome == NotificationKind::TransferCompleted)
        {
            return EXIT_SUCCESS;
        }
        if (outcome == NotificationKind::TransferError)
        {
            std::cerr << "\nTransfer failed: " << message << std::endl;
        }
        else
        {
            std::cerr << "\nTransfer cancelled" << std::endl;
        }
        return EXIT_FAILURE;
    }

    int run_send(const lanxfer::cli::CliConfig &config)
    {
        // Declared first so it outlives the service's final notifications.
        TransferWatch watch(Role::Send);
        lanxfer::engine::TransferService service(config.transfer);
        service.notifier().subscribe_all([&watch](const Notification &notification)
                                         { watch.on_notification(notification); });

        const auto port = service.start();
        const auto code = config.pairing_code.value_or(lanxfer::engine::TransferService::generate_pairing_code());
        const auto prepared = service.prepare_to_send(config.paths, code);
        watch.attach(prepared.session_id);

        const auto device = service.get_device_info();
        std::cout << "Offering " << prepared.files.size() << " entries ("
                  << lanxfer::engine::progress::format_size(static_cast<double>(prepared.total_size)) << ")\n"
                  << "Device:       " << device.device_name << "\n"
                  << "Port:         " << port << "\n"
                  << "Pairing code: " << code << std::endl;

        const auto outcome = watch.wait(service);
        const auto status = report(outcome, watch.error_message());
        if (status == EXIT_SUCCESS && config.verify)
        {
            const auto manifest = lanxfer::engine::build_manifest(config.paths);
            std::vector<std::filesystem::path> files;
            for (std::size_t i = 0; i < manifest.files.size(); ++i)
            {
                if (!manifest.files[i].is_directory)
                {
                    files.push_back(manifest.sources[i]);
                }
            }
            print_digests(files, {});
        }
        service.stop();
        return status;
    }

    int run_receive(const lanxfer::cli::CliConfig &config)
    {
        TransferWatch watch(Role::Receive);
        lanxfer::engine::TransferService service(config.transfer);
        service.notifier().subscribe_all([&watch](const Notification &notification)
                                         { watch.on_notification(notification); });

        service.start();
        auto pending = service.request_files(config.peer_host, config.peer_port, config.pairing_code.value_or(""),
                                             config.save_path);
        std::string session_id;
        try
        {
            session_id = pending.get();
        }
        catch (const lanxfer::TransferError &ex)
        {
            std::cerr << "Request failed (" << lanxfer::to_string(ex.code()) << "): " << ex.what() << std::endl;
            service.stop();
            return EXIT_FAILURE;
        }
        watch.attach(session_id);
        std::cout << "Receiving into " << config.save_path.string() << std::endl;

        const auto outcome = watch.wait(service);
        const auto status = report(outcome, watch.error_message());
        if (status == EXIT_SUCCESS && config.verify)
        {
            std::vector<std::filesystem::path> files;
            if (const auto session = service.get_session(session_id))
            {
                for (const auto &entry : session->files)
                {
                    if (!entry.is_directory)
                    {
                        files.push_back(config.save_path / entry.relative_path);
                    }
                }
            }
            print_digests(files, config.save_path);
        }
        service.stop();
        return status;
    }

} // namespace

int main(int argc, char *argv[])
{
    lanxfer::cli::CliConfig config;
    try
    {
        config = lanxfer::cli::parse_arguments(argc, argv);
    }
    catch (const std::exception &ex)
    {
        std::cerr << ex.what() << "\n"
                  << lanxfer::cli::usage(argv[0]);
        return EXIT_FAILURE;
    }

    try
    {
        lanxfer::cli::configure_logging(config.log_path, config.verbose);
        spdlog::info("lanxfer {}", lanxfer::version());

        switch (config.command)
        {
        case lanxfer::cli::Command::Help:
            std::cout << "lanxfer " << lanxfer::version() << "\n"
                      << lanxfer::cli::usage(argv[0]);
            return EXIT_SUCCESS;
        case lanxfer::cli::Command::Code:
            std::cout << lanxfer::engine::TransferService::generate_pairing_code() << std::endl;
            return EXIT_SUCCESS;
        case lanxfer::cli::Command::Info:
        {
            const lanxfer::engine::TransferService service(config.transfer);
            const auto device = service.get_device_info();
            std::cout << "Device id:   " << device.device_id << "\n"
                      << "Device name: " << device.device_name << "\n"
                      << "Port:        " << device.port << std::endl;
            return EXIT_SUCCESS;
        }
        case lanxfer::cli::Command::Send:
            return run_send(config);
        case lanxfer::cli::Command::Receive:
            return run_receive(config);
        }
    }
    catch (const lanxfer::TransferError &ex)
    {
        std::cerr << "Error (" << lanxfer::to_string(ex.code()) << "): " << ex.what() << std::endl;
        spdlog::error("Fatal error: {}", ex.what());
        return EXIT_FAILURE;
    }
    catch (const std::exception &ex)
    {
        std::cerr << "Error: " << ex.what() << std::endl;
        spdlog::error("Fatal error: {}", ex.what());
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
