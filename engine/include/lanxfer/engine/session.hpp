#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "lanxfer/protocol.hpp"

namespace lanxfer::engine
{

    class Connection;

    enum class Role : std::uint8_t
    {
        Send,
        Receive
    };

    enum class SessionStatus : std::uint8_t
    {
        Waiting,
        Transferring,
        Completed,
        Failed,
        Cancelled
    };

    std::string_view to_string(Role role) noexcept;
    std::string_view to_string(SessionStatus status) noexcept;

    constexpr bool is_terminal(SessionStatus status) noexcept
    {
        return status == SessionStatus::Completed || status == SessionStatus::Failed ||
               status == SessionStatus::Cancelled;
    }

    /// Receiver-side file being written between its file-info and file-end.
    struct CurrentFile
    {
        std::filesystem::path path;
        std::uint64_t size{};
        std::uint64_t received{};
        std::ofstream stream;
    };

    struct Session
    {
        using Clock = std::chrono::steady_clock;

        Session(std::string session_id, Role session_role, SessionStatus initial_status);

        std::string id;
        Role role;
        SessionStatus status;
        std::string pairing_code;

        // Each peer numbers sessions on its own; the socket carries the receiver's id.
        std::string sender_session_id;
        std::string receiver_session_id;

        std::string peer_id;
        std::string peer_name;
        std::string peer_address;

        std::vector<protocol::FileEntry> files;
        std::uint64_t total_size{};
        std::uint64_t transferred_size{};

        // Sender only: local source for each manifest entry.
        std::vector<std::filesystem::path> sources;
        bool stream_finished{false};
        std::size_t files_acknowledged{};

        // Receiver only.
        std::filesystem::path save_path;
        bool handshake_received{false};
        std::size_t entries_received{};
        std::size_t files_finished{};
        std::optional<CurrentFile> current_file;
        std::shared_ptr<std::promise<std::string>> pending_request;

        std::shared_ptr<Connection> connection;
        std::optional<Clock::time_point> start_time;

        bool terminal() const noexcept { return is_terminal(status); }

        /// Applies a forward transition; returns false when it is not allowed.
        bool transition(SessionStatus next);

        /// Session id carried by envelopes on this session's socket.
        const std::string &wire_session_id() const noexcept { return receiver_session_id; }

        std::chrono::milliseconds elapsed(Clock::time_point now = Clock::now()) const;

        std::size_t regular_file_count() const noexcept;

        void close_current_file();
    };

    /// Copy of the observable session state, safe to hand to other threads.
    struct SessionSnapshot
    {
        std::string id;
        Role role{};
        SessionStatus status{};
        std::string pairing_code;
        std::string sender_session_id;
        std::string receiver_session_id;
        std::string peer_id;
        std::string peer_name;
        std::string peer_address;
        std::vector<protocol::FileEntry> files;
        std::uint64_t total_size{};
        std::uint64_t transferred_size{};
        std::filesystem::path save_path;
        std::optional<std::filesystem::path> current_file;
        bool connected{};
        std::chrono::milliseconds elapsed{};
    };

    SessionSnapshot snapshot(const Session &session);

} // namespace lanxfer::engine
