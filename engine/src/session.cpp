#include "lanxfer/engine/session.hpp"

#include <algorithm>
#include <utility>

#include "lanxfer/engine/connection.hpp"

namespace lanxfer::engine
{

    std::string_view to_string(Role role) noexcept
    {
        return role == Role::Send ? "send" : "receive";
    }

    std::string_view to_string(SessionStatus status) noexcept
    {
        switch (status)
        {
        case SessionStatus::Waiting:
            return "waiting";
        case SessionStatus::Transferring:
            return "transferring";
        case SessionStatus::Completed:
            return "completed";
        case SessionStatus::Failed:
            return "failed";
        case SessionStatus::Cancelled:
            return "cancelled";
        }
        return "unknown";
    }

    Session::Session(std::string session_id, Role session_role, SessionStatus initial_status)
        : id(std::move(session_id)), role(session_role), status(initial_status)
    {
        if (role == Role::Send)
        {
            sender_session_id = id;
        }
        else
        {
            receiver_session_id = id;
        }
        if (status == SessionStatus::Transferring)
        {
            start_time = Clock::now();
        }
    }

    bool Session::transition(SessionStatus next)
    {
        if (terminal() || next == status)
        {
            return false;
        }
        switch (next)
        {
        case SessionStatus::Waiting:
            return false;
        case SessionStatus::Transferring:
            if (status != SessionStatus::Waiting)
            {
                return false;
            }
            start_time = Clock::now();
            break;
        case SessionStatus::Completed:
            if (status != SessionStatus::Transferring)
            {
                return false;
            }
            break;
        case SessionStatus::Failed:
        case SessionStatus::Cancelled:
            break;
        }
        status = next;
        return true;
    }

    std::chrono::milliseconds Session::elapsed(Clock::time_point now) const
    {
        if (!start_time)
        {
            return std::chrono::milliseconds{0};
        }
        return std::chrono::duration_cast<std::chrono::milliseconds>(now - *start_time);
    }

    std::size_t Session::regular_file_count() const noexcept
    {
        return static_cast<std::size_t>(std::count_if(files.begin(), files.end(),
                                                      [](const protocol::FileEntry &entry)
                                                      { return !entry.is_directory; }));
    }

    void Session::close_current_file()
    {
        if (current_file)
        {
            current_file->stream.close();
            current_file.reset();
        }
    }

    SessionSnapshot snapshot(const Session &session)
    {
        SessionSnapshot result{
            .id = session.id,
            .role = session.role,
            .status = session.status,
            .pairing_code = session.pairing_code,
            .sender_session_id = session.sender_session_id,
            .receiver_session_id = session.receiver_session_id,
            .peer_id = session.peer_id,
            .peer_name = session.peer_name,
            .peer_address = session.peer_address,
            .files = session.files,
            .total_size = session.total_size,
            .transferred_size = session.transferred_size,
            .save_path = session.save_path,
            .current_file = std::nullopt,
            .connected = session.connection && session.connection->is_open(),
            .elapsed = session.elapsed(),
        };
        if (session.current_file)
        {
            result.current_file = session.current_file->path;
        }
        return result;
    }

} // namespace lanxfer::engine
