#pragma once

#include <string>

#include "lanxfer/engine/notifier.hpp"
#include "lanxfer/engine/session.hpp"
#include "lanxfer/error_codes.hpp"

namespace lanxfer::engine
{

    /// Notification pre-filled from the session's current state.
    Notification make_notification(NotificationKind kind, const Session &session);

    // Terminal transitions plus their side effects: the open file is closed, a
    // pending request future is settled and the matching notification is published.
    // Each returns false when the session was already terminal. The connection is
    // left to the caller.
    class SessionLifecycle
    {
    public:
        explicit SessionLifecycle(Notifier &notifier) : notifier_(notifier) {}

        bool complete(Session &session);
        bool fail(Session &session, ErrorCode code, const std::string &message);
        bool cancel(Session &session);

        void publish(NotificationKind kind, const Session &session) const;
        void publish_progress(const Session &session) const;

    private:
        Notifier &notifier_;
    };

} // namespace lanxfer::engine
