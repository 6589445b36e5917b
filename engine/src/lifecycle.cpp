#include "lanxfer/engine/lifecycle.hpp"

#include <exception>

#include <spdlog/spdlog.h>

#include "lanxfer/engine/progress.hpp"

namespace lanxfer::engine
{

    namespace
    {
        void settle_pending_request(Session &session, ErrorCode code, const std::string &message)
        {
            if (!session.pending_request)
            {
                return;
            }
            auto promise = std::move(session.pending_request);
            promise->set_exception(std::make_exception_ptr(TransferError(code, message)));
        }
    } // namespace

    Notification make_notification(NotificationKind kind, const Session &session)
    {
        Notification notification;
        notification.kind = kind;
        notification.session_id = session.id;
        notification.role = session.role;
        notification.total_size = session.total_size;
        notification.pairing_code = session.pairing_code;
        notification.peer_name = session.peer_name;
        notification.duration = session.elapsed();
        return notification;
    }

    bool SessionLifecycle::complete(Session &session)
    {
        if (!session.transition(SessionStatus::Completed))
        {
            return false;
        }
        session.close_current_file();
        spdlog::info("Session {} completed: {} bytes in {} ms", session.id, session.transferred_size,
                     session.elapsed().count());

        auto notification = make_notification(NotificationKind::TransferCompleted, session);
        notification.files = session.files;
        notifier_.publish(notification);
        return true;
    }

    bool SessionLifecycle::fail(Session &session, ErrorCode code, const std::string &message)
    {
        if (!session.transition(SessionStatus::Failed))
        {
            return false;
        }
        session.close_current_file();
        spdlog::error("Session {} failed ({}): {}", session.id, to_string(code), message);
        settle_pending_request(session, code, message);

        auto notification = make_notification(NotificationKind::TransferError, session);
        notification.message = message;
        notifier_.publish(notification);
        return true;
    }

    bool SessionLifecycle::cancel(Session &session)
    {
        if (!session.transition(SessionStatus::Cancelled))
        {
            return false;
        }
        session.close_current_file();
        spdlog::info("Session {} cancelled", session.id);
        settle_pending_request(session, ErrorCode::Cancelled, "Transfer cancelled");
        notifier_.publish(make_notification(NotificationKind::TransferCancelled, session));
        return true;
    }

    void SessionLifecycle::publish(NotificationKind kind, const Session &session) const
    {
        auto notification = make_notification(kind, session);
        if (kind == NotificationKind::TransferWaiting || kind == NotificationKind::TransferStarted)
        {
            notification.files = session.files;
        }
        notifier_.publish(notification);
    }

    void SessionLifecycle::publish_progress(const Session &session) const
    {
        auto notification = make_notification(NotificationKind::TransferProgress, session);
        notification.progress = progress::sample(session);
        notifier_.publish(notification);
    }

} // namespace lanxfer::engine
