#include "lanxfer/engine/notifier.hpp"

#include <algorithm>
#include <array>
#include <utility>

#include <spdlog/spdlog.h>

namespace lanxfer::engine
{

    namespace
    {
        struct KindMapping
        {
            NotificationKind kind;
            std::string_view label;
        };

        constexpr std::array<KindMapping, 9> kKindMappings{{
            {NotificationKind::TransferWaiting, "transfer-waiting"},
            {NotificationKind::TransferConnected, "transfer-connected"},
            {NotificationKind::TransferStarted, "transfer-started"},
            {NotificationKind::TransferProgress, "transfer-progress"},
            {NotificationKind::TransferCompleted, "transfer-completed"},
            {NotificationKind::TransferError, "transfer-error"},
            {NotificationKind::TransferCancelled, "transfer-cancelled"},
            {NotificationKind::FileReady, "file-ready"},
            {NotificationKind::FileSent, "file-sent"},
        }};
    } // namespace

    std::string_view to_string(NotificationKind kind) noexcept
    {
        for (const auto &mapping : kKindMappings)
        {
            if (mapping.kind == kind)
            {
                return mapping.label;
            }
        }
        return "unknown";
    }

    Notifier::SubscriptionId Notifier::subscribe(NotificationKind kind, Callback callback)
    {
        return add(Subscription{.kind = kind, .session_id = std::nullopt, .callback = std::move(callback)});
    }

    Notifier::SubscriptionId Notifier::subscribe_session(std::string session_id, Callback callback)
    {
        return add(Subscription{.kind = std::nullopt, .session_id = std::move(session_id), .callback = std::move(callback)});
    }

    Notifier::SubscriptionId Notifier::subscribe_all(Callback callback)
    {
        return add(Subscription{.kind = std::nullopt, .session_id = std::nullopt, .callback = std::move(callback)});
    }

    void Notifier::unsubscribe(SubscriptionId id)
    {
        std::lock_guard lock(mutex_);
        subscriptions_.erase(std::remove_if(subscriptions_.begin(), subscriptions_.end(),
                                            [id](const Subscription &subscription)
                                            { return subscription.id == id; }),
                             subscriptions_.end());
    }

    void Notifier::publish(const Notification &notification) const
    {
        std::vector<Callback> targets;
        {
            std::lock_guard lock(mutex_);
            for (const auto &subscription : subscriptions_)
            {
                if (subscription.kind && *subscription.kind != notification.kind)
                {
                    continue;
                }
                if (subscription.session_id && *subscription.session_id != notification.session_id)
                {
                    continue;
                }
                targets.push_back(subscription.callback);
            }
        }

        spdlog::debug("{} for session {}", to_string(notification.kind), notification.session_id);
        for (const auto &callback : targets)
        {
            try
            {
                callback(notification);
            }
            catch (const std::exception &ex)
            {
                spdlog::error("Subscriber for {} threw: {}", to_string(notification.kind), ex.what());
            }
        }
    }

    Notifier::SubscriptionId Notifier::add(Subscription subscription)
    {
        std::lock_guard lock(mutex_);
        subscription.id = next_id_++;
        subscriptions_.push_back(std::move(subscription));
        return subscriptions_.back().id;
    }

} // namespace lanxfer::engine
