#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "lanxfer/engine/progress.hpp"
#include "lanxfer/engine/session.hpp"
#include "lanxfer/protocol.hpp"

namespace lanxfer::engine
{

    enum class NotificationKind : std::uint8_t
    {
        TransferWaiting,
        TransferConnected,
        TransferStarted,
        TransferProgress,
        TransferCompleted,
        TransferError,
        TransferCancelled,
        FileReady,
        FileSent
    };

    std::string_view to_string(NotificationKind kind) noexcept;

    struct Notification
    {
        NotificationKind kind{};
        std::string session_id;
        Role role{};
        std::vector<protocol::FileEntry> files;
        std::uint64_t total_size{};
        std::optional<ProgressSample> progress;
        std::chrono::milliseconds duration{};
        std::string pairing_code;
        std::string peer_name;
        std::string message;
    };

    /// Delivers notifications to subscribers filtered by kind or by session id.
    class Notifier
    {
    public:
        using Callback = std::function<void(const Notification &)>;
        using SubscriptionId = std::uint64_t;

        SubscriptionId subscribe(NotificationKind kind, Callback callback);
        SubscriptionId subscribe_session(std::string session_id, Callback callback);
        SubscriptionId subscribe_all(Callback callback);

        void unsubscribe(SubscriptionId id);

        void publish(const Notification &notification) const;

    private:
        struct Subscription
        {
            SubscriptionId id{};
            std::optional<NotificationKind> kind;
            std::optional<std::string> session_id;
            Callback callback;
        };

        SubscriptionId add(Subscription subscription);

        mutable std::mutex mutex_;
        std::vector<Subscription> subscriptions_;
        SubscriptionId next_id_{1};
    };

} // namespace lanxfer::engine
