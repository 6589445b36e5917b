#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "lanxfer/engine/session.hpp"

namespace lanxfer::engine
{

    class SessionRegistry
    {
    public:
        void add(const std::shared_ptr<Session> &session);

        std::shared_ptr<Session> find(const std::string &session_id) const;

        /// First session in insertion order matching all three keys.
        std::shared_ptr<Session> find_first(SessionStatus status, Role role, const std::string &pairing_code) const;

        // Scan for a waiting send session with this code and run bind on it
        // under the registry lock, so concurrent requests resolve first-match-wins.
        std::shared_ptr<Session> bind_waiting_sender(const std::string &pairing_code,
                                                     const std::function<void(Session &)> &bind);

        std::shared_ptr<Session> remove(const std::string &session_id);

        std::vector<std::shared_ptr<Session>> all() const;

        std::vector<std::shared_ptr<Session>> clear();

        std::size_t size() const;

    private:
        std::shared_ptr<Session> find_first_locked(SessionStatus status, Role role,
                                                   const std::string &pairing_code) const;

        mutable std::mutex mutex_;
        std::vector<std::shared_ptr<Session>> ordered_;
        std::unordered_map<std::string, std::shared_ptr<Session>> by_id_;
    };

} // namespace lanxfer::engine
