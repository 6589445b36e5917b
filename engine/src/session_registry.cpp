#include "lanxfer/engine/session_registry.hpp"

#include <algorithm>

namespace lanxfer::engine
{

    void SessionRegistry::add(const std::shared_ptr<Session> &session)
    {
        std::lock_guard lock(mutex_);
        auto [it, inserted] = by_id_.emplace(session->id, session);
        if (!inserted)
        {
            // Same id registered again replaces the older entry in place.
            auto ordered_it = std::find(ordered_.begin(), ordered_.end(), it->second);
            if (ordered_it != ordered_.end())
            {
                *ordered_it = session;
            }
            it->second = session;
            return;
        }
        ordered_.push_back(session);
    }

    std::shared_ptr<Session> SessionRegistry::find(const std::string &session_id) const
    {
        std::lock_guard lock(mutex_);
        auto it = by_id_.find(session_id);
        if (it == by_id_.end())
        {
            return nullptr;
        }
        return it->second;
    }

    std::shared_ptr<Session> SessionRegistry::find_first(SessionStatus status, Role role,
                                                         const std::string &pairing_code) const
    {
        std::lock_guard lock(mutex_);
        return find_first_locked(status, role, pairing_code);
    }

    std::shared_ptr<Session> SessionRegistry::bind_waiting_sender(const std::string &pairing_code,
                                                                  const std::function<void(Session &)> &bind)
    {
        std::lock_guard lock(mutex_);
        auto session = find_first_locked(SessionStatus::Waiting, Role::Send, pairing_code);
        if (session)
        {
            bind(*session);
        }
        return session;
    }

    std::shared_ptr<Session> SessionRegistry::remove(const std::string &session_id)
    {
        std::lock_guard lock(mutex_);
        auto it = by_id_.find(session_id);
        if (it == by_id_.end())
        {
            return nullptr;
        }
        auto session = it->second;
        by_id_.erase(it);
        ordered_.erase(std::remove(ordered_.begin(), ordered_.end(), session), ordered_.end());
        return session;
    }

    std::vector<std::shared_ptr<Session>> SessionRegistry::all() const
    {
        std::lock_guard lock(mutex_);
        return ordered_;
    }

    std::vector<std::shared_ptr<Session>> SessionRegistry::clear()
    {
        std::lock_guard lock(mutex_);
        std::vector<std::shared_ptr<Session>> removed;
        removed.swap(ordered_);
        by_id_.clear();
        return removed;
    }

    std::size_t SessionRegistry::size() const
    {
        std::lock_guard lock(mutex_);
        return ordered_.size();
    }

    std::shared_ptr<Session> SessionRegistry::find_first_locked(SessionStatus status, Role role,
                                                                const std::string &pairing_code) const
    {
        auto it = std::find_if(ordered_.begin(), ordered_.end(),
                               [&](const std::shared_ptr<Session> &session)
                               {
                                   return session->status == status && session->role == role &&
                                          session->pairing_code == pairing_code;
                               });
        return it == ordered_.end() ? nullptr : *it;
    }

} // namespace lanxfer::engine
