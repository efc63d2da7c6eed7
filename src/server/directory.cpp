#include "relay/server/directory.hpp"

#include <algorithm>
#include <iostream>

namespace relay::server
{
    std::shared_ptr<Session> Directory::register_session(const std::string& username,
                                                         const std::shared_ptr<Session>& session,
                                                         const EvictHandler& evict)
    {
        std::lock_guard<std::mutex> registration(registration_mutex_);

        std::shared_ptr<Session> previous;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (const auto it = sessions_.find(username); it != sessions_.end() && it->second != session)
                previous = it->second;
        }

        // evict outside the map lock; the callback may call back into remove()
        if (previous) {
            std::cout << "Evicting previous session for '" << username << "'" << std::endl;
            if (evict)
                evict(previous);
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            sessions_[username] = session;
        }

        return previous;
    }

    std::shared_ptr<Session> Directory::lookup(const std::string& username) const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (const auto it = sessions_.find(username); it != sessions_.end())
            return it->second;
        return nullptr;
    }

    bool Directory::remove(const std::string& username, const std::shared_ptr<Session>& session)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (const auto it = sessions_.find(username); it != sessions_.end() && it->second == session) {
            sessions_.erase(it);
            return true;
        }
        return false;
    }

    bool Directory::contains(const std::string& username) const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return sessions_.contains(username);
    }

    std::vector<std::string> Directory::usernames() const
    {
        std::vector<std::string> names;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            names.reserve(sessions_.size());
            for (const auto& [username, session] : sessions_)
                names.push_back(username);
        }

        std::ranges::sort(names);
        return names;
    }

    size_t Directory::size() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return sessions_.size();
    }
} // namespace relay::server
