#include "relay/server/history.hpp"

namespace relay::server
{
    std::string room_scope(const std::string& room)
    {
        return "room:" + room;
    }

    std::string conversation_scope(const std::string& user_a, const std::string& user_b)
    {
        if (user_a < user_b)
            return "dm:" + user_a + ":" + user_b;
        return "dm:" + user_b + ":" + user_a;
    }

    MessageHistory::MessageHistory(const size_t limit)
        : limit_(limit)
    {
    }

    void MessageHistory::append(const std::string& scope, const Envelope& msg)
    {
        if (limit_ == 0)
            return;

        std::lock_guard<std::mutex> lock(mutex_);
        auto& messages = scopes_[scope];
        messages.push_back(msg);

        // keep only last limit_ messages
        while (messages.size() > limit_)
            messages.pop_front();
    }

    std::vector<Envelope> MessageHistory::history(const std::string& scope) const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (const auto it = scopes_.find(scope); it != scopes_.end())
            return {it->second.begin(), it->second.end()};
        return {};
    }
} // namespace relay::server
