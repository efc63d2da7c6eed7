#pragma once

#include <deque>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "relay/common/messages.hpp"

namespace relay::server
{
    inline constexpr size_t kMaxMessageHistory = 100;

    // scope keys; a conversation key does not depend on argument order
    std::string room_scope(const std::string& room);
    std::string conversation_scope(const std::string& user_a, const std::string& user_b);

    // message history collaborator consumed by the router
    class HistoryStore
    {
    public:
        virtual ~HistoryStore() = default;

        virtual void append(const std::string& scope, const Envelope& msg) = 0;
        virtual std::vector<Envelope> history(const std::string& scope) const = 0;
    };

    // in-memory history keeping the newest `limit` messages per scope
    class MessageHistory : public HistoryStore
    {
    public:
        explicit MessageHistory(size_t limit = kMaxMessageHistory);

        void append(const std::string& scope, const Envelope& msg) override;
        std::vector<Envelope> history(const std::string& scope) const override;

    private:
        const size_t limit_;
        std::unordered_map<std::string, std::deque<Envelope>> scopes_;
        mutable std::mutex mutex_;
    };
} // namespace relay::server
