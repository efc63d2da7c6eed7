#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "relay/server/session.hpp"

namespace relay::server
{
    /**
     * username -> active session, at most one session per username.
     *
     * Registrations are serialized end to end: an existing session for the
     * same username is evicted through the supplied callback before the new
     * one is installed. Removal only clears an entry that still points at the
     * given session, so a late cleanup of an evicted session never drops its
     * replacement.
     */
    class Directory
    {
    public:
        using EvictHandler = std::function<void(const std::shared_ptr<Session>&)>;

        Directory() = default;

        // returns the evicted session, if any
        std::shared_ptr<Session> register_session(const std::string& username,
                                                  const std::shared_ptr<Session>& session,
                                                  const EvictHandler& evict);

        [[nodiscard]] std::shared_ptr<Session> lookup(const std::string& username) const;

        // true if the entry belonged to `session` and was cleared
        bool remove(const std::string& username, const std::shared_ptr<Session>& session);

        [[nodiscard]] bool contains(const std::string& username) const;
        [[nodiscard]] std::vector<std::string> usernames() const;
        [[nodiscard]] size_t size() const;

    private:
        std::unordered_map<std::string, std::shared_ptr<Session>> sessions_;
        mutable std::mutex mutex_;
        std::mutex registration_mutex_;
    };
} // namespace relay::server
