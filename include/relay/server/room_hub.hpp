#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <shared_mutex>
#include <string>
#include <utility>
#include <vector>

#include "relay/common/events.hpp"
#include "relay/common/file_transfer.hpp"
#include "relay/server/session.hpp"

namespace relay::server
{
    inline constexpr const char* kDefaultRoom = "general";

    /**
     * Named broadcast group. Members are referenced, not owned: a session
     * stays alive until its teardown removes it here. Lock sections only
     * enqueue to outbound queues, they never touch a socket.
     */
    class Room
    {
    public:
        explicit Room(std::string name);

        [[nodiscard]] const std::string& name() const { return name_; }

        void add(const std::shared_ptr<Session>& session);
        bool remove(const std::shared_ptr<Session>& session);

        [[nodiscard]] bool contains(Session::Id id) const;
        [[nodiscard]] size_t member_count() const;

        // enqueue to every member except `exclude`; returns the number of successful deliveries
        size_t broadcast(const Envelope& msg, const std::shared_ptr<Session>& exclude = nullptr) const;
        size_t broadcast_packet(const Session::Packet& packet, const std::shared_ptr<Session>& exclude = nullptr) const;

        FileAssembler::Result accept_chunk(const FileChunk& chunk);
        // partial uploads are dropped when their sender leaves the room
        size_t discard_transfers(const std::string& sender);
        [[nodiscard]] size_t pending_transfers() const;

    private:
        const std::string name_;

        std::map<Session::Id, std::shared_ptr<Session>> members_;
        mutable std::shared_mutex members_mutex_;

        FileAssembler assembler_;
        mutable std::mutex transfers_mutex_;
    };

    class RoomHub
    {
    public:
        enum class JoinResult
        {
            JOINED,
            ALREADY_MEMBER,
            SESSION_CLOSED
        };

        RoomHub();

        // idempotent; the flag is true if this call created the room
        std::pair<std::shared_ptr<Room>, bool> create_or_get(const std::string& name);
        [[nodiscard]] std::shared_ptr<Room> find(const std::string& name) const;

        /**
         * Move a session into `room`. If it is in another room it is removed
         * there first and a departure event is broadcast to that room, then an
         * arrival event is broadcast to the new one.
         */
        JoinResult join(const std::shared_ptr<Session>& session, const std::shared_ptr<Room>& room);

        // returns the room that was left, if the session was in one
        std::optional<std::string> leave(const std::shared_ptr<Session>& session,
                                         RoomEvent departure = RoomEvent::USER_LEFT);

        size_t broadcast(const std::string& room, const Envelope& msg,
                         const std::shared_ptr<Session>& exclude = nullptr) const;

        [[nodiscard]] std::set<std::string> list_rooms() const;

    private:
        std::map<std::string, std::shared_ptr<Room>> rooms_;
        mutable std::shared_mutex mutex_;
    };
} // namespace relay::server
