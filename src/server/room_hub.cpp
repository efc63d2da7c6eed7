#include "relay/server/room_hub.hpp"

#include <iostream>
#include <stdexcept>

#include "relay/common/protocol.hpp"

namespace relay::server
{
    // Room
    Room::Room(std::string name)
        : name_(std::move(name))
    {
    }

    void Room::add(const std::shared_ptr<Session>& session)
    {
        std::unique_lock lock(members_mutex_);
        members_[session->id()] = session;
    }

    bool Room::remove(const std::shared_ptr<Session>& session)
    {
        std::unique_lock lock(members_mutex_);
        return members_.erase(session->id()) > 0;
    }

    bool Room::contains(const Session::Id id) const
    {
        std::shared_lock lock(members_mutex_);
        return members_.contains(id);
    }

    size_t Room::member_count() const
    {
        std::shared_lock lock(members_mutex_);
        return members_.size();
    }

    size_t Room::broadcast(const Envelope& msg, const std::shared_ptr<Session>& exclude) const
    {
        return broadcast_packet(Protocol::encode(msg), exclude);
    }

    size_t Room::broadcast_packet(const Session::Packet& packet, const std::shared_ptr<Session>& exclude) const
    {
        std::shared_lock lock(members_mutex_);

        // an overflowing member is evicted by its own send(); the others are unaffected
        size_t delivered = 0;
        for (const auto& [id, session] : members_) {
            if (exclude && id == exclude->id())
                continue;
            if (session->send(packet))
                ++delivered;
        }

        return delivered;
    }

    FileAssembler::Result Room::accept_chunk(const FileChunk& chunk)
    {
        std::lock_guard<std::mutex> lock(transfers_mutex_);
        return assembler_.accept(chunk);
    }

    size_t Room::discard_transfers(const std::string& sender)
    {
        std::lock_guard<std::mutex> lock(transfers_mutex_);
        return assembler_.discard(sender);
    }

    size_t Room::pending_transfers() const
    {
        std::lock_guard<std::mutex> lock(transfers_mutex_);
        return assembler_.pending_transfers();
    }


    // RoomHub
    RoomHub::RoomHub()
    {
        rooms_.emplace(kDefaultRoom, std::make_shared<Room>(kDefaultRoom));
    }

    std::pair<std::shared_ptr<Room>, bool> RoomHub::create_or_get(const std::string& name)
    {
        if (name.empty())
            throw std::invalid_argument("Room name must not be empty");

        std::unique_lock lock(mutex_);
        if (const auto it = rooms_.find(name); it != rooms_.end())
            return {it->second, false};

        auto room = std::make_shared<Room>(name);
        rooms_.emplace(name, room);
        return {room, true};
    }

    std::shared_ptr<Room> RoomHub::find(const std::string& name) const
    {
        std::shared_lock lock(mutex_);
        if (const auto it = rooms_.find(name); it != rooms_.end())
            return it->second;
        return nullptr;
    }

    RoomHub::JoinResult RoomHub::join(const std::shared_ptr<Session>& session, const std::shared_ptr<Room>& room)
    {
        std::lock_guard<std::mutex> membership(session->membership_mutex());

        // teardown may already be queued for this session
        if (session->is_closed())
            return JoinResult::SESSION_CLOSED;

        const auto current = session->current_room();
        if (room->contains(session->id()))
            return JoinResult::ALREADY_MEMBER;

        const auto username = session->username();

        if (current.has_value()) {
            session->set_current_room(std::nullopt);
            if (const auto old_room = find(*current)) {
                old_room->remove(session);
                old_room->discard_transfers(username);
                old_room->broadcast(make_event(RoomEvent::USER_LEFT, username, old_room->name()));
            }
        }

        room->add(session);
        session->set_current_room(room->name());
        room->broadcast(make_event(RoomEvent::USER_JOINED, username, room->name()));

        std::cout << "User '" << username << "' joined room " << room->name() << " (" << room->member_count()
            << " members)" << std::endl;
        return JoinResult::JOINED;
    }

    std::optional<std::string> RoomHub::leave(const std::shared_ptr<Session>& session, const RoomEvent departure)
    {
        std::lock_guard<std::mutex> membership(session->membership_mutex());

        const auto current = session->current_room();
        if (!current.has_value())
            return std::nullopt;

        session->set_current_room(std::nullopt);

        if (const auto room = find(*current)) {
            const auto username = session->username();
            room->remove(session);
            if (const auto dropped = room->discard_transfers(username); dropped > 0)
                std::cout << "Discarded " << dropped << " unfinished upload(s) from " << username << " in room "
                    << room->name() << std::endl;
            room->broadcast(make_event(departure, username, room->name()));
        }

        return current;
    }

    size_t RoomHub::broadcast(const std::string& room, const Envelope& msg,
                              const std::shared_ptr<Session>& exclude) const
    {
        if (const auto target = find(room))
            return target->broadcast(msg, exclude);
        return 0;
    }

    std::set<std::string> RoomHub::list_rooms() const
    {
        std::shared_lock lock(mutex_);

        std::set<std::string> names;
        for (const auto& [name, room] : rooms_)
            names.insert(name);
        return names;
    }
} // namespace relay::server
