#include "relay/common/events.hpp"

namespace relay
{
    Envelope make_event(const RoomEvent event, const std::string& username, const std::string& room,
                        const std::string& extra)
    {
        std::string content;
        switch (event) {
            case RoomEvent::USER_JOINED:
                content = username + " has joined the room";
                break;
            case RoomEvent::USER_LEFT:
                content = username + " has left the room";
                break;
            case RoomEvent::USER_DISCONNECTED:
                content = username + " has disconnected from the server";
                break;
            case RoomEvent::FILE_UPLOADED:
                content = "File " + extra + " uploaded by " + username + " is available";
                break;
            case RoomEvent::FILE_SENDING:
                content = username + " is sending file: " + extra;
                break;
            case RoomEvent::STATUS_CHANGE:
                content = username + " is now " + extra;
                break;
        }

        Envelope msg;
        msg.type         = MessageType::TEXT;
        msg.content      = std::move(content);
        msg.sender       = kServerSender;
        msg.room         = room;
        msg.timestamp_ms = now_ms();
        return msg;
    }
} // namespace relay
