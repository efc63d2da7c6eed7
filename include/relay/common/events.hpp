#pragma once

#include <string>

#include "relay/common/messages.hpp"

namespace relay
{
    enum class RoomEvent
    {
        USER_JOINED,
        USER_LEFT,
        USER_DISCONNECTED,
        FILE_UPLOADED,
        FILE_SENDING,
        STATUS_CHANGE
    };

    // room-scoped lifecycle notification sent as a Text envelope from the server
    Envelope make_event(RoomEvent event, const std::string& username, const std::string& room,
                        const std::string& extra = "");
} // namespace relay
