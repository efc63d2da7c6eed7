#include <algorithm>
#include <cctype>
#include <stdexcept>

#include "relay/common/types.hpp"

namespace relay
{
    bool is_known_message_type(const uint16_t raw)
    {
        return raw <= static_cast<uint16_t>(MessageType::ENCRYPTED);
    }

    std::string message_type_to_string(const MessageType type)
    {
        switch (type)
        {
            case MessageType::TEXT: return "TEXT";
            case MessageType::COMMAND: return "COMMAND";
            case MessageType::FILE: return "FILE";
            case MessageType::AUTH: return "AUTH";
            case MessageType::DIRECT: return "DIRECT";
            case MessageType::STATUS: return "STATUS";
            case MessageType::ENCRYPTED: return "ENCRYPTED";
        }
        throw std::runtime_error("Unknown message type");
    }

    std::string user_status_to_string(const UserStatus status)
    {
        switch (status)
        {
            case UserStatus::ONLINE: return "online";
            case UserStatus::AWAY: return "away";
            case UserStatus::BUSY: return "busy";
            case UserStatus::OFFLINE: return "offline";
        }
        throw std::runtime_error("Unknown user status");
    }

    std::optional<UserStatus> parse_user_status(const std::string& str)
    {
        std::string lower(str);
        std::ranges::transform(lower, lower.begin(), [](const unsigned char c) {
            return static_cast<char>(std::tolower(c));
        });

        if (lower == "online") return UserStatus::ONLINE;
        if (lower == "away") return UserStatus::AWAY;
        if (lower == "busy") return UserStatus::BUSY;
        if (lower == "offline") return UserStatus::OFFLINE;
        return std::nullopt;
    }
} // namespace relay
