#pragma once

#include <string>
#include <chrono>
#include <optional>
#include <cstdint>

namespace relay
{
#pragma pack(push, 1)
    struct MsgHeader
    {
        uint16_t type; // MessageType
        uint32_t size; // payload size in bytes
    };
#pragma pack(pop)

    enum class MessageType : uint16_t
    {
        TEXT,      // room message
        COMMAND,   // command request or server reply
        FILE,      // one chunk of a file transfer
        AUTH,      // login or registration
        DIRECT,    // user to user message
        STATUS,    // presence update
        ENCRYPTED  // opaque user to user payload
    };

    enum class UserStatus : uint8_t
    {
        ONLINE,
        AWAY,
        BUSY,
        OFFLINE
    };

    inline constexpr const char* kServerSender = "Server";

    [[nodiscard]] bool is_known_message_type(uint16_t raw);

    std::string message_type_to_string(MessageType type);

    std::string user_status_to_string(UserStatus status);
    std::optional<UserStatus> parse_user_status(const std::string& str);

    inline int64_t now_ms()
    {
        const auto duration = std::chrono::system_clock::now().time_since_epoch();
        return std::chrono::duration_cast<std::chrono::milliseconds>(duration).count();
    }
} // namespace relay
