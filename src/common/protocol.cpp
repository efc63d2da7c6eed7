#include "relay/common/protocol.hpp"

namespace relay
{
    namespace
    {
        template <class T>
        T decode_tagged(const MessageType type, const std::vector<uint8_t>& payload)
        {
            auto msg = Protocol::decode<T>(payload);
            msg.type = type;
            return msg;
        }
    }

    InboundMessage Protocol::decode_inbound(const MessageType type, const std::vector<uint8_t>& payload)
    {
        if (!is_known_message_type(static_cast<uint16_t>(type)))
            throw ProtocolError("Unknown message type: " + std::to_string(static_cast<uint16_t>(type)));

        switch (type) {
            case MessageType::TEXT:
            case MessageType::COMMAND:
            case MessageType::DIRECT:
            case MessageType::ENCRYPTED:
                return decode_tagged<Envelope>(type, payload);
            case MessageType::FILE:
                return decode_tagged<FileChunk>(type, payload);
            case MessageType::AUTH:
                return decode_tagged<AuthRequest>(type, payload);
            case MessageType::STATUS: {
                auto update = decode_tagged<StatusUpdate>(type, payload);
                if (static_cast<uint8_t>(update.status) > static_cast<uint8_t>(UserStatus::OFFLINE))
                    throw ProtocolError("Invalid status value");
                return update;
            }
        }

        throw ProtocolError("Unknown message type: " + std::to_string(static_cast<uint16_t>(type)));
    }

    Envelope make_reply(const std::string& prefix, const std::string& text)
    {
        Envelope reply;
        reply.type         = MessageType::COMMAND;
        reply.content      = prefix + text;
        reply.sender       = kServerSender;
        reply.timestamp_ms = now_ms();
        return reply;
    }
} // namespace relay
