#pragma once

#include <string>
#include <vector>
#include <optional>
#include <stdexcept>
#include <type_traits>

#include <utility>
#include <boost/asio.hpp>

#include "relay/common/types.hpp"
#include "relay/common/buffer.hpp"
#include "relay/common/messages.hpp"

namespace relay
{
    // a unit that was framed correctly but cannot be interpreted
    class ProtocolError : public std::runtime_error
    {
    public:
        using std::runtime_error::runtime_error;
    };

    class Protocol
    {
    public:
        template <class T>
        static std::vector<uint8_t> encode(MessageType type, const T& msg)
        {
            auto payload = serialize_object(msg);
            return make_packet(type, payload);
        }

        // envelopes carry their own tag
        template <class T>
            requires std::is_base_of_v<Envelope, T>
        static std::vector<uint8_t> encode(const T& msg)
        {
            return encode(msg.type, msg);
        }

        template <class T>
        static T decode(const std::vector<uint8_t>& payload)
        {
            return deserialize_object<T>(payload);
        }

        /**
         * Decode one inbound unit into the variant selected by its header tag.
         * @throws ProtocolError for unknown tags, invalid enum values or trailing bytes
         * @throws std::runtime_error if the payload is truncated
         */
        static InboundMessage decode_inbound(MessageType type, const std::vector<uint8_t>& payload);

    private:
        template <class T>
        static void write_field(BufferWriter& w, const T& v)
        {
            w.write(v);
        }

        static void write_field(BufferWriter& w, const std::string& v)
        {
            w.write_string(v);
        }

        template <class T>
        static void write_field(BufferWriter& w, const std::optional<T>& v)
        {
            w.write(static_cast<uint8_t>(v.has_value() ? 1 : 0));
            if (v.has_value())
                write_field(w, *v);
        }

        static void write_field(BufferWriter& w, const bool v)
        {
            w.write(static_cast<uint8_t>(v ? 1 : 0));
        }

        template <class T>
        static T read_field(BufferReader& r, std::type_identity<T>)
        {
            return r.read<T>();
        }

        static std::string read_field(BufferReader& r, std::type_identity<std::string>)
        {
            return r.read_string();
        }

        static bool read_field(BufferReader& r, std::type_identity<bool>)
        {
            const auto value = r.read<uint8_t>();
            if (value > 1)
                throw ProtocolError("Invalid boolean field");
            return value == 1;
        }

        template <class T>
        static std::optional<T> read_field(BufferReader& r, std::type_identity<std::optional<T>>)
        {
            const auto present = r.read<uint8_t>();
            if (present > 1)
                throw ProtocolError("Invalid optional field marker");
            if (present == 0)
                return std::nullopt;
            return read_field(r, std::type_identity<T>{});
        }

        template <class T>
        static std::vector<uint8_t> serialize_object(const T& obj)
        {
            BufferWriter w;

            std::apply([&](auto const&... fields)
            {
                (write_field(w, fields), ...);
            }, obj.as_tuple());

            return std::move(w.data);
        }

        template <class T>
        static T deserialize_object(const std::vector<uint8_t>& data)
        {
            BufferReader r(data);
            T obj;

            std::apply([&](auto&... fields)
            {
                using swallow = int[];
                (void)swallow{
                    0, (fields = read_field(r, std::type_identity<std::remove_cvref_t<decltype(fields)>>{}), 0)...
                };
            }, obj.as_tuple());

            if (r.remaining() != 0)
                throw ProtocolError("Trailing bytes after payload");

            return obj;
        }

        static std::vector<uint8_t> make_packet(MessageType type, const std::vector<uint8_t>& payload)
        {
            std::vector<uint8_t> packet(sizeof(MsgHeader) + payload.size());

            const MsgHeader header{
                .type = static_cast<uint16_t>(type),
                .size = static_cast<uint32_t>(payload.size())
            };

            std::memcpy(packet.data(), &header, sizeof(MsgHeader));
            if (!payload.empty())
                std::memcpy(packet.data() + sizeof(MsgHeader), payload.data(), payload.size());

            return packet;
        }
    };

    namespace ProtocolHelpers
    {
        inline constexpr uint32_t kMaxPayloadSize = 1024U * 1024U; // 1 MiB

        inline void send_packet(boost::asio::ip::tcp::socket& socket, const std::vector<uint8_t>& packet)
        {
            boost::asio::write(socket, boost::asio::buffer(packet));
        }

        inline std::pair<MessageType, std::vector<uint8_t>> receive_packet(boost::asio::ip::tcp::socket& socket)
        {
            // read header first
            MsgHeader header{};
            boost::asio::read(socket, boost::asio::buffer(&header, sizeof(MsgHeader)));
            if (header.size > kMaxPayloadSize)
                throw std::runtime_error("Incoming payload exceeds maximum allowed size");

            // read payload
            std::vector<uint8_t> payload(header.size);
            if (header.size > 0)
                boost::asio::read(socket, boost::asio::buffer(payload));

            return {static_cast<MessageType>(header.type), std::move(payload)};
        }
    }
} // namespace relay
