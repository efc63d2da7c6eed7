#pragma once

#include <string>
#include <tuple>
#include <variant>
#include <optional>

#include "relay/common/types.hpp"

namespace relay
{
    // the type travels in the packet header, not in the payload
    struct Envelope
    {
        MessageType type{MessageType::TEXT};
        std::string content;
        std::string sender;
        std::string room;
        std::optional<std::string> recipient;
        int64_t timestamp_ms{0};
        bool encrypted{false};

        [[nodiscard]] auto as_tuple() const { return std::tie(content, sender, room, recipient, timestamp_ms, encrypted); }
        [[nodiscard]] auto as_tuple() { return std::tie(content, sender, room, recipient, timestamp_ms, encrypted); }
    };

    struct FileChunk : Envelope
    {
        std::string filename;
        int64_t total_size{0};
        int32_t chunk_id{0};
        int32_t total_chunks{0};
        std::string data; // base64

        [[nodiscard]] auto as_tuple() const
        {
            return std::tuple_cat(Envelope::as_tuple(), std::tie(filename, total_size, chunk_id, total_chunks, data));
        }

        [[nodiscard]] auto as_tuple()
        {
            return std::tuple_cat(Envelope::as_tuple(), std::tie(filename, total_size, chunk_id, total_chunks, data));
        }
    };

    struct AuthRequest : Envelope
    {
        std::string username;
        std::string password;

        [[nodiscard]] auto as_tuple() const { return std::tuple_cat(Envelope::as_tuple(), std::tie(username, password)); }
        [[nodiscard]] auto as_tuple() { return std::tuple_cat(Envelope::as_tuple(), std::tie(username, password)); }

        [[nodiscard]] bool is_registration() const { return content == "register"; }
    };

    struct StatusUpdate : Envelope
    {
        UserStatus status{UserStatus::ONLINE};

        [[nodiscard]] auto as_tuple() const { return std::tuple_cat(Envelope::as_tuple(), std::tie(status)); }
        [[nodiscard]] auto as_tuple() { return std::tuple_cat(Envelope::as_tuple(), std::tie(status)); }
    };

    // every decodable inbound unit; the header tag picks the alternative
    using InboundMessage = std::variant<Envelope, FileChunk, AuthRequest, StatusUpdate>;

    Envelope make_reply(const std::string& prefix, const std::string& text);

    inline Envelope make_success(const std::string& text) { return make_reply("SUCCESS: ", text); }
    inline Envelope make_error(const std::string& text) { return make_reply("ERROR: ", text); }
    inline Envelope make_notice(const std::string& text) { return make_reply("NOTICE: ", text); }
} // namespace relay
