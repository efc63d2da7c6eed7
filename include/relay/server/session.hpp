#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <utility>
#include <boost/asio.hpp>

#include "relay/common/messages.hpp"
#include "relay/server/bounded_queue.hpp"
#include "relay/server/connection.hpp"

namespace relay::server
{
    inline constexpr size_t kDefaultOutboundCapacity = 256;

    enum class SessionState
    {
        UNAUTHENTICATED,
        AUTHENTICATED,
        IN_ROOM,
        DISCONNECTED
    };

    /**
     * Server-side state of one connected client.
     *
     * A reader thread decodes framed units and hands them to the packet
     * handler; a writer thread drains the bounded outbound queue. Other
     * components only talk to a session through send() and the state
     * accessors. A full queue disconnects the session instead of blocking
     * the producer.
     */
    class Session : public std::enable_shared_from_this<Session>
    {
    public:
        using Id            = uint64_t;
        using Packet        = std::vector<uint8_t>;
        using PacketHandler = std::function<void(const std::shared_ptr<Session>&, MessageType, const Packet&)>;
        using CloseHandler  = std::function<void(const std::shared_ptr<Session>&)>;

        Session(Id id, std::shared_ptr<Connection> connection, size_t queue_capacity = kDefaultOutboundCapacity);

        Session(const Session&)            = delete;
        Session& operator=(const Session&) = delete;

        // must be installed before the session is shared with other threads
        void on_close(CloseHandler handler);

        // spawn the reader and writer threads
        void start(PacketHandler handler);

        // non-blocking; false if the session is closed or was just evicted for overflow
        bool send(const Envelope& msg);
        bool send(Packet packet);

        // graceful: already queued packets are flushed before the socket closes
        void disconnect(const std::string& reason);

        [[nodiscard]] Id id() const { return id_; }
        [[nodiscard]] std::string username() const;
        [[nodiscard]] bool is_authenticated() const;
        [[nodiscard]] std::optional<std::string> current_room() const;
        [[nodiscard]] UserStatus status() const;
        [[nodiscard]] SessionState state() const;
        [[nodiscard]] bool is_closed() const { return closed_.load(); }
        [[nodiscard]] std::string close_reason() const;
        [[nodiscard]] std::string describe() const;

        void mark_authenticated(const std::string& username);
        void set_current_room(std::optional<std::string> room);
        void set_status(UserStatus status);

        // consecutive failed logins, reset on success
        int record_failed_auth();
        void reset_failed_auth();

        BoundedQueue<Packet>& outbound() { return outbound_; }

        // held by the room hub across multi-step membership changes
        std::mutex& membership_mutex() { return membership_mutex_; }

    private:
        const Id id_;
        std::shared_ptr<Connection> connection_;
        BoundedQueue<Packet> outbound_;

        mutable std::mutex state_mutex_;
        std::string username_;
        bool authenticated_{false};
        std::optional<std::string> current_room_;
        UserStatus status_{UserStatus::ONLINE};
        int failed_auth_attempts_{0};
        std::string close_reason_;

        std::mutex membership_mutex_;
        std::atomic<bool> closed_{false};
        std::atomic<bool> writer_started_{false};
        CloseHandler close_handler_;

        void read_loop(const PacketHandler& handler);
        void write_loop();
        void close(const std::string& reason, bool flush);
        // first caller wins; records the reason
        bool mark_closed(const std::string& reason);
        void release(bool flush);
    };
} // namespace relay::server
