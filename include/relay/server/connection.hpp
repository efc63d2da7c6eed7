#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <utility>
#include <boost/asio.hpp>

#include "relay/common/types.hpp"

namespace relay::server
{
    /**
     * Blocking framed transport for one client. Reads happen on the session's
     * reader thread and writes on its writer thread; shutdown and close may be
     * called from any thread. The idle timer runs on the owning io_context.
     */
    class Connection : public std::enable_shared_from_this<Connection>
    {
    private:
        using socket_type = boost::asio::ip::tcp::socket;

        socket_type socket_;
        boost::asio::steady_timer idle_timer_;
        std::chrono::seconds idle_timeout_{0};
        std::string peer_;
        std::mutex lifecycle_mutex_;
        bool closed_{false};

        void touch();
        void rearm_idle_timer();

    public:
        explicit Connection(boost::asio::io_context& io_context);

        socket_type& socket();

        // remember the remote endpoint for logging
        void capture_peer();
        [[nodiscard]] const std::string& peer() const { return peer_; }

        void send_packet(const std::vector<uint8_t>& packet);
        std::pair<MessageType, std::vector<uint8_t>> receive_packet();

        // connections with no inbound traffic for `timeout` are shut down; 0 disables
        void start_idle_timer(std::chrono::seconds timeout);

        // unblocks a pending read, pending writes still go out
        void shutdown_receive();
        void close();
        [[nodiscard]] bool is_open() const;
    };
} // namespace relay::server
