#include "relay/server/connection.hpp"

#include <iostream>

#include "relay/common/protocol.hpp"

namespace relay::server
{
    Connection::Connection(boost::asio::io_context& io_context)
        : socket_(io_context),
          idle_timer_(io_context)
    {
    }

    Connection::socket_type& Connection::socket()
    {
        return socket_;
    }

    void Connection::capture_peer()
    {
        boost::system::error_code ec;
        const auto endpoint = socket_.remote_endpoint(ec);
        if (ec)
            peer_ = "unknown";
        else
            peer_ = endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
    }

    void Connection::send_packet(const std::vector<uint8_t>& packet)
    {
        try {
            ProtocolHelpers::send_packet(socket_, packet);
        }
        catch (const std::exception& e) {
            std::cerr << "Error sending packet to " << peer_ << ": " << e.what() << std::endl;
            throw;
        }
    }

    std::pair<MessageType, std::vector<uint8_t>> Connection::receive_packet()
    {
        try {
            auto packet = ProtocolHelpers::receive_packet(socket_);
            touch();
            return packet;
        }
        catch (const std::exception& e) {
            throw std::runtime_error(std::string("Connection closed: ") + e.what());
        }
    }

    void Connection::start_idle_timer(const std::chrono::seconds timeout)
    {
        if (timeout.count() <= 0)
            return;

        idle_timeout_ = timeout;
        touch();
    }

    void Connection::touch()
    {
        if (idle_timeout_.count() <= 0)
            return;

        // timer operations stay on the io_context thread
        boost::asio::post(idle_timer_.get_executor(), [weak = weak_from_this()] {
            if (const auto self = weak.lock())
                self->rearm_idle_timer();
        });
    }

    void Connection::rearm_idle_timer()
    {
        idle_timer_.expires_after(idle_timeout_);
        idle_timer_.async_wait([weak = weak_from_this()](const boost::system::error_code& error) {
            if (error == boost::asio::error::operation_aborted)
                return;

            if (const auto self = weak.lock()) {
                std::cout << "Idle deadline expired for " << self->peer_ << std::endl;
                self->close();
            }
        });
    }

    void Connection::shutdown_receive()
    {
        std::lock_guard<std::mutex> lock(lifecycle_mutex_);
        if (closed_)
            return;

        boost::system::error_code ec;
        socket_.shutdown(socket_type::shutdown_receive, ec);
    }

    void Connection::close()
    {
        {
            std::lock_guard<std::mutex> lock(lifecycle_mutex_);
            if (closed_)
                return;
            closed_ = true;

            // errors on close only mean the peer is already gone
            boost::system::error_code ec;
            socket_.shutdown(socket_type::shutdown_both, ec);
            socket_.close(ec);
        }

        boost::asio::post(idle_timer_.get_executor(), [weak = weak_from_this()] {
            if (const auto self = weak.lock())
                self->idle_timer_.cancel();
        });
    }

    bool Connection::is_open() const
    {
        return socket_.is_open();
    }
} // namespace relay::server
