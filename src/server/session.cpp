#include "relay/server/session.hpp"

#include <iostream>
#include <thread>

#include "relay/common/protocol.hpp"

namespace relay::server
{
    Session::Session(const Id id, std::shared_ptr<Connection> connection, const size_t queue_capacity)
        : id_(id),
          connection_(std::move(connection)),
          outbound_(queue_capacity)
    {
    }

    void Session::on_close(CloseHandler handler)
    {
        close_handler_ = std::move(handler);
    }

    void Session::start(PacketHandler handler)
    {
        writer_started_ = true;

        auto self = shared_from_this();
        std::thread([self]() {
            self->write_loop();
        }).detach();

        std::thread([self, handler = std::move(handler)]() {
            self->read_loop(handler);
        }).detach();
    }

    bool Session::send(const Envelope& msg)
    {
        return send(Protocol::encode(msg));
    }

    bool Session::send(Packet packet)
    {
        if (closed_)
            return false;

        if (outbound_.try_push(std::move(packet)))
            return true;

        // lost a race with a concurrent close
        if (outbound_.is_closed() || !mark_closed("outbound queue overflow"))
            return false;

        // the producer may hold a room lock: only the queue is closed here,
        // logging and socket teardown run on the io_context
        outbound_.close();
        boost::asio::post(connection_->socket().get_executor(), [self = shared_from_this()] {
            self->release(false);
        });
        return false;
    }

    void Session::disconnect(const std::string& reason)
    {
        close(reason, true);
    }

    void Session::close(const std::string& reason, const bool flush)
    {
        if (!mark_closed(reason))
            return;

        outbound_.close();
        release(flush);
    }

    bool Session::mark_closed(const std::string& reason)
    {
        if (closed_.exchange(true))
            return false;

        std::lock_guard<std::mutex> lock(state_mutex_);
        close_reason_ = reason;
        return true;
    }

    void Session::release(const bool flush)
    {
        std::cout << "Disconnecting " << describe() << ": " << close_reason() << std::endl;

        // the writer closes the socket once the queue is drained
        if (flush && writer_started_)
            connection_->shutdown_receive();
        else
            connection_->close();

        if (close_handler_)
            close_handler_(shared_from_this());
    }

    void Session::read_loop(const PacketHandler& handler)
    {
        auto self = shared_from_this();

        while (!closed_) {
            std::pair<MessageType, Packet> packet;
            try {
                packet = connection_->receive_packet();
            }
            catch (const std::exception& e) {
                close(std::string("read error: ") + e.what(), false);
                break;
            }

            handler(self, packet.first, packet.second);
        }
    }

    void Session::write_loop()
    {
        Packet packet;
        while (outbound_.pop(packet)) {
            try {
                connection_->send_packet(packet);
            }
            catch (const std::exception& e) {
                close(std::string("write error: ") + e.what(), false);
                break;
            }
        }

        connection_->close();
    }

    std::string Session::username() const
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        return username_;
    }

    bool Session::is_authenticated() const
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        return authenticated_;
    }

    std::optional<std::string> Session::current_room() const
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        return current_room_;
    }

    UserStatus Session::status() const
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        return status_;
    }

    SessionState Session::state() const
    {
        if (closed_)
            return SessionState::DISCONNECTED;

        std::lock_guard<std::mutex> lock(state_mutex_);
        if (!authenticated_)
            return SessionState::UNAUTHENTICATED;
        return current_room_.has_value() ? SessionState::IN_ROOM : SessionState::AUTHENTICATED;
    }

    std::string Session::close_reason() const
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        return close_reason_;
    }

    std::string Session::describe() const
    {
        std::string name;
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            name = username_.empty() ? "session #" + std::to_string(id_) : "'" + username_ + "'";
        }

        const auto& peer = connection_->peer();
        return peer.empty() ? name : name + " (" + peer + ")";
    }

    void Session::mark_authenticated(const std::string& username)
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        username_             = username;
        authenticated_        = true;
        failed_auth_attempts_ = 0;
    }

    void Session::set_current_room(std::optional<std::string> room)
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        current_room_ = std::move(room);
    }

    void Session::set_status(const UserStatus status)
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        status_ = status;
    }

    int Session::record_failed_auth()
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        return ++failed_auth_attempts_;
    }

    void Session::reset_failed_auth()
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        failed_auth_attempts_ = 0;
    }
} // namespace relay::server
