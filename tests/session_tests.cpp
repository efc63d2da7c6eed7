#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <functional>
#include <future>
#include <thread>

#include "relay/auth/credential_store.hpp"
#include "relay/common/protocol.hpp"
#include "relay/server/router.hpp"
#include "relay/server/session.hpp"

namespace relay::server
{
    using boost::asio::ip::tcp;

    class SessionTest : public ::testing::Test
    {
    protected:
        boost::asio::io_context io_context_;
        tcp::acceptor acceptor_{io_context_, tcp::endpoint(boost::asio::ip::address_v4::loopback(), 0)};
        tcp::socket client_{io_context_};
        std::shared_ptr<Connection> connection_;

        void SetUp() override
        {
            // the peer connects before accept; the listen backlog holds it
            connection_ = std::make_shared<Connection>(io_context_);
            client_.connect(acceptor_.local_endpoint());
            acceptor_.accept(connection_->socket());
            connection_->capture_peer();
        }

        void TearDown() override
        {
            boost::system::error_code ec;
            client_.close(ec);
            acceptor_.close(ec);

            io_context_.restart();
            io_context_.poll();
        }

        // keep running posted handlers until `done` holds or the deadline passes
        bool run_until(const std::function<bool()>& done,
                       const std::chrono::milliseconds timeout = std::chrono::seconds(5))
        {
            const auto deadline = std::chrono::steady_clock::now() + timeout;
            while (!done()) {
                if (std::chrono::steady_clock::now() > deadline)
                    return false;
                io_context_.restart();
                io_context_.run_for(std::chrono::milliseconds(10));
            }
            return true;
        }

        // the reader and writer threads own a reference until they exit
        void release(std::shared_ptr<Session>& session)
        {
            std::weak_ptr<Session> weak = session;
            session.reset();
            EXPECT_TRUE(run_until([&weak] { return weak.expired(); }));
        }

        void client_send(const Session::Packet& packet)
        {
            boost::asio::write(client_, boost::asio::buffer(packet));
        }

        Envelope client_receive()
        {
            auto [type, payload] = ProtocolHelpers::receive_packet(client_);
            return std::visit([](const Envelope& e) { return e; }, Protocol::decode_inbound(type, payload));
        }

        bool client_sees_eof()
        {
            try {
                ProtocolHelpers::receive_packet(client_);
            }
            catch (const boost::system::system_error& e) {
                return e.code() == boost::asio::error::eof || e.code() == boost::asio::error::connection_reset;
            }
            return false;
        }

        static Envelope command(const std::string& content, const std::string& room = "")
        {
            Envelope msg;
            msg.type    = MessageType::COMMAND;
            msg.content = content;
            msg.room    = room;
            return msg;
        }
    };

    TEST_F(SessionTest, InboundPacketsReachHandler)
    {
        auto session = std::make_shared<Session>(1, connection_);

        std::promise<Envelope> received;
        session->start([&received](const std::shared_ptr<Session>&, const MessageType type, const Session::Packet& payload) {
            received.set_value(std::get<Envelope>(Protocol::decode_inbound(type, payload)));
        });

        Envelope msg;
        msg.type    = MessageType::TEXT;
        msg.content = "Hello everyone!";
        client_send(Protocol::encode(msg));

        auto future = received.get_future();
        ASSERT_EQ(future.wait_for(std::chrono::seconds(5)), std::future_status::ready);
        EXPECT_EQ(future.get().content, "Hello everyone!");

        session->disconnect("test finished");
        EXPECT_TRUE(client_sees_eof());
        release(session);
    }

    TEST_F(SessionTest, QueuedRepliesFlushedBeforeClose)
    {
        auto session = std::make_shared<Session>(1, connection_);

        std::promise<void> closed;
        session->on_close([&closed](const std::shared_ptr<Session>&) { closed.set_value(); });
        session->start([](const std::shared_ptr<Session>&, MessageType, const Session::Packet&) {});

        EXPECT_TRUE(session->send(make_notice("Signed in from another connection; this session is closed")));
        EXPECT_TRUE(session->send(make_success("Goodbye")));
        session->disconnect("client quit");

        EXPECT_FALSE(session->send(make_success("too late")));

        EXPECT_EQ(client_receive().content, "NOTICE: Signed in from another connection; this session is closed");
        EXPECT_EQ(client_receive().content, "SUCCESS: Goodbye");
        EXPECT_TRUE(client_sees_eof());

        EXPECT_EQ(closed.get_future().wait_for(std::chrono::seconds(5)), std::future_status::ready);
        EXPECT_EQ(session->close_reason(), "client quit");
        release(session);
    }

    TEST_F(SessionTest, OversizedHeaderDisconnects)
    {
        auto session = std::make_shared<Session>(1, connection_);

        std::promise<void> closed;
        session->on_close([&closed](const std::shared_ptr<Session>&) { closed.set_value(); });

        std::atomic<bool> handled{false};
        session->start([&handled](const std::shared_ptr<Session>&, MessageType, const Session::Packet&) {
            handled = true;
        });

        const MsgHeader header{
            .type = static_cast<uint16_t>(MessageType::TEXT),
            .size = ProtocolHelpers::kMaxPayloadSize + 1
        };
        boost::asio::write(client_, boost::asio::buffer(&header, sizeof(MsgHeader)));

        ASSERT_EQ(closed.get_future().wait_for(std::chrono::seconds(5)), std::future_status::ready);
        EXPECT_NE(session->close_reason().find("exceeds maximum"), std::string::npos);
        EXPECT_FALSE(handled);
        EXPECT_TRUE(client_sees_eof());
        release(session);
    }

    TEST_F(SessionTest, IdleSessionClosed)
    {
        auto session = std::make_shared<Session>(1, connection_);

        std::promise<void> closed;
        session->on_close([&closed](const std::shared_ptr<Session>&) { closed.set_value(); });

        connection_->start_idle_timer(std::chrono::seconds(1));
        session->start([](const std::shared_ptr<Session>&, MessageType, const Session::Packet&) {});

        EXPECT_TRUE(run_until([&session] { return session->is_closed(); }));
        EXPECT_EQ(closed.get_future().wait_for(std::chrono::seconds(5)), std::future_status::ready);
        EXPECT_TRUE(client_sees_eof());
        release(session);
    }

    class SessionRoutingTest : public SessionTest
    {
    protected:
        RoomHub rooms_;
        Directory directory_;
        auth::CredentialStore credentials_{"", 1};
        MessageHistory history_;
        UploadDirectory storage_{std::filesystem::temp_directory_path() / "relay_session_uploads"};
        Router router_{io_context_, rooms_, directory_, credentials_, history_, storage_};

        std::shared_ptr<Session> start_routed_session()
        {
            auto session = std::make_shared<Session>(1, connection_);
            router_.attach(session);
            session->start([this](const std::shared_ptr<Session>& s, const MessageType type,
                                  const Session::Packet& payload) {
                router_.handle_packet(s, type, payload);
            });
            return session;
        }

        void register_in_room(const std::string& username, const std::string& room)
        {
            AuthRequest request;
            request.type     = MessageType::AUTH;
            request.content  = "register";
            request.username = username;
            request.password = "password";
            client_send(Protocol::encode(request));
            EXPECT_EQ(client_receive().content, "SUCCESS: Registered and logged in successfully");

            client_send(Protocol::encode(command("create", room)));
            EXPECT_EQ(client_receive().content, username + " has joined the room");
            EXPECT_EQ(client_receive().content, "SUCCESS: Room created and joined: " + room);
        }
    };

    TEST_F(SessionRoutingTest, QuitFlushesGoodbyeThenTearsDown)
    {
        auto session = start_routed_session();
        register_in_room("alice", "r1");

        client_send(Protocol::encode(command("quit")));
        EXPECT_EQ(client_receive().content, "SUCCESS: Goodbye");
        EXPECT_TRUE(client_sees_eof());

        EXPECT_TRUE(run_until([this] { return !directory_.contains("alice"); }));
        EXPECT_EQ(rooms_.find("r1")->member_count(), 0);
        release(session);
    }

    TEST_F(SessionRoutingTest, PeerCloseTearsDown)
    {
        auto session = start_routed_session();
        register_in_room("alice", "r1");
        EXPECT_EQ(rooms_.find("r1")->member_count(), 1);

        boost::system::error_code ec;
        client_.close(ec);

        EXPECT_TRUE(run_until([this] { return !directory_.contains("alice"); }));
        EXPECT_EQ(rooms_.find("r1")->member_count(), 0);
        EXPECT_EQ(session->close_reason().rfind("read error", 0), 0);
        release(session);
    }
} // namespace relay::server
