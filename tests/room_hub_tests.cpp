#include "relay/server/room_hub.hpp"
#include "relay/common/protocol.hpp"

#include <gtest/gtest.h>
#include <atomic>
#include <thread>
#include <vector>

namespace relay::server
{
    class RoomHubTest : public ::testing::Test
    {
    protected:
        boost::asio::io_context io_context_;
        RoomHub hub_;
        Session::Id next_id_{1};

        void TearDown() override
        {
            io_context_.restart();
            io_context_.poll();
        }

        std::shared_ptr<Session> create_test_session(const std::string& username,
                                                     const size_t capacity = kDefaultOutboundCapacity)
        {
            auto session = std::make_shared<Session>(next_id_++, std::make_shared<Connection>(io_context_),
                                                     capacity);
            session->mark_authenticated(username);
            return session;
        }

        // decode everything queued for the session so far
        static std::vector<Envelope> drain(const std::shared_ptr<Session>& session)
        {
            std::vector<Envelope> messages;
            Session::Packet packet;
            while (session->outbound().try_pop(packet)) {
                MsgHeader header;
                std::memcpy(&header, packet.data(), sizeof(MsgHeader));
                std::vector<uint8_t> payload(packet.begin() + sizeof(MsgHeader), packet.end());

                auto msg = Protocol::decode_inbound(static_cast<MessageType>(header.type), payload);
                messages.push_back(std::visit([](const Envelope& e) { return e; }, msg));
            }
            return messages;
        }

        static std::vector<std::string> contents(const std::vector<Envelope>& messages)
        {
            std::vector<std::string> result;
            for (const auto& msg : messages)
                result.push_back(msg.content);
            return result;
        }

        static Envelope text(const std::string& content)
        {
            Envelope msg;
            msg.type    = MessageType::TEXT;
            msg.content = content;
            return msg;
        }
    };

    TEST_F(RoomHubTest, DefaultRoomExists)
    {
        EXPECT_NE(hub_.find(kDefaultRoom), nullptr);
        EXPECT_EQ(hub_.list_rooms(), (std::set<std::string>{"general"}));
    }

    TEST_F(RoomHubTest, CreateOrGetIsIdempotent)
    {
        auto [first, created] = hub_.create_or_get("r1");
        EXPECT_TRUE(created);
        EXPECT_EQ(first->name(), "r1");
        EXPECT_EQ(first->member_count(), 0);

        auto [second, created_again] = hub_.create_or_get("r1");
        EXPECT_FALSE(created_again);
        EXPECT_EQ(first, second);

        EXPECT_EQ(hub_.list_rooms(), (std::set<std::string>{"general", "r1"}));
    }

    TEST_F(RoomHubTest, EmptyRoomNameRejected)
    {
        EXPECT_THROW(hub_.create_or_get(""), std::invalid_argument);
    }

    TEST_F(RoomHubTest, FindUnknownRoom)
    {
        EXPECT_EQ(hub_.find("nope"), nullptr);
    }

    TEST_F(RoomHubTest, JoinBroadcastsArrival)
    {
        auto room  = hub_.create_or_get("r1").first;
        auto alice = create_test_session("alice");
        auto bob   = create_test_session("bob");

        EXPECT_EQ(hub_.join(alice, room), RoomHub::JoinResult::JOINED);
        EXPECT_EQ(contents(drain(alice)), (std::vector<std::string>{"alice has joined the room"}));

        EXPECT_EQ(hub_.join(bob, room), RoomHub::JoinResult::JOINED);

        auto seen_by_alice = drain(alice);
        ASSERT_EQ(seen_by_alice.size(), 1);
        EXPECT_EQ(seen_by_alice[0].content, "bob has joined the room");
        EXPECT_EQ(seen_by_alice[0].sender, kServerSender);
        EXPECT_EQ(seen_by_alice[0].room, "r1");
        EXPECT_EQ(contents(drain(bob)), (std::vector<std::string>{"bob has joined the room"}));

        EXPECT_EQ(bob->current_room(), "r1");
        EXPECT_EQ(bob->state(), SessionState::IN_ROOM);
        EXPECT_EQ(room->member_count(), 2);
    }

    TEST_F(RoomHubTest, JoinSameRoomTwice)
    {
        auto room  = hub_.create_or_get("r1").first;
        auto alice = create_test_session("alice");

        hub_.join(alice, room);
        drain(alice);

        EXPECT_EQ(hub_.join(alice, room), RoomHub::JoinResult::ALREADY_MEMBER);
        EXPECT_TRUE(drain(alice).empty());
        EXPECT_EQ(room->member_count(), 1);
    }

    TEST_F(RoomHubTest, MoveEmitsOneDepartureAndOneArrival)
    {
        auto room_a = hub_.create_or_get("a").first;
        auto room_b = hub_.create_or_get("b").first;

        auto mover     = create_test_session("mover");
        auto watcher_a = create_test_session("watcher_a");
        auto watcher_b = create_test_session("watcher_b");

        hub_.join(watcher_a, room_a);
        hub_.join(watcher_b, room_b);
        hub_.join(mover, room_a);
        drain(mover);
        drain(watcher_a);
        drain(watcher_b);

        EXPECT_EQ(hub_.join(mover, room_b), RoomHub::JoinResult::JOINED);

        EXPECT_EQ(contents(drain(watcher_a)), (std::vector<std::string>{"mover has left the room"}));
        EXPECT_EQ(contents(drain(watcher_b)), (std::vector<std::string>{"mover has joined the room"}));

        EXPECT_FALSE(room_a->contains(mover->id()));
        EXPECT_TRUE(room_b->contains(mover->id()));
        EXPECT_EQ(mover->current_room(), "b");
    }

    TEST_F(RoomHubTest, LeaveBroadcastsDeparture)
    {
        auto room  = hub_.create_or_get("r1").first;
        auto alice = create_test_session("alice");
        auto bob   = create_test_session("bob");

        hub_.join(alice, room);
        hub_.join(bob, room);
        drain(alice);

        auto left = hub_.leave(bob);
        ASSERT_TRUE(left.has_value());
        EXPECT_EQ(*left, "r1");
        EXPECT_FALSE(bob->current_room().has_value());
        EXPECT_EQ(bob->state(), SessionState::AUTHENTICATED);
        EXPECT_EQ(contents(drain(alice)), (std::vector<std::string>{"bob has left the room"}));

        EXPECT_FALSE(hub_.leave(bob).has_value());
    }

    TEST_F(RoomHubTest, DisconnectDepartureWording)
    {
        auto room  = hub_.create_or_get("r1").first;
        auto alice = create_test_session("alice");
        auto bob   = create_test_session("bob");

        hub_.join(alice, room);
        hub_.join(bob, room);
        drain(alice);

        hub_.leave(bob, RoomEvent::USER_DISCONNECTED);
        EXPECT_EQ(contents(drain(alice)), (std::vector<std::string>{"bob has disconnected from the server"}));
    }

    TEST_F(RoomHubTest, ClosedSessionCannotJoin)
    {
        auto room  = hub_.create_or_get("r1").first;
        auto alice = create_test_session("alice");

        alice->disconnect("test");

        EXPECT_EQ(hub_.join(alice, room), RoomHub::JoinResult::SESSION_CLOSED);
        EXPECT_EQ(room->member_count(), 0);
    }

    TEST_F(RoomHubTest, BroadcastExcludesSender)
    {
        auto room  = hub_.create_or_get("r1").first;
        auto alice = create_test_session("alice");
        auto bob   = create_test_session("bob");

        hub_.join(alice, room);
        hub_.join(bob, room);
        drain(alice);
        drain(bob);

        EXPECT_EQ(hub_.broadcast("r1", text("from alice"), alice), 1);
        EXPECT_TRUE(drain(alice).empty());
        EXPECT_EQ(contents(drain(bob)), (std::vector<std::string>{"from alice"}));

        EXPECT_EQ(hub_.broadcast("r1", text("to everyone")), 2);
        EXPECT_EQ(drain(alice).size(), 1);
        EXPECT_EQ(drain(bob).size(), 1);
    }

    TEST_F(RoomHubTest, BroadcastToUnknownRoom)
    {
        EXPECT_EQ(hub_.broadcast("nope", text("hello")), 0);
    }

    TEST_F(RoomHubTest, BroadcastsArriveInIssueOrder)
    {
        auto room  = hub_.create_or_get("r1").first;
        auto alice = create_test_session("alice");
        auto bob   = create_test_session("bob");

        hub_.join(alice, room);
        hub_.join(bob, room);
        drain(alice);
        drain(bob);

        std::vector<std::string> expected;
        for (int i = 0; i < 50; ++i) {
            expected.push_back("message " + std::to_string(i));
            room->broadcast(text(expected.back()));
        }

        EXPECT_EQ(contents(drain(alice)), expected);
        EXPECT_EQ(contents(drain(bob)), expected);
    }

    TEST_F(RoomHubTest, OverflowDisconnectsOnlySlowMember)
    {
        auto room = hub_.create_or_get("r1").first;
        auto slow = create_test_session("slow", 4);
        auto fast = create_test_session("fast", 64);

        std::atomic<int> slow_closes{0};
        std::atomic<int> fast_closes{0};
        slow->on_close([&](const std::shared_ptr<Session>&) { ++slow_closes; });
        fast->on_close([&](const std::shared_ptr<Session>&) { ++fast_closes; });

        hub_.join(slow, room);
        hub_.join(fast, room);
        drain(fast);

        // slow holds two join events and never drains
        for (int i = 0; i < 10; ++i)
            room->broadcast(text("flood " + std::to_string(i)));

        EXPECT_TRUE(slow->is_closed());
        EXPECT_EQ(slow->close_reason(), "outbound queue overflow");

        // nothing beyond closing the queue happens inside the broadcast
        EXPECT_EQ(slow_closes.load(), 0);
        io_context_.restart();
        io_context_.poll();
        EXPECT_EQ(slow_closes.load(), 1);

        EXPECT_FALSE(fast->is_closed());
        EXPECT_EQ(fast_closes.load(), 0);
        EXPECT_EQ(drain(fast).size(), 10);
    }

    TEST_F(RoomHubTest, ConcurrentMovesKeepSingleMembership)
    {
        std::vector<std::shared_ptr<Room>> rooms;
        for (int i = 0; i < 4; ++i)
            rooms.push_back(hub_.create_or_get("room_" + std::to_string(i)).first);

        auto session = create_test_session("mover", 100000);

        std::vector<std::thread> threads;
        for (int t = 0; t < 4; ++t) {
            threads.emplace_back([&, t]() {
                for (int i = 0; i < 200; ++i)
                    hub_.join(session, rooms[(t + i) % rooms.size()]);
            });
        }

        for (auto& t : threads)
            t.join();

        int memberships = 0;
        for (const auto& room : rooms) {
            if (room->contains(session->id())) {
                ++memberships;
                EXPECT_EQ(session->current_room(), room->name());
            }
        }
        EXPECT_EQ(memberships, 1);
    }

    TEST_F(RoomHubTest, ConcurrentBroadcastsToDifferentRooms)
    {
        auto room_a = hub_.create_or_get("a").first;
        auto room_b = hub_.create_or_get("b").first;
        auto member_a = create_test_session("member_a", 1000);
        auto member_b = create_test_session("member_b", 1000);

        hub_.join(member_a, room_a);
        hub_.join(member_b, room_b);
        drain(member_a);
        drain(member_b);

        std::thread ta([&]() {
            for (int i = 0; i < 200; ++i)
                room_a->broadcast(text("a" + std::to_string(i)));
        });
        std::thread tb([&]() {
            for (int i = 0; i < 200; ++i)
                room_b->broadcast(text("b" + std::to_string(i)));
        });
        ta.join();
        tb.join();

        auto received_a = contents(drain(member_a));
        ASSERT_EQ(received_a.size(), 200);
        for (int i = 0; i < 200; ++i)
            EXPECT_EQ(received_a[i], "a" + std::to_string(i));

        EXPECT_EQ(drain(member_b).size(), 200);
    }
} // namespace relay::server
