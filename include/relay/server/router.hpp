#pragma once

#include <memory>
#include <string>
#include <vector>
#include <utility>
#include <boost/asio.hpp>

#include "relay/auth/credential_store.hpp"
#include "relay/common/messages.hpp"
#include "relay/server/directory.hpp"
#include "relay/server/file_storage.hpp"
#include "relay/server/history.hpp"
#include "relay/server/room_hub.hpp"
#include "relay/server/session.hpp"

namespace relay::server
{
    struct RouterOptions
    {
        int max_auth_attempts{5};   // consecutive failures before disconnect, 0 = unlimited
        size_t join_history{10};    // messages replayed on join
        size_t history_page{20};    // messages returned by `history`
    };

    /**
     * Dispatches decoded envelopes by type to the registries and collaborators.
     *
     * handle_packet() runs on each session's reader thread. Session teardown
     * (room departure and directory removal) is posted to a single strand, the
     * coordinator, so it never runs inside a room or directory lock.
     */
    class Router
    {
    public:
        using coordinator_type = boost::asio::strand<boost::asio::io_context::executor_type>;

        Router(boost::asio::io_context& io_context,
               RoomHub& rooms,
               Directory& directory,
               auth::AuthService& auth,
               HistoryStore& history,
               FileStorage& storage,
               RouterOptions options = {});

        // route the session's disconnect to the coordinator
        void attach(const std::shared_ptr<Session>& session);

        void handle_packet(const std::shared_ptr<Session>& session, MessageType type,
                           const std::vector<uint8_t>& payload);
        void dispatch(const std::shared_ptr<Session>& session, const InboundMessage& msg);

        // teardown; called on the coordinator
        void handle_disconnect(const std::shared_ptr<Session>& session);

        coordinator_type& coordinator() { return coordinator_; }

    private:
        coordinator_type coordinator_;
        RoomHub& rooms_;
        Directory& directory_;
        auth::AuthService& auth_;
        HistoryStore& history_;
        FileStorage& storage_;
        RouterOptions options_;

        void handle_auth(const std::shared_ptr<Session>& session, const AuthRequest& request);
        void handle_envelope(const std::shared_ptr<Session>& session, const Envelope& msg);
        void handle_text(const std::shared_ptr<Session>& session, Envelope msg);
        void handle_direct(const std::shared_ptr<Session>& session, Envelope msg);
        void handle_status(const std::shared_ptr<Session>& session, const StatusUpdate& update);
        void handle_file(const std::shared_ptr<Session>& session, FileChunk chunk);
        void handle_command(const std::shared_ptr<Session>& session, const Envelope& msg);

        void complete_login(const std::shared_ptr<Session>& session, const std::string& username, bool registered);
        void evict(const std::shared_ptr<Session>& previous);

        void command_rooms(const std::shared_ptr<Session>& session);
        void command_users(const std::shared_ptr<Session>& session);
        void command_create(const std::shared_ptr<Session>& session, const std::string& room_name);
        void command_join(const std::shared_ptr<Session>& session, const std::string& room_name);
        void command_leave(const std::shared_ptr<Session>& session);
        void command_status(const std::shared_ptr<Session>& session, const std::vector<std::string>& args);
        void command_history(const std::shared_ptr<Session>& session, const std::vector<std::string>& args);

        void change_status(const std::shared_ptr<Session>& session, UserStatus status);
        void store_file(const std::shared_ptr<Room>& room, const std::shared_ptr<Session>& uploader,
                        const AssembledFile& file);

        // collaborator failures are logged and never stop delivery
        void record(const std::string& scope, const Envelope& msg);
        bool send_history(const std::shared_ptr<Session>& session, const std::string& scope,
                          const std::string& heading, size_t limit);

        static bool require_auth(const std::shared_ptr<Session>& session);
    };

    // command arguments; the last token keeps the remainder of the line when max_parts is reached
    std::vector<std::string> split_arguments(const std::string& content, size_t max_parts = 0);
} // namespace relay::server
