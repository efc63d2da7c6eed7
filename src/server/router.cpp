#include "relay/server/router.hpp"

#include <iostream>
#include <variant>

#include "relay/common/events.hpp"
#include "relay/common/protocol.hpp"

namespace relay::server
{
    namespace
    {
        constexpr const char* kEncryptedPlaceholder = "[Encrypted message]";

        template <class... Ts>
        struct overloaded : Ts...
        {
            using Ts::operator()...;
        };

        template <class... Ts>
        overloaded(Ts...) -> overloaded<Ts...>;

        std::string join(const std::vector<std::string>& items, const std::string& separator)
        {
            std::string result;
            for (size_t i = 0; i < items.size(); ++i) {
                if (i > 0)
                    result += separator;
                result += items[i];
            }
            return result;
        }

        Envelope make_heading(const std::string& text)
        {
            Envelope heading;
            heading.type         = MessageType::COMMAND;
            heading.content      = text;
            heading.sender       = kServerSender;
            heading.timestamp_ms = now_ms();
            return heading;
        }
    }

    std::vector<std::string> split_arguments(const std::string& content, const size_t max_parts)
    {
        std::vector<std::string> parts;

        size_t pos = 0;
        while (pos < content.size()) {
            pos = content.find_first_not_of(" \t", pos);
            if (pos == std::string::npos)
                break;

            if (max_parts > 0 && parts.size() + 1 == max_parts) {
                parts.push_back(content.substr(pos));
                break;
            }

            const size_t end = content.find_first_of(" \t", pos);
            parts.push_back(content.substr(pos, end == std::string::npos ? std::string::npos : end - pos));
            pos = end;
        }

        return parts;
    }

    Router::Router(boost::asio::io_context& io_context,
                   RoomHub& rooms,
                   Directory& directory,
                   auth::AuthService& auth,
                   HistoryStore& history,
                   FileStorage& storage,
                   const RouterOptions options)
        : coordinator_(boost::asio::make_strand(io_context)),
          rooms_(rooms),
          directory_(directory),
          auth_(auth),
          history_(history),
          storage_(storage),
          options_(options)
    {
    }

    void Router::attach(const std::shared_ptr<Session>& session)
    {
        session->on_close([this](const std::shared_ptr<Session>& closed) {
            boost::asio::post(coordinator_, [this, closed]() {
                handle_disconnect(closed);
            });
        });
    }

    void Router::handle_packet(const std::shared_ptr<Session>& session, const MessageType type,
                               const std::vector<uint8_t>& payload)
    {
        InboundMessage msg;
        try {
            msg = Protocol::decode_inbound(type, payload);
        }
        catch (const std::exception& e) {
            // malformed units are dropped, the connection stays open
            std::cerr << "Discarding malformed unit from " << session->describe() << ": " << e.what() << std::endl;
            return;
        }

        try {
            dispatch(session, msg);
        }
        catch (const std::exception& e) {
            std::cerr << "Error handling " << message_type_to_string(type) << " from "
                << session->describe() << ": " << e.what() << std::endl;
            session->send(make_error("Internal error"));
        }
    }

    void Router::dispatch(const std::shared_ptr<Session>& session, const InboundMessage& msg)
    {
        std::visit(overloaded{
                       [&](const Envelope& envelope) { handle_envelope(session, envelope); },
                       [&](const FileChunk& chunk) { handle_file(session, chunk); },
                       [&](const AuthRequest& request) { handle_auth(session, request); },
                       [&](const StatusUpdate& update) { handle_status(session, update); }
                   }, msg);
    }

    void Router::handle_envelope(const std::shared_ptr<Session>& session, const Envelope& msg)
    {
        switch (msg.type) {
            case MessageType::TEXT:
                handle_text(session, msg);
                return;
            case MessageType::COMMAND:
                handle_command(session, msg);
                return;
            case MessageType::DIRECT:
            case MessageType::ENCRYPTED:
                handle_direct(session, msg);
                return;
            case MessageType::FILE:
            case MessageType::AUTH:
            case MessageType::STATUS:
                break;
        }

        // those tags always decode to their own variant
        std::cerr << "Ignoring " << message_type_to_string(msg.type) << " envelope without its payload from "
            << session->describe() << std::endl;
    }

    bool Router::require_auth(const std::shared_ptr<Session>& session)
    {
        if (session->is_authenticated())
            return true;

        session->send(make_error("Not authenticated"));
        return false;
    }

    void Router::record(const std::string& scope, const Envelope& msg)
    {
        try {
            history_.append(scope, msg);
        }
        catch (const std::exception& e) {
            std::cerr << "Failed to record message in " << scope << ": " << e.what() << std::endl;
        }
    }


    // authentication
    void Router::handle_auth(const std::shared_ptr<Session>& session, const AuthRequest& request)
    {
        if (session->is_authenticated()) {
            session->send(make_error("Already authenticated as " + session->username()));
            return;
        }

        if (request.username.empty() || request.password.empty()) {
            session->send(make_error("Username and password required"));
            return;
        }

        const bool registering = request.is_registration();
        bool accepted          = false;
        try {
            accepted = registering
                           ? auth_.register_user(request.username, request.password)
                           : auth_.verify(request.username, request.password);
        }
        catch (const std::exception& e) {
            std::cerr << "Authentication backend error for '" << request.username << "': " << e.what() << std::endl;
            session->send(make_error("Authentication unavailable"));
            return;
        }

        if (accepted) {
            complete_login(session, request.username, registering);
            return;
        }

        session->send(make_error(registering ? "Username already exists" : "Invalid credentials"));

        const int failures = session->record_failed_auth();
        if (options_.max_auth_attempts > 0 && failures >= options_.max_auth_attempts)
            session->disconnect("too many failed authentication attempts");
    }

    void Router::complete_login(const std::shared_ptr<Session>& session, const std::string& username,
                                const bool registered)
    {
        session->mark_authenticated(username);

        directory_.register_session(username, session, [this](const std::shared_ptr<Session>& previous) {
            evict(previous);
        });

        // teardown may have run before the entry existed
        if (session->is_closed()) {
            directory_.remove(username, session);
            return;
        }

        std::cout << "User '" << username << "' " << (registered ? "registered" : "authenticated")
            << " on " << session->describe() << std::endl;

        session->send(make_success(registered ? "Registered and logged in successfully" : "Logged in successfully"));
    }

    void Router::evict(const std::shared_ptr<Session>& previous)
    {
        previous->send(make_notice("Signed in from another connection; this session is closed"));
        rooms_.leave(previous, RoomEvent::USER_DISCONNECTED);
        previous->disconnect("signed in from another connection");
    }

    void Router::handle_disconnect(const std::shared_ptr<Session>& session)
    {
        if (const auto room = rooms_.leave(session, RoomEvent::USER_DISCONNECTED))
            std::cout << "Client " << session->describe() << " removed from room " << *room
                << " due to disconnection" << std::endl;

        if (session->is_authenticated())
            directory_.remove(session->username(), session);

        std::cout << "Client disconnected: " << session->describe() << std::endl;
    }


    // room and direct traffic
    void Router::handle_text(const std::shared_ptr<Session>& session, Envelope msg)
    {
        if (!require_auth(session))
            return;

        const auto room = session->current_room();
        if (!room.has_value()) {
            session->send(make_error("You are not in a room. Join a room first."));
            return;
        }

        msg.sender       = session->username();
        msg.room         = *room;
        msg.timestamp_ms = now_ms();
        msg.recipient.reset();
        msg.encrypted = false;

        std::cout << "Room message from " << msg.sender << " in " << msg.room << ": " << msg.content << std::endl;

        // sender gets its own echo as confirmation
        rooms_.broadcast(*room, msg);
        record(room_scope(*room), msg);
    }

    void Router::handle_direct(const std::shared_ptr<Session>& session, Envelope msg)
    {
        if (!require_auth(session))
            return;

        if (!msg.recipient.has_value() || msg.recipient->empty()) {
            session->send(make_error("Recipient not specified"));
            return;
        }

        const auto target = directory_.lookup(*msg.recipient);
        if (!target) {
            session->send(make_error("User not found: " + *msg.recipient));
            return;
        }

        msg.sender       = session->username();
        msg.room.clear();
        msg.timestamp_ms = now_ms();
        msg.encrypted    = msg.type == MessageType::ENCRYPTED;

        target->send(msg);
        if (target != session)
            session->send(msg);

        // ciphertext is relayed, never stored
        Envelope entry = msg;
        if (msg.encrypted)
            entry.content = kEncryptedPlaceholder;
        record(conversation_scope(msg.sender, *msg.recipient), entry);

        std::cout << (msg.encrypted ? "Encrypted" : "Direct") << " message from " << msg.sender
            << " to " << *msg.recipient << std::endl;
    }

    void Router::handle_status(const std::shared_ptr<Session>& session, const StatusUpdate& update)
    {
        if (!require_auth(session))
            return;

        change_status(session, update.status);
    }

    void Router::change_status(const std::shared_ptr<Session>& session, const UserStatus status)
    {
        session->set_status(status);

        const auto status_text = user_status_to_string(status);
        if (const auto room = session->current_room())
            rooms_.broadcast(*room, make_event(RoomEvent::STATUS_CHANGE, session->username(), *room, status_text));

        std::cout << "User " << session->username() << " changed status to " << status_text << std::endl;
    }


    // file transfer
    void Router::handle_file(const std::shared_ptr<Session>& session, FileChunk chunk)
    {
        if (!require_auth(session))
            return;

        const auto room_name = session->current_room();
        const auto room      = room_name ? rooms_.find(*room_name) : nullptr;
        if (!room) {
            session->send(make_error("You are not in a room. Join a room first."));
            return;
        }

        chunk.sender       = session->username();
        chunk.room         = room->name();
        chunk.timestamp_ms = now_ms();

        auto result = room->accept_chunk(chunk);
        if (result.outcome == FileAssembler::Outcome::REJECTED) {
            std::cerr << "Rejected file chunk from " << chunk.sender << ": " << result.error << std::endl;
            session->send(make_error(result.error));
            return;
        }

        std::cout << "Received file chunk " << chunk.chunk_id + 1 << "/" << chunk.total_chunks << " for "
            << chunk.filename << " from " << chunk.sender << " in room " << room->name() << std::endl;

        if (chunk.chunk_id == 0)
            room->broadcast(make_event(RoomEvent::FILE_SENDING, chunk.sender, room->name(), chunk.filename));

        // every chunk crosses the relay once, to everyone but the uploader
        room->broadcast_packet(Protocol::encode(chunk), session);

        if (result.outcome == FileAssembler::Outcome::COMPLETED && result.file.has_value())
            store_file(room, session, *result.file);
    }

    void Router::store_file(const std::shared_ptr<Room>& room, const std::shared_ptr<Session>& uploader,
                            const AssembledFile& file)
    {
        try {
            const auto path = storage_.save_assembled(file.bytes, file.filename, room->name());
            std::cout << "File " << file.filename << " successfully saved in room " << room->name()
                << " at " << path.string() << std::endl;
        }
        catch (const std::exception& e) {
            std::cerr << "Failed to save file " << file.filename << " in room " << room->name() << ": "
                << e.what() << std::endl;
            uploader->send(make_error("Failed to store file " + file.filename));
            return;
        }

        room->broadcast(make_event(RoomEvent::FILE_UPLOADED, file.sender, room->name(), file.filename));
    }


    // commands
    void Router::handle_command(const std::shared_ptr<Session>& session, const Envelope& msg)
    {
        if (!require_auth(session))
            return;

        const auto args          = split_arguments(msg.content);
        const std::string command = args.empty() ? "" : args.front();

        auto room_argument = [&]() {
            return !msg.room.empty() ? msg.room : (args.size() > 1 ? args[1] : std::string());
        };

        if (command == "rooms")
            command_rooms(session);
        else if (command == "users")
            command_users(session);
        else if (command == "create")
            command_create(session, room_argument());
        else if (command == "join")
            command_join(session, room_argument());
        else if (command == "leave")
            command_leave(session);
        else if (command == "msg" || command == "encrypt") {
            const auto parts = split_arguments(msg.content, 3);
            if (parts.size() < 3) {
                session->send(make_error("Usage: " + command + " <username> <message>"));
                return;
            }

            Envelope direct;
            direct.type      = command == "msg" ? MessageType::DIRECT : MessageType::ENCRYPTED;
            direct.content   = parts[2];
            direct.recipient = parts[1];
            handle_direct(session, std::move(direct));
        }
        else if (command == "status")
            command_status(session, args);
        else if (command == "history")
            command_history(session, args);
        else if (command == "exit" || command == "quit") {
            session->send(make_success("Goodbye"));
            session->disconnect("client quit");
        }
        else
            session->send(make_error("Unknown command: " + command));
    }

    void Router::command_rooms(const std::shared_ptr<Session>& session)
    {
        const auto rooms = rooms_.list_rooms();
        session->send(make_success("Rooms: " + join({rooms.begin(), rooms.end()}, ", ")));
    }

    void Router::command_users(const std::shared_ptr<Session>& session)
    {
        session->send(make_success("Online users: " + join(directory_.usernames(), ", ")));
    }

    void Router::command_create(const std::shared_ptr<Session>& session, const std::string& room_name)
    {
        if (room_name.empty()) {
            session->send(make_error("Room name not specified"));
            return;
        }

        const auto [room, created] = rooms_.create_or_get(room_name);
        if (created)
            std::cout << "Room " << room_name << " created by " << session->username() << std::endl;

        if (rooms_.join(session, room) == RoomHub::JoinResult::ALREADY_MEMBER) {
            session->send(make_error("Already in room: " + room_name));
            return;
        }

        session->send(make_success("Room created and joined: " + room_name));
    }

    void Router::command_join(const std::shared_ptr<Session>& session, const std::string& room_name)
    {
        if (room_name.empty()) {
            session->send(make_error("Room name not specified"));
            return;
        }

        const auto room = rooms_.find(room_name);
        if (!room) {
            session->send(make_error("Room not found: " + room_name));
            return;
        }

        switch (rooms_.join(session, room)) {
            case RoomHub::JoinResult::ALREADY_MEMBER:
                session->send(make_error("Already in room: " + room_name));
                return;
            case RoomHub::JoinResult::SESSION_CLOSED:
                return;
            case RoomHub::JoinResult::JOINED:
                break;
        }

        send_history(session, room_scope(room_name), "Recent messages:", options_.join_history);
        session->send(make_success("Joined room: " + room_name));
    }

    void Router::command_leave(const std::shared_ptr<Session>& session)
    {
        if (const auto left = rooms_.leave(session))
            session->send(make_success("Left room: " + *left));
        else
            session->send(make_error("Not in any room"));
    }

    void Router::command_status(const std::shared_ptr<Session>& session, const std::vector<std::string>& args)
    {
        const auto status = args.size() > 1 ? parse_user_status(args[1]) : std::nullopt;
        if (!status.has_value()) {
            session->send(make_error("Invalid status. Use: online, away, busy, or offline"));
            return;
        }

        change_status(session, *status);
        session->send(make_success("Status updated to: " + user_status_to_string(*status)));
    }

    void Router::command_history(const std::shared_ptr<Session>& session, const std::vector<std::string>& args)
    {
        if (args.size() > 1) {
            const auto& other = args[1];
            if (!send_history(session, conversation_scope(session->username(), other),
                              "Message history with " + other + ":", 0))
                session->send(make_success("No message history with user: " + other));
            return;
        }

        const auto room = session->current_room();
        if (!room.has_value()) {
            session->send(make_error("You are not in a room"));
            return;
        }

        if (!send_history(session, room_scope(*room), "Message history for room " + *room + ":",
                          options_.history_page))
            session->send(make_success("No message history for room: " + *room));
    }

    bool Router::send_history(const std::shared_ptr<Session>& session, const std::string& scope,
                              const std::string& heading, const size_t limit)
    {
        std::vector<Envelope> entries;
        try {
            entries = history_.history(scope);
        }
        catch (const std::exception& e) {
            std::cerr << "Failed to read history for " << scope << ": " << e.what() << std::endl;
            return false;
        }

        if (entries.empty())
            return false;

        // newest `limit` entries, 0 = all
        const size_t start = limit > 0 && entries.size() > limit ? entries.size() - limit : 0;

        session->send(make_heading(heading));
        for (size_t i = start; i < entries.size(); ++i)
            session->send(entries[i]);
        return true;
    }
} // namespace relay::server
