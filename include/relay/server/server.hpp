#pragma once

#include <atomic>
#include <memory>
#include <utility>
#include <boost/asio.hpp>

#include "relay/auth/credential_store.hpp"
#include "relay/server/config.hpp"
#include "relay/server/directory.hpp"
#include "relay/server/file_storage.hpp"
#include "relay/server/history.hpp"
#include "relay/server/room_hub.hpp"
#include "relay/server/router.hpp"

namespace relay::server
{
    class Server
    {
    public:
        explicit Server(ServerConfig config);
        ~Server();

        void run();
        void stop();

    private:
        ServerConfig config_;

        boost::asio::io_context io_context_;
        boost::asio::ip::tcp::acceptor acceptor_;

        std::unique_ptr<auth::CredentialStore> credentials_;
        std::unique_ptr<MessageHistory> history_;
        std::unique_ptr<UploadDirectory> storage_;
        std::unique_ptr<RoomHub> rooms_;
        std::unique_ptr<Directory> directory_;
        std::unique_ptr<Router> router_;

        std::atomic<Session::Id> next_session_id_;
        std::atomic<bool> running_;

        void start_accept();
    };
} // namespace relay::server
