#include "relay/server/server.hpp"

#include <iostream>

namespace relay::server
{
    Server::Server(ServerConfig config)
        : config_(std::move(config)),
          acceptor_(
              io_context_,
              boost::asio::ip::tcp::endpoint(
                  boost::asio::ip::tcp::v4(),
                  static_cast<unsigned short>(config_.port)
              )
          ),
          credentials_(std::make_unique<auth::CredentialStore>(config_.users_db.string())),
          history_(std::make_unique<MessageHistory>(config_.history_limit)),
          storage_(std::make_unique<UploadDirectory>(config_.uploads_dir)),
          rooms_(std::make_unique<RoomHub>()),
          directory_(std::make_unique<Directory>()),
          next_session_id_(1),
          running_(false)
    {
        RouterOptions options;
        options.max_auth_attempts = config_.max_auth_attempts;

        router_ = std::make_unique<Router>(io_context_, *rooms_, *directory_, *credentials_, *history_, *storage_,
                                           options);
    }

    Server::~Server()
    {
        stop();
    }

    void Server::run()
    {
        std::cout << "Server starting on port " << config_.port << "..." << std::endl;
        running_ = true;

        start_accept();

        std::cout << "Server listening on port " << config_.port << std::endl;
        std::cout << "Uploads are stored in " << storage_->root().string() << std::endl;
        std::cout << "Waiting for connections..." << std::endl;

        // the idle timers and the teardown coordinator run here
        io_context_.run();
    }

    void Server::stop()
    {
        if (running_.exchange(false)) {
            boost::system::error_code ec;
            acceptor_.close(ec);
            io_context_.stop();
        }
    }

    void Server::start_accept()
    {
        auto conn   = std::make_shared<Connection>(io_context_);
        auto lambda = [this, conn](const boost::system::error_code& error) {
            if (!error) {
                conn->capture_peer();
                std::cout << "New connection from " << conn->peer() << std::endl;

                conn->start_idle_timer(config_.idle_timeout);

                auto session = std::make_shared<Session>(next_session_id_++, conn, config_.outbound_queue_capacity);
                router_->attach(session);

                // one reader and one writer thread per client
                session->start([this](const std::shared_ptr<Session>& self, const MessageType type,
                                      const Session::Packet& payload) {
                    router_->handle_packet(self, type, payload);
                });
            }
            else if (error != boost::asio::error::operation_aborted)
                std::cerr << "Accept error: " << error.message() << std::endl;

            if (running_)
                this->start_accept();
        };

        acceptor_.async_accept(conn->socket(), lambda);
    }
} // namespace relay::server
