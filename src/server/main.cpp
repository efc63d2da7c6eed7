#include "relay/server/server.hpp"
#include <iostream>
#include <csignal>
#include <cstdlib>

std::unique_ptr<relay::server::Server> g_server;

void signal_handler(const int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        std::cout << "\nShutting down server..." << std::endl;
        if (g_server) {
            g_server->stop();
        }
        exit(0);
    }
}

int main(const int argc, char* argv[]) {
    relay::server::ServerConfig config;
    try {
        config = relay::server::parse_arguments(std::vector<std::string>(argv + 1, argv + argc));
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        std::cerr << relay::server::usage(argv[0]) << std::endl;
        return EXIT_FAILURE;
    }

    try {
        // set up signal handlers
        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);

        g_server = std::make_unique<relay::server::Server>(std::move(config));
        g_server->run();

        return EXIT_SUCCESS;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }
}
