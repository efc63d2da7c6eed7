#pragma once

#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

#include "relay/server/history.hpp"
#include "relay/server/session.hpp"

namespace relay::server
{
    struct ServerConfig
    {
        int port{0};
        std::filesystem::path uploads_dir{"uploads"};
        std::filesystem::path users_db{"users.db"};
        size_t outbound_queue_capacity{kDefaultOutboundCapacity};
        std::chrono::seconds idle_timeout{300}; // 0 = disabled
        size_t history_limit{kMaxMessageHistory};
        int max_auth_attempts{5};
    };

    /**
     * Parse `<port> [--uploads DIR] [--users FILE] [--queue N] [--idle-timeout SECONDS]`.
     * The program name is not part of `args`.
     * @throws std::invalid_argument for a missing or out of range port, unknown options or malformed values
     */
    ServerConfig parse_arguments(const std::vector<std::string>& args);

    std::string usage(const std::string& program);
} // namespace relay::server
