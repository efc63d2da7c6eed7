#include "relay/server/config.hpp"

#include <stdexcept>

namespace relay::server
{
    namespace
    {
        long long parse_number(const std::string& option, const std::string& value)
        {
            size_t consumed = 0;
            long long number;
            try {
                number = std::stoll(value, &consumed);
            }
            catch (const std::exception&) {
                throw std::invalid_argument("Invalid value for " + option + ": " + value);
            }

            if (consumed != value.size())
                throw std::invalid_argument("Invalid value for " + option + ": " + value);
            return number;
        }
    }

    ServerConfig parse_arguments(const std::vector<std::string>& args)
    {
        if (args.empty())
            throw std::invalid_argument("Port not specified");

        ServerConfig config;

        const auto port = parse_number("port", args.front());
        if (port < 1024 || port > 65535)
            throw std::invalid_argument("Port must be between 1024 and 65535");
        config.port = static_cast<int>(port);

        for (size_t i = 1; i < args.size(); ++i) {
            const auto& option = args[i];
            if (i + 1 >= args.size())
                throw std::invalid_argument("Missing value for " + option);
            const auto& value = args[++i];

            if (option == "--uploads") {
                config.uploads_dir = value;
            }
            else if (option == "--users") {
                config.users_db = value;
            }
            else if (option == "--queue") {
                const auto capacity = parse_number(option, value);
                if (capacity < 1)
                    throw std::invalid_argument("Queue capacity must be positive");
                config.outbound_queue_capacity = static_cast<size_t>(capacity);
            }
            else if (option == "--idle-timeout") {
                const auto seconds = parse_number(option, value);
                if (seconds < 0)
                    throw std::invalid_argument("Idle timeout must not be negative");
                config.idle_timeout = std::chrono::seconds(seconds);
            }
            else {
                throw std::invalid_argument("Unknown option: " + option);
            }
        }

        return config;
    }

    std::string usage(const std::string& program)
    {
        return "Usage: " + program + " <port> [--uploads DIR] [--users FILE] [--queue N] [--idle-timeout SECONDS]\n"
               "Example: " + program + " 8888 --uploads ./uploads";
    }
} // namespace relay::server
