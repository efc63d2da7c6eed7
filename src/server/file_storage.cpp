#include "relay/server/file_storage.hpp"

#include <fstream>
#include <stdexcept>

namespace relay::server
{
    UploadDirectory::UploadDirectory(std::filesystem::path root)
        : root_(std::move(root))
    {
    }

    std::string UploadDirectory::safe_component(const std::string& name)
    {
        // treat both separators as directory boundaries regardless of platform
        const auto slash = name.find_last_of("/\\");
        std::string base = slash == std::string::npos ? name : name.substr(slash + 1);

        if (base.empty() || base == "." || base == "..")
            throw std::runtime_error("Invalid file name: " + name);
        return base;
    }

    std::filesystem::path UploadDirectory::save_assembled(const std::vector<uint8_t>& bytes,
                                                          const std::string& filename,
                                                          const std::string& destination_hint)
    {
        const auto directory = root_ / safe_component(destination_hint);

        std::error_code ec;
        std::filesystem::create_directories(directory, ec);
        if (ec)
            throw std::runtime_error("Failed to create upload directory " + directory.string() + ": " + ec.message());

        const auto path = directory / safe_component(filename);
        std::ofstream file(path, std::ios::binary | std::ios::trunc);
        if (!file.is_open())
            throw std::runtime_error("Failed to open " + path.string() + " for writing");

        file.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
        if (!file)
            throw std::runtime_error("Failed to write " + path.string());

        return path;
    }
} // namespace relay::server
