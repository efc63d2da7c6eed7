#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace relay::server
{
    // destination for reassembled uploads
    class FileStorage
    {
    public:
        virtual ~FileStorage() = default;

        /**
         * Persist a completed file.
         * @param destination_hint grouping key, the room name for uploads
         * @return path the file was written to
         * @throws std::runtime_error on I/O failure
         */
        virtual std::filesystem::path save_assembled(const std::vector<uint8_t>& bytes,
                                                     const std::string& filename,
                                                     const std::string& destination_hint) = 0;
    };

    // writes <root>/<hint>/<basename(filename)>
    class UploadDirectory : public FileStorage
    {
    public:
        explicit UploadDirectory(std::filesystem::path root);

        std::filesystem::path save_assembled(const std::vector<uint8_t>& bytes,
                                             const std::string& filename,
                                             const std::string& destination_hint) override;

        [[nodiscard]] const std::filesystem::path& root() const { return root_; }

        // strips directories and rejects names that would escape the target directory
        static std::string safe_component(const std::string& name);

    private:
        std::filesystem::path root_;
    };
} // namespace relay::server
