#pragma once

#include <map>
#include <string>
#include <vector>
#include <utility>
#include <optional>
#include <filesystem>

#include "relay/common/messages.hpp"

namespace relay
{
    inline constexpr size_t kDefaultChunkSize = 8192; // 8 KiB

    struct AssembledFile
    {
        std::string sender;
        std::string filename;
        std::vector<uint8_t> bytes;
    };

    /**
     * Split a payload into File envelopes with chunk ids 0..N-1 and base64 data.
     * @throws std::invalid_argument for empty input or a zero chunk size
     */
    std::vector<FileChunk> split_into_chunks(const std::vector<uint8_t>& bytes,
                                             const std::string& filename,
                                             size_t chunk_size = kDefaultChunkSize);

    /**
     * Read a file from disk and split it; the chunk filename is the path's basename.
     * @throws std::runtime_error if the file cannot be read
     * @throws std::invalid_argument if the file is empty
     */
    std::vector<FileChunk> read_file_chunks(const std::filesystem::path& path,
                                            size_t chunk_size = kDefaultChunkSize);

    // order-independent reassembly of a complete chunk set
    std::vector<uint8_t> assemble(std::vector<FileChunk> chunks);

    /**
     * Receiving side of the chunked transfer protocol. Keeps one partial
     * transfer per (sender, filename) and yields the file once every chunk
     * id in [0, total_chunks) has been seen. Not synchronized.
     */
    class FileAssembler
    {
    public:
        enum class Outcome
        {
            ACCEPTED,  // stored, transfer still incomplete
            COMPLETED, // last missing chunk, file attached
            REJECTED   // invalid chunk, nothing stored
        };

        struct Result
        {
            Outcome outcome;
            std::string error;
            std::optional<AssembledFile> file;
        };

        Result accept(const FileChunk& chunk);

        // drop every partial transfer from `sender`; returns how many were dropped
        size_t discard(const std::string& sender);

        [[nodiscard]] size_t pending_transfers() const { return transfers_.size(); }
        [[nodiscard]] size_t received_chunks(const std::string& sender, const std::string& filename) const;

    private:
        struct Transfer
        {
            int32_t total_chunks;
            int64_t total_size;
            std::map<int32_t, std::vector<uint8_t>> parts; // keyed by chunk id
        };

        using TransferKey = std::pair<std::string, std::string>; // sender, filename

        std::map<TransferKey, Transfer> transfers_;

        static Result reject(std::string error);
    };
} // namespace relay
