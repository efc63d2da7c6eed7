#include "relay/common/file_transfer.hpp"

#include <algorithm>
#include <fstream>
#include <iterator>
#include <stdexcept>

#include "relay/common/encoding.hpp"

namespace relay
{
    std::vector<FileChunk> split_into_chunks(const std::vector<uint8_t>& bytes,
                                             const std::string& filename,
                                             const size_t chunk_size)
    {
        if (bytes.empty())
            throw std::invalid_argument("File is empty: " + filename);
        if (chunk_size == 0)
            throw std::invalid_argument("Chunk size must be positive");

        const size_t total_chunks = (bytes.size() + chunk_size - 1) / chunk_size;
        const int64_t timestamp   = now_ms();

        std::vector<FileChunk> chunks;
        chunks.reserve(total_chunks);

        for (size_t i = 0; i < total_chunks; ++i) {
            const size_t offset = i * chunk_size;
            const size_t length = std::min(chunk_size, bytes.size() - offset);

            FileChunk chunk;
            chunk.type         = MessageType::FILE;
            chunk.timestamp_ms = timestamp;
            chunk.filename     = filename;
            chunk.total_size   = static_cast<int64_t>(bytes.size());
            chunk.chunk_id     = static_cast<int32_t>(i);
            chunk.total_chunks = static_cast<int32_t>(total_chunks);
            chunk.data         = encoding::bytes_to_base64(bytes.data() + offset, length);
            chunks.push_back(std::move(chunk));
        }

        return chunks;
    }

    std::vector<FileChunk> read_file_chunks(const std::filesystem::path& path, const size_t chunk_size)
    {
        std::ifstream file(path, std::ios::binary);
        if (!file.is_open())
            throw std::runtime_error("File does not exist: " + path.string());

        std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
        if (file.bad())
            throw std::runtime_error("Failed to read file: " + path.string());

        return split_into_chunks(bytes, path.filename().string(), chunk_size);
    }

    std::vector<uint8_t> assemble(std::vector<FileChunk> chunks)
    {
        std::ranges::sort(chunks, {}, &FileChunk::chunk_id);

        std::vector<uint8_t> bytes;
        for (const auto& chunk : chunks) {
            const auto part = encoding::base64_to_bytes(chunk.data);
            bytes.insert(bytes.end(), part.begin(), part.end());
        }
        return bytes;
    }

    FileAssembler::Result FileAssembler::reject(std::string error)
    {
        return Result{Outcome::REJECTED, std::move(error), std::nullopt};
    }

    FileAssembler::Result FileAssembler::accept(const FileChunk& chunk)
    {
        if (chunk.filename.empty())
            return reject("File name not specified");
        if (chunk.total_chunks < 1)
            return reject("Invalid chunk count");
        if (chunk.chunk_id < 0 || chunk.chunk_id >= chunk.total_chunks)
            return reject("Chunk id out of range");

        std::vector<uint8_t> part;
        try {
            part = encoding::base64_to_bytes(chunk.data);
        }
        catch (const std::exception& e) {
            return reject(std::string("Invalid chunk data: ") + e.what());
        }

        TransferKey key{chunk.sender, chunk.filename};
        auto it = transfers_.find(key);
        if (it == transfers_.end())
            it = transfers_.emplace(key, Transfer{chunk.total_chunks, chunk.total_size, {}}).first;
        else if (it->second.total_chunks != chunk.total_chunks)
            return reject("Chunk count changed during transfer of " + chunk.filename);

        // a duplicate id replaces the earlier copy
        it->second.parts[chunk.chunk_id] = std::move(part);

        if (static_cast<int32_t>(it->second.parts.size()) < it->second.total_chunks)
            return Result{Outcome::ACCEPTED, {}, std::nullopt};

        AssembledFile file{chunk.sender, chunk.filename, {}};
        for (auto& [id, bytes] : it->second.parts)
            file.bytes.insert(file.bytes.end(), bytes.begin(), bytes.end());

        const int64_t expected_size = it->second.total_size;
        transfers_.erase(it);

        if (static_cast<int64_t>(file.bytes.size()) != expected_size)
            return reject("Assembled size of " + chunk.filename + " does not match announced size");

        return Result{Outcome::COMPLETED, {}, std::move(file)};
    }

    size_t FileAssembler::discard(const std::string& sender)
    {
        size_t dropped = 0;
        for (auto it = transfers_.begin(); it != transfers_.end();) {
            if (it->first.first == sender) {
                it = transfers_.erase(it);
                ++dropped;
            }
            else
                ++it;
        }
        return dropped;
    }

    size_t FileAssembler::received_chunks(const std::string& sender, const std::string& filename) const
    {
        const auto it = transfers_.find(TransferKey{sender, filename});
        return it == transfers_.end() ? 0 : it->second.parts.size();
    }
} // namespace relay
