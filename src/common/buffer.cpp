#include "relay/common/buffer.hpp"

namespace relay
{
    // BufferWriter
    void BufferWriter::write_string(const std::string& str)
    {
        write(static_cast<uint32_t>(str.size()));

        const size_t old_size = data.size();
        data.resize(old_size + str.size());
        if (!str.empty())
            std::memcpy(data.data() + old_size, str.data(), str.size());
    }


    // BufferReader
    BufferReader::BufferReader(const std::vector<uint8_t>& d)
        : data(d)
    {
    }

    std::string BufferReader::read_string()
    {
        const auto length = read<uint32_t>();
        if (length > remaining())
            throw std::runtime_error("Buffer underflow");

        std::string str(reinterpret_cast<const char*>(data.data() + pos), length);
        pos += length;
        return str;
    }
} // namespace relay
