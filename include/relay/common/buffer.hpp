#pragma once

#include <vector>
#include <string>
#include <cstdint>
#include <cstring>
#include <stdexcept>
#include <type_traits>

namespace relay
{
    class BufferWriter
    {
    public:
        std::vector<uint8_t> data;

        template <typename T>
        void write(const T& value)
        {
            static_assert(std::is_trivially_copyable_v<T>);

            const size_t old_size = data.size();
            data.resize(old_size + sizeof(T));
            std::memcpy(data.data() + old_size, &value, sizeof(T));
        }

        void write_string(const std::string& str);
    };

    class BufferReader
    {
    public:
        const std::vector<uint8_t>& data;
        size_t pos = 0;

        explicit BufferReader(const std::vector<uint8_t>& d);

        template <typename T>
        T read()
        {
            static_assert(std::is_trivially_copyable_v<T>);

            if (sizeof(T) > remaining())
                throw std::runtime_error("Buffer underflow");

            T value;
            std::memcpy(&value, data.data() + pos, sizeof(T));
            pos += sizeof(T);
            return value;
        }

        std::string read_string();

        [[nodiscard]] size_t remaining() const { return data.size() - pos; }
    };
} // namespace relay
