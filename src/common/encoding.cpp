#include "relay/common/encoding.hpp"

#include <openssl/evp.h>
#include <openssl/rand.h>
#include <stdexcept>
#include <sstream>
#include <iomanip>

namespace relay::encoding
{
    std::string bytes_to_hex(const std::vector<uint8_t>& bytes)
    {
        std::ostringstream oss;
        oss << std::hex << std::setfill('0');
        for (const uint8_t b : bytes)
            oss << std::setw(2) << static_cast<int>(b);
        return oss.str();
    }

    std::vector<uint8_t> hex_to_bytes(const std::string& hex)
    {
        if (hex.size() % 2 != 0)
            throw std::runtime_error("Hex string has odd length");

        std::vector<uint8_t> bytes;
        bytes.reserve(hex.size() / 2);
        for (size_t i = 0; i < hex.length(); i += 2)
        {
            size_t consumed = 0;
            const int value = std::stoi(hex.substr(i, 2), &consumed, 16);
            if (consumed != 2)
                throw std::runtime_error("Invalid hex digit");
            bytes.push_back(static_cast<uint8_t>(value));
        }
        return bytes;
    }

    std::string bytes_to_base64(const uint8_t* data, const size_t size)
    {
        if (size == 0)
            return {};

        // 4 output chars per 3 input bytes plus terminator
        std::string result(4 * ((size + 2) / 3) + 1, '\0');
        const int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(result.data()),
                                            data, static_cast<int>(size));
        if (written < 0)
            throw std::runtime_error("Base64 encode failed");

        result.resize(static_cast<size_t>(written));
        return result;
    }

    std::string bytes_to_base64(const std::vector<uint8_t>& bytes)
    {
        return bytes_to_base64(bytes.data(), bytes.size());
    }

    std::vector<uint8_t> base64_to_bytes(const std::string& base64)
    {
        if (base64.empty())
            return {};

        if (base64.size() % 4 != 0)
            throw std::runtime_error("Base64 decode failed: invalid length");

        size_t padding = 0;
        if (base64.back() == '=')
            ++padding;
        if (base64[base64.size() - 2] == '=')
            ++padding;

        // '=' is only valid as trailing padding
        if (base64.find('=') < base64.size() - padding)
            throw std::runtime_error("Base64 decode failed: misplaced padding");

        std::vector<uint8_t> result(3 * (base64.size() / 4));
        const int decoded = EVP_DecodeBlock(result.data(),
                                            reinterpret_cast<const unsigned char*>(base64.data()),
                                            static_cast<int>(base64.size()));
        if (decoded < 0)
            throw std::runtime_error("Base64 decode failed: invalid character");

        // EVP_DecodeBlock counts padding as zero bytes
        result.resize(static_cast<size_t>(decoded) - padding);
        return result;
    }

    std::vector<uint8_t> random_bytes(const size_t length)
    {
        std::vector<uint8_t> bytes(length);
        if (RAND_bytes(bytes.data(), static_cast<int>(length)) != 1)
            throw std::runtime_error("Failed to generate random bytes");
        return bytes;
    }
} // namespace relay::encoding
