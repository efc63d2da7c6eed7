#pragma once

#include <vector>
#include <string>
#include <cstdint>

namespace relay::encoding
{
    // Convert bytes to/from hex
    std::string bytes_to_hex(const std::vector<uint8_t>& bytes);
    std::vector<uint8_t> hex_to_bytes(const std::string& hex);

    // Convert bytes to/from base64 (standard alphabet, padded, no newlines)
    std::string bytes_to_base64(const std::vector<uint8_t>& bytes);
    std::string bytes_to_base64(const uint8_t* data, size_t size);

    /**
     * Strict base64 decoding.
     * @throws std::runtime_error on bad length, bad characters or misplaced padding
     */
    std::vector<uint8_t> base64_to_bytes(const std::string& base64);

    std::vector<uint8_t> random_bytes(size_t length);
} // namespace relay::encoding
