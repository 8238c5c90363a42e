#pragma once

#include <string>
#include <vector>

namespace droidrun {

// OpenSSL-backed encoding and hashing helpers
class Encoding {
public:
    // Base64 without line breaks (the screenshot payload format)
    static std::string base64_encode(const unsigned char* data, size_t len);
    static std::string base64_encode(const std::string& data);

    // Empty result for empty or invalid input
    static std::vector<unsigned char> base64_decode(const std::string& encoded);

    // Lowercase hex SHA-256 of data (patch fingerprints in logs)
    static std::string sha256_string(const std::string& data);

    // Hex of num_bytes cryptographically random bytes; throws on RNG failure
    static std::string random_hex(size_t num_bytes);

    static std::string bytes_to_hex(const unsigned char* data, size_t len);
};

} // namespace droidrun
