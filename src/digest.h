#pragma once

#include <string>
#include <cstddef>

namespace gradebox {

class Digest {
public:
    static std::string sha256_string(const std::string& data);
    static std::string bytes_to_hex(const unsigned char* data, size_t len);

    // Hex string of `bytes` bytes from the OpenSSL CSPRNG.
    // Throws std::runtime_error when the generator is not seeded.
    static std::string random_hex(size_t bytes);

    // Short SHA-256 prefix identifying submitted source in logs
    static std::string code_fingerprint(const std::string& code);
};

} // namespace gradebox
