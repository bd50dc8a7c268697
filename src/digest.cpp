#include "digest.h"

#include <sstream>
#include <iomanip>
#include <vector>
#include <stdexcept>
#include <openssl/sha.h>
#include <openssl/rand.h>
#include <openssl/err.h>

namespace gradebox {

namespace {
constexpr size_t FINGERPRINT_HEX_CHARS = 12;
}

std::string Digest::bytes_to_hex(const unsigned char* data, size_t len) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (size_t i = 0; i < len; ++i) {
        oss << std::setw(2) << static_cast<int>(data[i]);
    }
    return oss.str();
}

std::string Digest::sha256_string(const std::string& data) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), hash);
    return bytes_to_hex(hash, SHA256_DIGEST_LENGTH);
}

std::string Digest::random_hex(size_t bytes) {
    std::vector<unsigned char> buffer(bytes);
    if (bytes > 0 && RAND_bytes(buffer.data(), static_cast<int>(bytes)) != 1) {
        char err[256];
        ERR_error_string_n(ERR_get_error(), err, sizeof(err));
        throw std::runtime_error(std::string("RAND_bytes failed: ") + err);
    }
    return bytes_to_hex(buffer.data(), buffer.size());
}

std::string Digest::code_fingerprint(const std::string& code) {
    return sha256_string(code).substr(0, FINGERPRINT_HEX_CHARS);
}

} // namespace gradebox
