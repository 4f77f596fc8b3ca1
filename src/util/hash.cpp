#include "util/hash.hpp"

#include <iomanip>
#include <sstream>

#include <openssl/sha.h>

namespace verirag::hash {
namespace {

void digest(const std::string& content, unsigned char (&out)[SHA256_DIGEST_LENGTH]) {
    SHA256(reinterpret_cast<const unsigned char*>(content.data()), content.size(), out);
}

}  // namespace

std::string sha256_hex(const std::string& content) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    digest(content, hash);

    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (int i = 0; i < SHA256_DIGEST_LENGTH; ++i) {
        oss << std::setw(2) << static_cast<int>(hash[i]);
    }
    return oss.str();
}

std::uint64_t stable_id(const std::string& key) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    digest(key, hash);

    std::uint64_t value = 0;
    for (int i = 0; i < 8; ++i) {
        value = (value << 8) | hash[i];
    }
    return value;
}

}  // namespace verirag::hash
