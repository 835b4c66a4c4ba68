#include "util/hash.hpp"

#include <iomanip>
#include <sstream>

#include <openssl/sha.h>

namespace courserag::hash {
namespace {

void sha256(std::string_view content, unsigned char (&digest)[SHA256_DIGEST_LENGTH]) {
    SHA256(reinterpret_cast<const unsigned char*>(content.data()), content.size(), digest);
}

}  // namespace

std::string sha256_hex(std::string_view content) {
    unsigned char digest[SHA256_DIGEST_LENGTH];
    sha256(content, digest);

    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (int i = 0; i < SHA256_DIGEST_LENGTH; ++i) {
        oss << std::setw(2) << static_cast<int>(digest[i]);
    }
    return oss.str();
}

std::uint64_t stable_point_id(std::string_view key) {
    unsigned char digest[SHA256_DIGEST_LENGTH];
    sha256(key, digest);

    std::uint64_t id = 0;
    for (int i = 0; i < 8; ++i) {
        id = (id << 8) | static_cast<std::uint64_t>(digest[i]);
    }
    return id;
}

}  // namespace courserag::hash
