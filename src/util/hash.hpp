#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace courserag::hash {

std::string sha256_hex(std::string_view content);

// First eight bytes of SHA-256(key), big endian. Stable across processes,
// unlike std::hash, so re-ingestion addresses the same vector points.
std::uint64_t stable_point_id(std::string_view key);

}  // namespace courserag::hash
