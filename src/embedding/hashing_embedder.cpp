#include "embedding/hashing_embedder.hpp"

#include <cctype>
#include <cmath>
#include <cstdint>
#include <stdexcept>
#include <string_view>

namespace courserag {
namespace {

constexpr std::uint64_t kFnvOffset = 1469598103934665603ULL;
constexpr std::uint64_t kFnvPrime = 1099511628211ULL;

std::vector<std::string> tokenize(std::string_view text) {
    std::vector<std::string> tokens;
    std::string current;
    for (const unsigned char ch : text) {
        if (std::isalnum(ch) != 0) {
            current.push_back(static_cast<char>(std::tolower(ch)));
            continue;
        }
        if (!current.empty()) {
            tokens.push_back(std::move(current));
            current.clear();
        }
    }
    if (!current.empty()) {
        tokens.push_back(std::move(current));
    }
    return tokens;
}

std::uint64_t fnv1a(std::string_view token) {
    std::uint64_t hash = kFnvOffset;
    for (const unsigned char ch : token) {
        hash ^= static_cast<std::uint64_t>(ch);
        hash *= kFnvPrime;
    }
    return hash;
}

}  // namespace

HashingEmbedder::HashingEmbedder(int dimension) : dimension_(dimension) {
    if (dimension_ <= 0) {
        throw std::invalid_argument("embedding dimension must be positive");
    }
}

std::vector<float> HashingEmbedder::embed(const std::string& text) const {
    std::vector<float> vector(static_cast<std::size_t>(dimension_), 0.0F);
    for (const auto& token : tokenize(text)) {
        vector[fnv1a(token) % vector.size()] += 1.0F;
    }

    double sum_sq = 0.0;
    for (const auto x : vector) {
        sum_sq += static_cast<double>(x) * static_cast<double>(x);
    }
    if (sum_sq > 0.0) {
        const double inv_norm = 1.0 / std::sqrt(sum_sq);
        for (auto& x : vector) {
            x = static_cast<float>(static_cast<double>(x) * inv_norm);
        }
    }
    return vector;
}

}  // namespace courserag
