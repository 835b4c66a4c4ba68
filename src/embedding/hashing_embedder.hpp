#pragma once

#include <string>
#include <vector>

#include "embedding/embedder.hpp"

namespace courserag {

// Deterministic bag-of-words embedding: lower-cased alphanumeric tokens are
// hashed (FNV-1a) into a fixed number of buckets and the vector is L2
// normalised. Texts sharing no token have cosine similarity 0.
class HashingEmbedder final : public Embedder {
public:
    explicit HashingEmbedder(int dimension = 384);

    int dimension() const override { return dimension_; }
    std::vector<float> embed(const std::string& text) const override;

private:
    int dimension_;
};

}  // namespace courserag
