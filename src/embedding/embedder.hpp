#pragma once

#include <string>
#include <vector>

namespace courserag {

class Embedder {
public:
    virtual ~Embedder() = default;

    virtual int dimension() const = 0;
    virtual std::vector<float> embed(const std::string& text) const = 0;

    virtual std::vector<std::vector<float>> embed_batch(const std::vector<std::string>& texts) const {
        std::vector<std::vector<float>> out;
        out.reserve(texts.size());
        for (const auto& text : texts) {
            out.push_back(embed(text));
        }
        return out;
    }
};

}  // namespace courserag
