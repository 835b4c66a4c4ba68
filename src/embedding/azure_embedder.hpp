#pragma once

#include <string>
#include <vector>

#include "embedding/embedder.hpp"

namespace courserag
{

    class Config;

    class AzureEmbedder final : public Embedder
    {
    public:
        explicit AzureEmbedder(const Config &config);

        int dimension() const override { return dimension_; }
        std::vector<float> embed(const std::string &text) const override;
        std::vector<std::vector<float>> embed_batch(const std::vector<std::string> &texts) const override;

    private:
        std::string url_;
        std::string api_key_;
        int dimension_;

        std::vector<std::vector<float>> request_embeddings(const std::vector<std::string> &inputs) const;
    };

} // namespace courserag
