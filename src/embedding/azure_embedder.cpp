#include "embedding/azure_embedder.hpp"

#include <algorithm>
#include <chrono>
#include <stdexcept>
#include <thread>

#include <nlohmann/json.hpp>

#include "config/config.hpp"
#include "net/http_client.hpp"
#include "util/errors.hpp"
#include "util/log.hpp"

namespace courserag
{

    namespace
    {
        constexpr int kMaxAttempts = 3;
        constexpr std::size_t kMaxBatchInputs = 16;

        nlohmann::json build_request_body(const std::vector<std::string> &inputs)
        {
            nlohmann::json body;
            body["input"] = inputs;
            return body;
        }

        std::vector<std::vector<float>> parse_embeddings(const nlohmann::json &json, std::size_t expected, int dimension)
        {
            if (!json.contains("data") || !json["data"].is_array() || json["data"].size() != expected)
            {
                throw std::runtime_error("azure embedding response missing data");
            }
            std::vector<std::vector<float>> out(expected);
            for (const auto &item : json["data"])
            {
                const std::size_t index = item.value("index", std::size_t{0});
                if (index >= expected || !item.contains("embedding") || !item["embedding"].is_array())
                {
                    throw std::runtime_error("azure embedding format invalid");
                }
                auto &embedding = out[index];
                embedding.reserve(item["embedding"].size());
                for (const auto &value : item["embedding"])
                {
                    embedding.push_back(value.get<float>());
                }
                if (embedding.size() != static_cast<std::size_t>(dimension))
                {
                    throw std::runtime_error("unexpected embedding dimension: " + std::to_string(embedding.size()));
                }
            }
            return out;
        }

    } // namespace

    AzureEmbedder::AzureEmbedder(const Config &config)
        : url_(config.azure_embedding_url()),
          api_key_(config.azure_api_key()),
          dimension_(config.embedding_dimension())
    {
        if (url_.empty())
        {
            throw ConfigError("missing Azure embedding configuration: AZURE_OPENAI_ENDPOINT, AZURE_OPENAI_EMBEDDING_DEPLOYMENT, AZURE_OPENAI_API_VERSION");
        }
        if (api_key_.empty())
        {
            throw ConfigError("missing AZURE_OPENAI_API_KEY");
        }
    }

    std::vector<float> AzureEmbedder::embed(const std::string &text) const
    {
        if (text.empty())
        {
            return {};
        }
        return request_embeddings({text}).front();
    }

    std::vector<std::vector<float>> AzureEmbedder::embed_batch(const std::vector<std::string> &texts) const
    {
        std::vector<std::vector<float>> out;
        out.reserve(texts.size());
        for (std::size_t begin = 0; begin < texts.size(); begin += kMaxBatchInputs)
        {
            const std::size_t end = std::min(texts.size(), begin + kMaxBatchInputs);
            std::vector<std::string> batch(texts.begin() + static_cast<std::ptrdiff_t>(begin),
                                           texts.begin() + static_cast<std::ptrdiff_t>(end));
            auto embeddings = request_embeddings(batch);
            for (auto &embedding : embeddings)
            {
                out.push_back(std::move(embedding));
            }
        }
        return out;
    }

    std::vector<std::vector<float>> AzureEmbedder::request_embeddings(const std::vector<std::string> &inputs) const
    {
        const HttpRequest base_request{
            .method = "POST",
            .url = url_,
            .headers = {"Content-Type: application/json", "api-key: " + api_key_},
            .body = build_request_body(inputs).dump(),
            .timeout_seconds = 30,
        };

        for (int attempt = 0; attempt < kMaxAttempts; ++attempt)
        {
            try
            {
                const auto response = perform_http_request(base_request);
                if (response.status == 200)
                {
                    return parse_embeddings(nlohmann::json::parse(response.body), inputs.size(), dimension_);
                }

                if (response.status == 401 || response.status == 403)
                {
                    throw std::runtime_error("azure embedding unauthorized (status " + std::to_string(response.status) + ')');
                }

                if (response.status == 429 || response.status >= 500)
                {
                    if (attempt + 1 < kMaxAttempts)
                    {
                        log::warn("azure embedding status " + std::to_string(response.status) + ", retrying");
                        std::this_thread::sleep_for(std::chrono::seconds(1 << attempt));
                        continue;
                    }
                    throw ServiceUnavailable("azure embedding unavailable (status " + std::to_string(response.status) + ')');
                }

                throw std::runtime_error("azure embedding request failed with status " + std::to_string(response.status) +
                                         " body: " + body_preview(response.body));
            }
            catch (const nlohmann::json::exception &ex)
            {
                throw std::runtime_error(std::string{"failed to parse azure embedding response: "} + ex.what());
            }
        }

        throw ServiceUnavailable("azure embedding failed after retries");
    }

} // namespace courserag
