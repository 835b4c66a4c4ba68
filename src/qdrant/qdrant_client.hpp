#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "index/vector_store.hpp"

namespace courserag {

// Qdrant filter JSON: {"must": [{"key": k, "match": {"value": v}}, ...]}.
nlohmann::json to_qdrant_filter(const PayloadFilter& filter);

class QdrantClient final : public VectorStore {
public:
    explicit QdrantClient(std::string base_url);

    void ensure_collection(const std::string& collection, int dimension) override;
    void upsert(const std::string& collection, const std::vector<VectorPoint>& points) override;
    std::vector<ScoredPoint> search(const std::string& collection,
                                    const std::vector<float>& vector,
                                    int top_k,
                                    const PayloadFilter& filter,
                                    std::optional<double> min_score) override;
    std::optional<nlohmann::json> get_payload(const std::string& collection, std::uint64_t id) override;
    std::vector<nlohmann::json> scroll(const std::string& collection,
                                       const PayloadFilter& filter,
                                       std::size_t limit) override;
    std::size_t count(const std::string& collection, const PayloadFilter& filter) override;
    void delete_where(const std::string& collection, const PayloadFilter& filter) override;
    void delete_points(const std::string& collection, const std::vector<std::uint64_t>& ids) override;

private:
    std::string base_url_;

    std::string collection_url(const std::string& collection_name) const;
    nlohmann::json post_json(const std::string& url, const nlohmann::json& body, const std::string& action) const;
};

}  // namespace courserag
