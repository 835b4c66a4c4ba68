#pragma once

#include <map>
#include <mutex>
#include <string>
#include <unordered_map>

#include "index/vector_store.hpp"

namespace courserag {

// Exact cosine search over points kept in process memory. Ties are broken by
// ascending point id so results are deterministic.
class InMemoryVectorStore final : public VectorStore {
public:
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
    struct Collection {
        int dimension = 0;
        std::map<std::uint64_t, VectorPoint> points;
    };

    Collection& require_collection(const std::string& name);

    std::mutex mutex_;
    std::unordered_map<std::string, Collection> collections_;
};

}  // namespace courserag
