#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace courserag {

struct FieldMatch {
    std::string key;
    nlohmann::json value;
};

// Conjunction of exact payload matches. An empty filter matches everything.
struct PayloadFilter {
    std::vector<FieldMatch> must;

    PayloadFilter& where(std::string key, nlohmann::json value) {
        must.push_back(FieldMatch{std::move(key), std::move(value)});
        return *this;
    }

    bool empty() const noexcept { return must.empty(); }

    bool matches(const nlohmann::json& payload) const {
        for (const auto& condition : must) {
            const auto it = payload.find(condition.key);
            if (it == payload.end() || *it != condition.value) {
                return false;
            }
        }
        return true;
    }
};

struct VectorPoint {
    std::uint64_t id = 0;
    std::vector<float> vector;
    nlohmann::json payload;
};

struct ScoredPoint {
    std::uint64_t id = 0;
    double score = 0.0;
    nlohmann::json payload;
};

// Nearest-neighbour collections with exact-match payload filtering. Ranking is
// by cosine similarity, highest first.
class VectorStore {
public:
    virtual ~VectorStore() = default;

    virtual void ensure_collection(const std::string& collection, int dimension) = 0;
    // Points with an existing id are replaced, payload included.
    virtual void upsert(const std::string& collection, const std::vector<VectorPoint>& points) = 0;
    // When min_score is set, only points scoring strictly above it are returned.
    virtual std::vector<ScoredPoint> search(const std::string& collection,
                                            const std::vector<float>& vector,
                                            int top_k,
                                            const PayloadFilter& filter,
                                            std::optional<double> min_score) = 0;
    virtual std::optional<nlohmann::json> get_payload(const std::string& collection, std::uint64_t id) = 0;
    virtual std::vector<nlohmann::json> scroll(const std::string& collection,
                                               const PayloadFilter& filter,
                                               std::size_t limit) = 0;
    virtual std::size_t count(const std::string& collection, const PayloadFilter& filter) = 0;
    // Refuses an empty filter.
    virtual void delete_where(const std::string& collection, const PayloadFilter& filter) = 0;
    virtual void delete_points(const std::string& collection, const std::vector<std::uint64_t>& ids) = 0;
};

}  // namespace courserag
