#include "index/memory_vector_store.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace courserag {
namespace {

double cosine(const std::vector<float>& a, const std::vector<float>& b) {
    double dot = 0.0;
    double norm_a = 0.0;
    double norm_b = 0.0;
    for (std::size_t i = 0; i < a.size(); ++i) {
        dot += static_cast<double>(a[i]) * static_cast<double>(b[i]);
        norm_a += static_cast<double>(a[i]) * static_cast<double>(a[i]);
        norm_b += static_cast<double>(b[i]) * static_cast<double>(b[i]);
    }
    if (norm_a <= 0.0 || norm_b <= 0.0) {
        return 0.0;
    }
    return dot / (std::sqrt(norm_a) * std::sqrt(norm_b));
}

}  // namespace

InMemoryVectorStore::Collection& InMemoryVectorStore::require_collection(const std::string& name) {
    const auto it = collections_.find(name);
    if (it == collections_.end()) {
        throw std::runtime_error("vector collection not found: " + name);
    }
    return it->second;
}

void InMemoryVectorStore::ensure_collection(const std::string& collection, int dimension) {
    if (dimension <= 0) {
        throw std::invalid_argument("collection dimension must be positive");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    auto [it, inserted] = collections_.try_emplace(collection);
    if (inserted) {
        it->second.dimension = dimension;
    } else if (it->second.dimension != dimension) {
        throw std::runtime_error("collection " + collection + " exists with dimension " +
                                 std::to_string(it->second.dimension));
    }
}

void InMemoryVectorStore::upsert(const std::string& collection, const std::vector<VectorPoint>& points) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& target = require_collection(collection);
    for (const auto& point : points) {
        if (point.vector.size() != static_cast<std::size_t>(target.dimension)) {
            throw std::invalid_argument("vector dimension mismatch for collection " + collection);
        }
    }
    for (const auto& point : points) {
        target.points[point.id] = point;
    }
}

std::vector<ScoredPoint> InMemoryVectorStore::search(const std::string& collection,
                                                     const std::vector<float>& vector,
                                                     int top_k,
                                                     const PayloadFilter& filter,
                                                     std::optional<double> min_score) {
    if (top_k <= 0) {
        throw std::invalid_argument("search requires top_k > 0");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    const auto& source = require_collection(collection);
    if (vector.size() != static_cast<std::size_t>(source.dimension)) {
        throw std::invalid_argument("query dimension mismatch for collection " + collection);
    }

    std::vector<ScoredPoint> scored;
    for (const auto& [id, point] : source.points) {
        if (!filter.matches(point.payload)) {
            continue;
        }
        const double score = cosine(vector, point.vector);
        if (min_score && score <= *min_score) {
            continue;
        }
        scored.push_back(ScoredPoint{id, score, point.payload});
    }

    std::sort(scored.begin(), scored.end(), [](const ScoredPoint& lhs, const ScoredPoint& rhs) {
        if (lhs.score != rhs.score) {
            return lhs.score > rhs.score;
        }
        return lhs.id < rhs.id;
    });
    if (scored.size() > static_cast<std::size_t>(top_k)) {
        scored.resize(static_cast<std::size_t>(top_k));
    }
    return scored;
}

std::optional<nlohmann::json> InMemoryVectorStore::get_payload(const std::string& collection, std::uint64_t id) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto& source = require_collection(collection);
    const auto it = source.points.find(id);
    if (it == source.points.end()) {
        return std::nullopt;
    }
    return it->second.payload;
}

std::vector<nlohmann::json> InMemoryVectorStore::scroll(const std::string& collection,
                                                        const PayloadFilter& filter,
                                                        std::size_t limit) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<nlohmann::json> out;
    for (const auto& [id, point] : require_collection(collection).points) {
        if (out.size() >= limit) {
            break;
        }
        if (filter.matches(point.payload)) {
            out.push_back(point.payload);
        }
    }
    return out;
}

std::size_t InMemoryVectorStore::count(const std::string& collection, const PayloadFilter& filter) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto& points = require_collection(collection).points;
    return static_cast<std::size_t>(std::count_if(
        points.begin(), points.end(), [&](const auto& entry) { return filter.matches(entry.second.payload); }));
}

void InMemoryVectorStore::delete_where(const std::string& collection, const PayloadFilter& filter) {
    if (filter.empty()) {
        throw std::invalid_argument("delete_where requires a non-empty filter");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    std::erase_if(require_collection(collection).points,
                  [&](const auto& entry) { return filter.matches(entry.second.payload); });
}

void InMemoryVectorStore::delete_points(const std::string& collection, const std::vector<std::uint64_t>& ids) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& points = require_collection(collection).points;
    for (const auto id : ids) {
        points.erase(id);
    }
}

}  // namespace courserag
