#include "qdrant/qdrant_client.hpp"

#include <algorithm>
#include <stdexcept>

#include "net/http_client.hpp"
#include "util/errors.hpp"

namespace courserag
{
    namespace
    {

        constexpr std::size_t kUpsertBatchSize = 64;
        constexpr std::size_t kScrollPageSize = 256;

        std::string ensure_no_trailing_slash(std::string url)
        {
            while (!url.empty() && url.back() == '/')
            {
                url.pop_back();
            }
            return url;
        }

        // 5xx means the database is there but not serving; the caller decides
        // whether to retry.
        [[noreturn]] void throw_for_status(const HttpResponse &response, const std::string &action)
        {
            const std::string message = "qdrant " + action + " failed with status " + std::to_string(response.status) +
                                        " body: " + body_preview(response.body);
            if (response.status >= 500)
            {
                throw ServiceUnavailable(message);
            }
            throw std::runtime_error(message);
        }

        nlohmann::json parse_result(const HttpResponse &response, const std::string &action)
        {
            nlohmann::json json;
            try
            {
                json = nlohmann::json::parse(response.body);
            }
            catch (const nlohmann::json::exception &ex)
            {
                throw std::runtime_error("failed to parse qdrant " + action + " response: " + ex.what());
            }
            if (!json.contains("result"))
            {
                throw std::runtime_error("qdrant " + action + " response missing result");
            }
            return json["result"];
        }

    }

    nlohmann::json to_qdrant_filter(const PayloadFilter &filter)
    {
        nlohmann::json must = nlohmann::json::array();
        for (const auto &condition : filter.must)
        {
            must.push_back({{"key", condition.key}, {"match", {{"value", condition.value}}}});
        }
        return nlohmann::json{{"must", must}};
    }

    QdrantClient::QdrantClient(std::string base_url) : base_url_(ensure_no_trailing_slash(std::move(base_url))) {}

    std::string QdrantClient::collection_url(const std::string &collection_name) const
    {
        return base_url_ + "/collections/" + collection_name;
    }

    nlohmann::json QdrantClient::post_json(const std::string &url, const nlohmann::json &body, const std::string &action) const
    {
        const HttpRequest request{
            .method = "POST",
            .url = url,
            .headers = {"Content-Type: application/json"},
            .body = body.dump(),
            .timeout_seconds = 20,
        };

        const auto response = perform_http_request(request);
        if (response.status == 404)
        {
            throw std::runtime_error("qdrant collection not found: " + url);
        }
        if (response.status != 200)
        {
            throw_for_status(response, action);
        }
        return parse_result(response, action);
    }

    void QdrantClient::ensure_collection(const std::string &collection_name, int dimension)
    {
        const HttpRequest get_request{
            .method = "GET",
            .url = collection_url(collection_name),
            .headers = {},
            .body = {},
            .timeout_seconds = 10,
        };

        HttpResponse response = perform_http_request(get_request);
        if (response.status == 200)
        {
            return;
        }
        if (response.status != 404)
        {
            throw_for_status(response, "collection check");
        }

        nlohmann::json body;
        body["vectors"] = {{"size", dimension}, {"distance", "Cosine"}};
        const HttpRequest put_request{
            .method = "PUT",
            .url = collection_url(collection_name),
            .headers = {"Content-Type: application/json"},
            .body = body.dump(),
            .timeout_seconds = 10,
        };

        response = perform_http_request(put_request);
        if (response.status != 200)
        {
            throw_for_status(response, "create collection");
        }
    }

    void QdrantClient::upsert(const std::string &collection_name, const std::vector<VectorPoint> &points)
    {
        for (std::size_t begin = 0; begin < points.size(); begin += kUpsertBatchSize)
        {
            const std::size_t end = std::min(points.size(), begin + kUpsertBatchSize);
            nlohmann::json body;
            body["points"] = nlohmann::json::array();
            for (std::size_t i = begin; i < end; ++i)
            {
                body["points"].push_back({
                    {"id", points[i].id},
                    {"vector", points[i].vector},
                    {"payload", points[i].payload},
                });
            }

            const HttpRequest request{
                .method = "PUT",
                .url = collection_url(collection_name) + "/points?wait=true",
                .headers = {"Content-Type: application/json"},
                .body = body.dump(),
                .timeout_seconds = 30,
            };

            const auto response = perform_http_request(request);
            if (response.status != 200)
            {
                throw_for_status(response, "upsert");
            }
        }
    }

    std::vector<ScoredPoint> QdrantClient::search(const std::string &collection_name,
                                                  const std::vector<float> &vector,
                                                  int top_k,
                                                  const PayloadFilter &filter,
                                                  std::optional<double> min_score)
    {
        if (top_k <= 0)
        {
            throw std::runtime_error("qdrant search requires top_k > 0");
        }

        nlohmann::json body;
        body["vector"] = vector;
        body["limit"] = top_k;
        body["with_payload"] = true;
        if (!filter.empty())
        {
            body["filter"] = to_qdrant_filter(filter);
        }
        if (min_score)
        {
            body["score_threshold"] = *min_score;
        }

        const auto result = post_json(collection_url(collection_name) + "/points/search", body, "search");
        if (!result.is_array())
        {
            throw std::runtime_error("qdrant search response missing result array");
        }

        std::vector<ScoredPoint> points;
        for (const auto &item : result)
        {
            if (!item.contains("score") || !item.contains("id"))
            {
                throw std::runtime_error("qdrant search result missing score or id");
            }
            if (!item.contains("payload") || !item["payload"].is_object())
            {
                throw std::runtime_error("qdrant search result missing payload");
            }
            ScoredPoint point;
            point.id = item["id"].get<std::uint64_t>();
            point.score = item["score"].get<double>();
            point.payload = item["payload"];
            // score_threshold is inclusive on the server side.
            if (min_score && point.score <= *min_score)
            {
                continue;
            }
            points.push_back(std::move(point));
        }
        return points;
    }

    std::optional<nlohmann::json> QdrantClient::get_payload(const std::string &collection_name, std::uint64_t id)
    {
        const HttpRequest request{
            .method = "GET",
            .url = collection_url(collection_name) + "/points/" + std::to_string(id),
            .headers = {},
            .body = {},
            .timeout_seconds = 10,
        };

        const auto response = perform_http_request(request);
        if (response.status == 404)
        {
            return std::nullopt;
        }
        if (response.status != 200)
        {
            throw_for_status(response, "get point");
        }
        const auto result = parse_result(response, "get point");
        if (!result.is_object() || !result.contains("payload"))
        {
            return std::nullopt;
        }
        return result["payload"];
    }

    std::vector<nlohmann::json> QdrantClient::scroll(const std::string &collection_name,
                                                     const PayloadFilter &filter,
                                                     std::size_t limit)
    {
        std::vector<nlohmann::json> payloads;
        nlohmann::json offset = nullptr;
        while (payloads.size() < limit)
        {
            nlohmann::json body;
            body["limit"] = std::min(kScrollPageSize, limit - payloads.size());
            body["with_payload"] = true;
            body["with_vector"] = false;
            if (!filter.empty())
            {
                body["filter"] = to_qdrant_filter(filter);
            }
            if (!offset.is_null())
            {
                body["offset"] = offset;
            }

            const auto result = post_json(collection_url(collection_name) + "/points/scroll", body, "scroll");
            if (!result.contains("points") || !result["points"].is_array())
            {
                throw std::runtime_error("qdrant scroll response missing points");
            }
            for (const auto &point : result["points"])
            {
                payloads.push_back(point.value("payload", nlohmann::json::object()));
            }
            offset = result.value("next_page_offset", nlohmann::json{});
            if (offset.is_null() || result["points"].empty())
            {
                break;
            }
        }
        return payloads;
    }

    std::size_t QdrantClient::count(const std::string &collection_name, const PayloadFilter &filter)
    {
        nlohmann::json body;
        body["exact"] = true;
        if (!filter.empty())
        {
            body["filter"] = to_qdrant_filter(filter);
        }
        const auto result = post_json(collection_url(collection_name) + "/points/count", body, "count");
        if (!result.contains("count"))
        {
            throw std::runtime_error("qdrant count response missing count");
        }
        return result["count"].get<std::size_t>();
    }

    void QdrantClient::delete_where(const std::string &collection_name, const PayloadFilter &filter)
    {
        if (filter.empty())
        {
            throw std::invalid_argument("qdrant delete requires a non-empty filter");
        }
        nlohmann::json body;
        body["filter"] = to_qdrant_filter(filter);
        post_json(collection_url(collection_name) + "/points/delete?wait=true", body, "delete");
    }

    void QdrantClient::delete_points(const std::string &collection_name, const std::vector<std::uint64_t> &ids)
    {
        if (ids.empty())
        {
            return;
        }
        nlohmann::json body;
        body["points"] = ids;
        post_json(collection_url(collection_name) + "/points/delete?wait=true", body, "delete");
    }

}
