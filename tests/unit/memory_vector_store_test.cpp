#include "index/memory_vector_store.hpp"

#include "../test_logger.hpp"

#include <cstdlib>
#include <exception>
#include <stdexcept>
#include <string>

namespace {

void Require(bool condition, const std::string& message) {
    if (!condition) {
        throw std::runtime_error(message);
    }
}

courserag::VectorPoint MakePoint(std::uint64_t id, float x, float y, const std::string& course, int lesson) {
    return courserag::VectorPoint{id, {x, y}, {{"course_title", course}, {"lesson_number", lesson}}};
}

void ScenarioRankingAndTies() {
    courserag::tests::Log("scenario: cosine ranking with id tie-break");
    courserag::InMemoryVectorStore store;
    store.ensure_collection("c", 2);
    store.upsert("c", {MakePoint(3, 1.0F, 0.0F, "A", 1), MakePoint(1, 1.0F, 0.0F, "A", 2),
                       MakePoint(2, 0.0F, 1.0F, "B", 1)});

    const auto hits = store.search("c", {1.0F, 0.0F}, 3, {}, std::nullopt);
    Require(hits.size() == 3, "all points expected without threshold");
    Require(hits[0].id == 1 && hits[1].id == 3, "equal scores must be ordered by id");
    Require(hits[2].id == 2 && hits[2].score == 0.0, "orthogonal point scores zero");

    const auto above_zero = store.search("c", {1.0F, 0.0F}, 3, {}, 0.0);
    Require(above_zero.size() == 2, "min score keeps only scores strictly above it");

    const auto top_one = store.search("c", {1.0F, 0.0F}, 1, {}, std::nullopt);
    Require(top_one.size() == 1 && top_one[0].id == 1, "top_k must truncate");
}

void ScenarioFilters() {
    courserag::tests::Log("scenario: payload filters");
    courserag::InMemoryVectorStore store;
    store.ensure_collection("c", 2);
    store.upsert("c", {MakePoint(1, 1.0F, 0.0F, "A", 1), MakePoint(2, 1.0F, 0.1F, "A", 2),
                       MakePoint(3, 1.0F, 0.2F, "B", 2)});

    const auto filter = courserag::PayloadFilter{}.where("course_title", "A").where("lesson_number", 2);
    const auto hits = store.search("c", {1.0F, 0.0F}, 10, filter, std::nullopt);
    Require(hits.size() == 1 && hits[0].id == 2, "filter is a conjunction");
    Require(store.count("c", courserag::PayloadFilter{}.where("lesson_number", 2)) == 2, "count honours filter");
    Require(store.scroll("c", {}, 2).size() == 2, "scroll honours limit");

    store.delete_where("c", courserag::PayloadFilter{}.where("course_title", "A"));
    Require(store.count("c", {}) == 1, "delete_where removes matching points");

    bool threw = false;
    try {
        store.delete_where("c", {});
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    Require(threw, "delete_where must refuse an empty filter");
}

void ScenarioUpsertReplacesAndDimensions() {
    courserag::tests::Log("scenario: upsert replaces payload and checks dimensions");
    courserag::InMemoryVectorStore store;
    store.ensure_collection("c", 2);
    store.upsert("c", {MakePoint(7, 1.0F, 0.0F, "A", 1)});
    store.upsert("c", {MakePoint(7, 0.0F, 1.0F, "B", 4)});
    const auto payload = store.get_payload("c", 7);
    Require(payload.has_value() && (*payload)["course_title"] == "B", "upsert must replace the payload");
    Require(store.count("c", {}) == 1, "same id must not duplicate");
    Require(!store.get_payload("c", 8).has_value(), "unknown id reads as empty");

    store.delete_points("c", {7});
    Require(store.count("c", {}) == 0, "delete_points removes by id");

    bool threw = false;
    try {
        store.upsert("c", {courserag::VectorPoint{1, {1.0F, 0.0F, 0.0F}, {}}});
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    Require(threw, "wrong dimension must be rejected");

    threw = false;
    try {
        store.ensure_collection("c", 3);
    } catch (const std::runtime_error&) {
        threw = true;
    }
    Require(threw, "re-creating a collection with another dimension must fail");
}

}  // namespace

int main() {
    try {
        courserag::tests::Log("memory_vector_store_test: start");
        ScenarioRankingAndTies();
        ScenarioFilters();
        ScenarioUpsertReplacesAndDimensions();
        courserag::tests::Log("memory_vector_store_test: finished");
        return EXIT_SUCCESS;
    } catch (const std::exception& ex) {
        courserag::tests::LogError(ex.what());
        return EXIT_FAILURE;
    }
}
