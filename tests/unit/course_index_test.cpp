#include "chunk/course_chunker.hpp"
#include "embedding/hashing_embedder.hpp"
#include "index/course_index.hpp"
#include "index/memory_vector_store.hpp"
#include "util/errors.hpp"

#include "../support/sample_courses.hpp"
#include "../test_logger.hpp"

#include <atomic>
#include <cstdlib>
#include <exception>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace {

void Require(bool condition, const std::string& message) {
    if (!condition) {
        throw std::runtime_error(message);
    }
}

// Delegates to an in-memory store but can be told to fail content upserts.
class FlakyVectorStore final : public courserag::VectorStore {
public:
    bool fail_content_upsert = false;

    void ensure_collection(const std::string& collection, int dimension) override {
        inner_.ensure_collection(collection, dimension);
    }
    void upsert(const std::string& collection, const std::vector<courserag::VectorPoint>& points) override {
        if (fail_content_upsert && collection == courserag::CourseIndex::kContentCollection) {
            throw courserag::ServiceUnavailable("vector store unreachable");
        }
        inner_.upsert(collection, points);
    }
    std::vector<courserag::ScoredPoint> search(const std::string& collection,
                                               const std::vector<float>& vector,
                                               int top_k,
                                               const courserag::PayloadFilter& filter,
                                               std::optional<double> min_score) override {
        return inner_.search(collection, vector, top_k, filter, min_score);
    }
    std::optional<nlohmann::json> get_payload(const std::string& collection, std::uint64_t id) override {
        return inner_.get_payload(collection, id);
    }
    std::vector<nlohmann::json> scroll(const std::string& collection,
                                       const courserag::PayloadFilter& filter,
                                       std::size_t limit) override {
        return inner_.scroll(collection, filter, limit);
    }
    std::size_t count(const std::string& collection, const courserag::PayloadFilter& filter) override {
        return inner_.count(collection, filter);
    }
    void delete_where(const std::string& collection, const courserag::PayloadFilter& filter) override {
        inner_.delete_where(collection, filter);
    }
    void delete_points(const std::string& collection, const std::vector<std::uint64_t>& ids) override {
        inner_.delete_points(collection, ids);
    }

private:
    courserag::InMemoryVectorStore inner_;
};

const courserag::CourseChunker& Chunker() {
    static const courserag::CourseChunker chunker{courserag::ChunkerOptions{.chunk_size = 60, .chunk_overlap = 30}};
    return chunker;
}

void ScenarioReingestIsIdempotent() {
    courserag::tests::Log("scenario: re-ingestion leaves the same content count");
    courserag::InMemoryVectorStore store;
    courserag::HashingEmbedder embedder(courserag::tests::kTestEmbeddingDimension);
    courserag::CourseIndex index(store, embedder);

    const auto chunked = Chunker().chunk(courserag::tests::kMcpCourse);
    index.replace_course(chunked.course, chunked.chunks);
    const auto once = index.content_count();
    index.replace_course(chunked.course, chunked.chunks);
    const auto twice = index.content_count();

    courserag::tests::LogKV("content_count", static_cast<std::uint64_t>(twice));
    Require(once == chunked.chunks.size(), "one content record per chunk");
    Require(twice == once, "ingesting twice must not duplicate content");
    Require(index.course_titles() == std::vector<std::string>{"Intro to MCP"}, "one catalog record expected");
}

void ScenarioReplaceDropsStaleContent() {
    courserag::tests::Log("scenario: replace clears stale chunks and lesson list");
    courserag::InMemoryVectorStore store;
    courserag::HashingEmbedder embedder(courserag::tests::kTestEmbeddingDimension);
    courserag::CourseIndex index(store, embedder);

    const auto full = Chunker().chunk(courserag::tests::kMcpCourse);
    index.replace_course(full.course, full.chunks);

    const auto edited = Chunker().chunk(
        "Course Title: Intro to MCP\n"
        "Lesson 1: Only Lesson\n"
        "A single short lesson.\n");
    index.replace_course(edited.course, edited.chunks);

    Require(index.content_count() == edited.chunks.size(), "stale chunks must be removed");
    Require(index.content_count(courserag::ContentFilter{.course_title = "Intro to MCP", .lesson_number = 3}) == 0,
            "removed lesson must have no content left");
    const auto course = index.find_course("Intro to MCP");
    Require(course.has_value(), "catalog record expected");
    Require(course->lessons.size() == 1 && course->lessons[0].title == "Only Lesson",
            "catalog lesson list must be replaced, not merged");
    Require(!course->link.has_value() && !course->instructor.has_value(), "metadata must be replaced entirely");
}

void ScenarioCollectionsStayIndependent() {
    courserag::tests::Log("scenario: catalog and content are separate");
    courserag::InMemoryVectorStore store;
    courserag::HashingEmbedder embedder(courserag::tests::kTestEmbeddingDimension);
    courserag::CourseIndex index(store, embedder);

    const auto mcp = Chunker().chunk(courserag::tests::kMcpCourse);
    const auto retrieval = Chunker().chunk(courserag::tests::kRetrievalCourse);
    index.replace_course(mcp.course, mcp.chunks);
    index.replace_course(retrieval.course, retrieval.chunks);

    const auto catalog = index.query_catalog("reranker", 5);
    for (const auto& match : catalog) {
        Require(match.score == 0.0, "chunk text must not be searchable through the catalog");
    }
    const auto content = index.query_content("reranker", 10, {}, 0.0);
    Require(!content.empty(), "chunk text must be searchable through content");
    for (const auto& match : content) {
        Require(match.course_title == "Advanced Retrieval Techniques", "reranker only appears in retrieval");
    }

    index.remove_course("Intro to MCP");
    Require(!index.has_course("Intro to MCP"), "removed course must leave the catalog");
    Require(index.content_count(courserag::ContentFilter{.course_title = "Intro to MCP"}) == 0,
            "removed course must leave content");
    Require(index.has_course("Advanced Retrieval Techniques"), "other courses untouched");
}

void ScenarioFailedReplaceRollsBack() {
    courserag::tests::Log("scenario: failed write leaves no half-ingested course");
    FlakyVectorStore store;
    courserag::HashingEmbedder embedder(courserag::tests::kTestEmbeddingDimension);
    courserag::CourseIndex index(store, embedder);

    const auto chunked = Chunker().chunk(courserag::tests::kMcpCourse);
    index.replace_course(chunked.course, chunked.chunks);

    store.fail_content_upsert = true;
    bool threw = false;
    try {
        index.replace_course(chunked.course, chunked.chunks);
    } catch (const courserag::ServiceUnavailable&) {
        threw = true;
    }
    Require(threw, "ServiceUnavailable must propagate");
    Require(!index.has_course("Intro to MCP"), "catalog record must be rolled back");
    Require(index.content_count() == 0, "content must be rolled back");
}

void ScenarioConcurrentReadersDuringReingest() {
    courserag::tests::Log("scenario: readers never see a half-replaced course");
    courserag::InMemoryVectorStore store;
    courserag::HashingEmbedder embedder(courserag::tests::kTestEmbeddingDimension);
    courserag::CourseIndex index(store, embedder);

    const auto chunked = Chunker().chunk(courserag::tests::kMcpCourse);
    index.replace_course(chunked.course, chunked.chunks);
    const auto expected = chunked.chunks.size();

    std::atomic<bool> stop{false};
    std::atomic<int> torn_reads{0};
    std::thread reader([&] {
        while (!stop.load()) {
            if (index.content_count() != expected) {
                torn_reads.fetch_add(1);
            }
        }
    });
    std::vector<std::thread> writers;
    for (int t = 0; t < 3; ++t) {
        writers.emplace_back([&] {
            for (int i = 0; i < 20; ++i) {
                index.replace_course(chunked.course, chunked.chunks);
            }
        });
    }
    for (auto& writer : writers) {
        writer.join();
    }
    stop.store(true);
    reader.join();

    Require(torn_reads.load() == 0, "a reader observed a partially replaced content set");
    Require(index.content_count() == expected, "final count must match one ingestion");
}

}  // namespace

int main() {
    try {
        courserag::tests::Log("course_index_test: start");
        ScenarioReingestIsIdempotent();
        ScenarioReplaceDropsStaleContent();
        ScenarioCollectionsStayIndependent();
        ScenarioFailedReplaceRollsBack();
        ScenarioConcurrentReadersDuringReingest();
        courserag::tests::Log("course_index_test: finished");
        return EXIT_SUCCESS;
    } catch (const std::exception& ex) {
        courserag::tests::LogError(ex.what());
        return EXIT_FAILURE;
    }
}
