#include "chunk/course_chunker.hpp"
#include "embedding/hashing_embedder.hpp"
#include "index/course_index.hpp"
#include "index/memory_vector_store.hpp"
#include "service/course_name_resolver.hpp"

#include "../support/sample_courses.hpp"
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

struct Fixture {
    courserag::InMemoryVectorStore store;
    courserag::HashingEmbedder embedder{courserag::tests::kTestEmbeddingDimension};
    courserag::CourseIndex index{store, embedder};
    courserag::CourseNameResolver resolver{index, 0.3};

    Fixture() {
        const courserag::CourseChunker chunker{courserag::ChunkerOptions{}};
        for (const auto* document : {&courserag::tests::kMcpCourse, &courserag::tests::kRetrievalCourse}) {
            const auto chunked = chunker.chunk(*document);
            index.replace_course(chunked.course, chunked.chunks);
        }
    }
};

void ScenarioEmptyCatalog() {
    courserag::tests::Log("scenario: empty catalog resolves nothing");
    courserag::InMemoryVectorStore store;
    courserag::HashingEmbedder embedder(courserag::tests::kTestEmbeddingDimension);
    courserag::CourseIndex index(store, embedder);
    const courserag::CourseNameResolver resolver(index, 0.3);
    Require(!resolver.resolve("MCP").has_value(), "empty catalog must yield NotFound");
}

void ScenarioFuzzyNames() {
    courserag::tests::Log("scenario: fuzzy names resolve to canonical titles");
    Fixture fixture;
    const auto mcp = fixture.resolver.resolve("MCP");
    Require(mcp.has_value() && mcp->title == "Intro to MCP", "'MCP' must resolve to 'Intro to MCP'");
    const auto retrieval = fixture.resolver.resolve("retrieval");
    Require(retrieval.has_value() && retrieval->title == "Advanced Retrieval Techniques",
            "'retrieval' must resolve to the retrieval course");
    courserag::tests::LogKV("mcp_score", std::to_string(mcp->score));
}

void ScenarioExactTitleScoresHighest() {
    courserag::tests::Log("scenario: exact title scores at least as high as a different title");
    Fixture fixture;
    const auto exact = fixture.resolver.best_match("Intro to MCP");
    const auto other = fixture.resolver.best_match("Advanced Retrieval Techniques");
    Require(exact.has_value() && exact->title == "Intro to MCP", "exact title resolves to itself");
    Require(other.has_value() && other->title != "Intro to MCP", "different title resolves elsewhere");

    const auto matches = fixture.index.query_catalog("Intro to MCP", 2);
    Require(matches.size() == 2, "both catalog records expected");
    Require(matches[0].course.title == "Intro to MCP", "exact title ranks first");
    Require(matches[0].score >= matches[1].score, "exact title scores at least as high");
}

void ScenarioBelowThreshold() {
    courserag::tests::Log("scenario: weak matches are NotFound");
    Fixture fixture;
    Require(!fixture.resolver.resolve("Quantum Physics").has_value(), "unrelated name must not resolve");
    Require(!fixture.resolver.resolve("   ").has_value(), "blank name must not resolve");
    const auto best = fixture.resolver.best_match("Quantum Physics");
    Require(best.has_value() && best->score < fixture.resolver.min_score(),
            "best_match still reports the closest record");
}

}  // namespace

int main() {
    try {
        courserag::tests::Log("course_name_resolver_test: start");
        ScenarioEmptyCatalog();
        ScenarioFuzzyNames();
        ScenarioExactTitleScoresHighest();
        ScenarioBelowThreshold();
        courserag::tests::Log("course_name_resolver_test: finished");
        return EXIT_SUCCESS;
    } catch (const std::exception& ex) {
        courserag::tests::LogError(ex.what());
        return EXIT_FAILURE;
    }
}
