#pragma once

#include <memory>

#include "chunk/course_chunker.hpp"
#include "embedding/hashing_embedder.hpp"
#include "index/course_index.hpp"
#include "index/memory_vector_store.hpp"
#include "service/course_name_resolver.hpp"
#include "service/search_service.hpp"
#include "tool/course_outline_tool.hpp"
#include "tool/course_search_tool.hpp"
#include "tool/tool_manager.hpp"

#include "sample_courses.hpp"

namespace courserag::tests {

// Offline engine with both sample courses ingested and both tools registered.
struct EngineFixture {
    InMemoryVectorStore store;
    HashingEmbedder embedder{kTestEmbeddingDimension};
    CourseIndex index{store, embedder};
    CourseNameResolver resolver{index, 0.3};
    SearchService search{index, resolver, 5, 0.0};
    ToolManager tools;

    EngineFixture() {
        const CourseChunker chunker{ChunkerOptions{}};
        for (const auto* document : {&kMcpCourse, &kRetrievalCourse}) {
            const auto chunked = chunker.chunk(*document);
            index.replace_course(chunked.course, chunked.chunks);
        }
        tools.register_tool(std::make_unique<CourseSearchTool>(search));
        tools.register_tool(std::make_unique<CourseOutlineTool>(index, resolver));
    }
};

}  // namespace courserag::tests
