#pragma once

#include <memory>

#include "config/config.hpp"
#include "embedding/embedder.hpp"
#include "index/course_index.hpp"
#include "index/vector_store.hpp"
#include "llm/generation_client.hpp"
#include "service/course_name_resolver.hpp"
#include "service/ingest_service.hpp"
#include "service/query_orchestrator.hpp"
#include "service/search_service.hpp"
#include "session/session_store.hpp"
#include "tool/tool_manager.hpp"

namespace courserag {

// Owns every engine component for the lifetime of the process. Members are
// declared in dependency order so destruction runs dependents first.
struct Services {
    std::unique_ptr<VectorStore> vector_store;
    std::unique_ptr<Embedder> embedder;
    std::unique_ptr<CourseIndex> index;
    std::unique_ptr<CourseNameResolver> resolver;
    std::unique_ptr<SearchService> search;
    std::unique_ptr<IngestService> ingest;
    std::unique_ptr<ToolManager> tools;
    std::unique_ptr<SessionStore> sessions;
    // Null unless built with generation.
    std::unique_ptr<GenerationClient> generation;
    std::unique_ptr<QueryOrchestrator> orchestrator;
};

// Builds the backends named by the configuration. Without generation only
// ingestion, search and analytics are usable, which is all the offline CLI
// modes need. Throws ConfigError.
std::unique_ptr<Services> build_services(const Config& config, bool with_generation);

}  // namespace courserag
