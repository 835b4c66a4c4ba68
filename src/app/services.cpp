#include "app/services.hpp"

#include "db/pg_session_store.hpp"
#include "embedding/azure_embedder.hpp"
#include "embedding/hashing_embedder.hpp"
#include "index/memory_vector_store.hpp"
#include "llm/azure_chat_client.hpp"
#include "qdrant/qdrant_client.hpp"
#include "session/memory_session_store.hpp"
#include "tool/course_outline_tool.hpp"
#include "tool/course_search_tool.hpp"
#include "util/log.hpp"

namespace courserag {

std::unique_ptr<Services> build_services(const Config& config, bool with_generation) {
    const auto& settings = config.settings();
    auto services = std::make_unique<Services>();

    if (config.vector_backend() == VectorBackend::Qdrant) {
        services->vector_store = std::make_unique<QdrantClient>(config.qdrant_url());
        log::info("vector backend=qdrant url=" + config.qdrant_url());
    } else {
        services->vector_store = std::make_unique<InMemoryVectorStore>();
        log::info("vector backend=memory");
    }

    if (config.embedder() == EmbedderKind::Azure) {
        services->embedder = std::make_unique<AzureEmbedder>(config);
    } else {
        services->embedder = std::make_unique<HashingEmbedder>(config.embedding_dimension());
    }
    log::info("embedder dimension=" + std::to_string(services->embedder->dimension()));

    services->index = std::make_unique<CourseIndex>(*services->vector_store, *services->embedder);
    services->resolver = std::make_unique<CourseNameResolver>(*services->index, settings.resolver_min_score);
    services->search = std::make_unique<SearchService>(
        *services->index, *services->resolver, settings.max_results, settings.content_min_score);
    services->ingest = std::make_unique<IngestService>(*services->index, CourseChunker{settings.chunker_options()});

    services->tools = std::make_unique<ToolManager>();
    services->tools->register_tool(std::make_unique<CourseSearchTool>(*services->search));
    services->tools->register_tool(std::make_unique<CourseOutlineTool>(*services->index, *services->resolver));

    const auto max_history = static_cast<std::size_t>(settings.max_history);
    if (config.session_backend() == SessionBackend::Postgres) {
        services->sessions = std::make_unique<PostgresSessionStore>(config.pg_conninfo(), max_history);
        log::info("session backend=postgres host=" + config.pg_host());
    } else {
        services->sessions = std::make_unique<InMemorySessionStore>(max_history);
        log::info("session backend=memory");
    }

    if (with_generation) {
        services->generation = std::make_unique<AzureChatClient>(config);
        services->orchestrator = std::make_unique<QueryOrchestrator>(
            *services->generation,
            *services->tools,
            *services->sessions,
            OrchestratorOptions{.max_tool_rounds = settings.max_tool_rounds});
    }
    return services;
}

}  // namespace courserag
