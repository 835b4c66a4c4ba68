#pragma once

#include <string>

#include "chunk/text_chunker.hpp"

namespace courserag {

// Numeric knobs of the retrieval engine. Plain data so components and tests
// can build one without the environment.
struct RagSettings {
    int chunk_size = 800;
    int chunk_overlap = 100;
    int max_results = 5;
    int max_history = 2;
    int max_tool_rounds = 2;
    double resolver_min_score = 0.3;
    double content_min_score = 0.0;

    // Throws ConfigError.
    void validate() const;
    ChunkerOptions chunker_options() const;
};

enum class VectorBackend { Qdrant, Memory };
enum class EmbedderKind { Azure, Hashing };
enum class SessionBackend { Memory, Postgres };

class Config {
public:
    // Reads the process environment. Throws ConfigError on invalid values.
    static Config load();

    const RagSettings& settings() const noexcept { return settings_; }
    VectorBackend vector_backend() const noexcept { return vector_backend_; }
    EmbedderKind embedder() const noexcept { return embedder_; }
    SessionBackend session_backend() const noexcept { return session_backend_; }
    int embedding_dimension() const noexcept { return embedding_dimension_; }
    const std::string& docs_dir() const noexcept { return docs_dir_; }
    const std::string& log_level() const noexcept { return log_level_; }
    const std::string& http_host() const noexcept { return http_host_; }
    int http_port() const noexcept { return http_port_; }

    const std::string& pg_host() const noexcept { return pg_host_; }
    const std::string& pg_port() const noexcept { return pg_port_; }
    const std::string& pg_database() const noexcept { return pg_database_; }
    const std::string& pg_user() const noexcept { return pg_user_; }
    const std::string& pg_password() const noexcept { return pg_password_; }
    const std::string& azure_endpoint() const noexcept { return azure_endpoint_; }
    const std::string& azure_api_key() const noexcept { return azure_api_key_; }
    const std::string& azure_api_version() const noexcept { return azure_api_version_; }
    const std::string& azure_embedding_deployment() const noexcept { return azure_embedding_deployment_; }
    const std::string& azure_chat_deployment() const noexcept { return azure_chat_deployment_; }
    const std::string& azure_chat_endpoint_override() const noexcept { return azure_chat_endpoint_override_; }
    const std::string& azure_chat_api_version() const noexcept { return azure_chat_api_version_; }
    const std::string& kafka_brokers() const noexcept { return kafka_brokers_; }
    const std::string& kafka_worker_group() const noexcept { return kafka_worker_group_; }
    const std::string& qdrant_url() const noexcept { return qdrant_url_; }
    const std::string& minio_endpoint() const noexcept { return minio_endpoint_; }
    const std::string& minio_bucket() const noexcept { return minio_bucket_; }

    // Returns libpq-compatible connection information string.
    std::string pg_conninfo() const;
    std::string azure_embedding_url() const;
    std::string azure_chat_url() const;

private:
    Config() = default;

    RagSettings settings_;
    VectorBackend vector_backend_ = VectorBackend::Qdrant;
    EmbedderKind embedder_ = EmbedderKind::Azure;
    SessionBackend session_backend_ = SessionBackend::Memory;
    int embedding_dimension_ = 3072;
    std::string docs_dir_;
    std::string log_level_;
    std::string http_host_;
    int http_port_ = 8080;

    std::string pg_host_;
    std::string pg_port_;
    std::string pg_database_;
    std::string pg_user_;
    std::string pg_password_;
    std::string azure_endpoint_;
    std::string azure_api_key_;
    std::string azure_api_version_;
    std::string azure_embedding_deployment_;
    std::string azure_chat_deployment_;
    std::string azure_chat_api_version_;
    std::string azure_chat_endpoint_override_;
    std::string kafka_brokers_;
    std::string kafka_worker_group_;
    std::string qdrant_url_;
    std::string minio_endpoint_;
    std::string minio_bucket_;
};

}  // namespace courserag
