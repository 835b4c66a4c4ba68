#include "config/config.hpp"

#include <cstdlib>
#include <sstream>
#include <stdexcept>
#include <utility>

#include "util/errors.hpp"
#include "util/log.hpp"

namespace courserag
{
    namespace
    {

        std::string env_or_default(const char *name, const char *default_value)
        {
            if (const char *value = std::getenv(name); value && *value)
            {
                return value;
            }
            return default_value;
        }

        int env_int(const char *name, int default_value)
        {
            const std::string raw = env_or_default(name, "");
            if (raw.empty())
            {
                return default_value;
            }
            std::size_t consumed = 0;
            int value = 0;
            try
            {
                value = std::stoi(raw, &consumed);
            }
            catch (const std::exception &)
            {
                throw ConfigError(std::string{name} + " must be an integer, got '" + raw + "'");
            }
            if (consumed != raw.size())
            {
                throw ConfigError(std::string{name} + " must be an integer, got '" + raw + "'");
            }
            return value;
        }

        double env_double(const char *name, double default_value)
        {
            const std::string raw = env_or_default(name, "");
            if (raw.empty())
            {
                return default_value;
            }
            std::size_t consumed = 0;
            double value = 0.0;
            try
            {
                value = std::stod(raw, &consumed);
            }
            catch (const std::exception &)
            {
                throw ConfigError(std::string{name} + " must be a number, got '" + raw + "'");
            }
            if (consumed != raw.size())
            {
                throw ConfigError(std::string{name} + " must be a number, got '" + raw + "'");
            }
            return value;
        }

        void require_positive(int value, const char *name)
        {
            if (value <= 0)
            {
                throw ConfigError(std::string{name} + " must be positive, got " + std::to_string(value));
            }
        }

        void require_score(double value, const char *name)
        {
            if (value < -1.0 || value > 1.0)
            {
                throw ConfigError(std::string{name} + " must lie in [-1, 1]");
            }
        }

        VectorBackend parse_vector_backend(const std::string &value)
        {
            if (value == "qdrant")
            {
                return VectorBackend::Qdrant;
            }
            if (value == "memory")
            {
                return VectorBackend::Memory;
            }
            throw ConfigError("unknown COURSERAG_VECTOR_BACKEND: " + value);
        }

        EmbedderKind parse_embedder(const std::string &value)
        {
            if (value == "azure")
            {
                return EmbedderKind::Azure;
            }
            if (value == "hashing")
            {
                return EmbedderKind::Hashing;
            }
            throw ConfigError("unknown COURSERAG_EMBEDDER: " + value);
        }

        SessionBackend parse_session_backend(const std::string &value)
        {
            if (value == "memory")
            {
                return SessionBackend::Memory;
            }
            if (value == "postgres")
            {
                return SessionBackend::Postgres;
            }
            throw ConfigError("unknown COURSERAG_SESSION_BACKEND: " + value);
        }

        std::string append_api_version(std::string url, const std::string &version)
        {
            if (url.find("api-version=") != std::string::npos || version.empty())
            {
                return url;
            }
            const char separator = (url.find('?') == std::string::npos) ? '?' : '&';
            return url + separator + "api-version=" + version;
        }

        std::string strip_trailing_slashes(std::string url)
        {
            while (!url.empty() && url.back() == '/')
            {
                url.pop_back();
            }
            return url;
        }

    } // namespace

    void RagSettings::validate() const
    {
        require_positive(chunk_size, "chunk size");
        require_positive(chunk_overlap, "chunk overlap");
        require_positive(max_results, "max search results");
        require_positive(max_history, "max history length");
        require_positive(max_tool_rounds, "max tool rounds");
        if (chunk_overlap >= chunk_size)
        {
            throw ConfigError("chunk overlap must be smaller than chunk size");
        }
        require_score(resolver_min_score, "resolver min score");
        require_score(content_min_score, "content min score");
    }

    ChunkerOptions RagSettings::chunker_options() const
    {
        return ChunkerOptions{
            .chunk_size = static_cast<std::size_t>(chunk_size),
            .chunk_overlap = static_cast<std::size_t>(chunk_overlap),
        };
    }

    Config Config::load()
    {
        Config config;

        config.settings_.chunk_size = env_int("COURSERAG_CHUNK_SIZE", 800);
        config.settings_.chunk_overlap = env_int("COURSERAG_CHUNK_OVERLAP", 100);
        config.settings_.max_results = env_int("COURSERAG_MAX_RESULTS", 5);
        config.settings_.max_history = env_int("COURSERAG_MAX_HISTORY", 2);
        config.settings_.max_tool_rounds = env_int("COURSERAG_MAX_TOOL_ROUNDS", 2);
        config.settings_.resolver_min_score = env_double("COURSERAG_RESOLVER_MIN_SCORE", 0.3);
        config.settings_.content_min_score = env_double("COURSERAG_CONTENT_MIN_SCORE", 0.0);
        config.settings_.validate();

        config.vector_backend_ = parse_vector_backend(env_or_default("COURSERAG_VECTOR_BACKEND", "qdrant"));
        config.embedder_ = parse_embedder(env_or_default("COURSERAG_EMBEDDER", "azure"));
        config.session_backend_ = parse_session_backend(env_or_default("COURSERAG_SESSION_BACKEND", "memory"));
        config.embedding_dimension_ = env_int("COURSERAG_EMBEDDING_DIMENSION", 3072);
        require_positive(config.embedding_dimension_, "COURSERAG_EMBEDDING_DIMENSION");
        config.docs_dir_ = env_or_default("COURSERAG_DOCS_DIR", "docs");
        config.log_level_ = env_or_default("COURSERAG_LOG_LEVEL", "info");
        log::parse_level(config.log_level_);
        config.http_host_ = env_or_default("COURSERAG_HTTP_HOST", "0.0.0.0");
        config.http_port_ = env_int("COURSERAG_HTTP_PORT", 8080);
        require_positive(config.http_port_, "COURSERAG_HTTP_PORT");

        config.pg_host_ = env_or_default("PGHOST", "postgres");
        config.pg_port_ = env_or_default("PGPORT", "5432");
        config.pg_database_ = env_or_default("PGDATABASE", "course_rag");
        config.pg_user_ = env_or_default("PGUSER", "rag_user");
        config.pg_password_ = env_or_default("PGPASSWORD", "rag_pass");

        config.azure_endpoint_ = env_or_default("AZURE_OPENAI_ENDPOINT", "");
        config.azure_api_key_ = env_or_default("AZURE_OPENAI_API_KEY", "");
        config.azure_api_version_ = env_or_default("AZURE_OPENAI_API_VERSION", "");
        config.azure_embedding_deployment_ = env_or_default("AZURE_OPENAI_EMBEDDING_DEPLOYMENT", "");
        config.azure_chat_deployment_ = env_or_default("AZURE_OPENAI_CHAT_DEPLOYMENT", "");
        config.azure_chat_endpoint_override_ = env_or_default("AZURE_OPENAI_CHAT_ENDPOINT", "");
        config.azure_chat_api_version_ = env_or_default("AZURE_OPENAI_CHAT_API_VERSION", "");
        if (config.azure_chat_api_version_.empty())
        {
            config.azure_chat_api_version_ = config.azure_api_version_;
        }

        config.kafka_brokers_ = env_or_default("KAFKA_BROKERS", "redpanda:9092");
        config.kafka_worker_group_ = env_or_default("KAFKA_WORKER_GROUP", "course-rag-worker");
        config.qdrant_url_ = env_or_default("QDRANT_URL", "http://qdrant:6333");
        config.minio_endpoint_ = env_or_default("MINIO_ENDPOINT", "http://minio:9000");
        config.minio_bucket_ = env_or_default("MINIO_BUCKET", "course-docs");

        log::debug("config loaded");
        return config;
    }

    std::string Config::pg_conninfo() const
    {
        std::ostringstream oss;
        oss << "host=" << pg_host_;
        oss << " port=" << pg_port_;
        oss << " dbname=" << pg_database_;
        oss << " user=" << pg_user_;
        oss << " password=" << pg_password_;
        return oss.str();
    }

    std::string Config::azure_embedding_url() const
    {
        if (azure_endpoint_.empty())
        {
            return "";
        }
        if (azure_endpoint_.find("embeddings") != std::string::npos)
        {
            return append_api_version(azure_endpoint_, azure_api_version_);
        }
        if (azure_embedding_deployment_.empty())
        {
            return "";
        }

        std::ostringstream oss;
        oss << strip_trailing_slashes(azure_endpoint_) << "/openai/deployments/" << azure_embedding_deployment_
            << "/embeddings";
        return append_api_version(oss.str(), azure_api_version_);
    }

    std::string Config::azure_chat_url() const
    {
        auto build_responses = [&](const std::string &base_url) -> std::string
        {
            if (azure_chat_deployment_.empty())
            {
                return "";
            }
            std::ostringstream oss;
            oss << strip_trailing_slashes(base_url) << "/openai/deployments/" << azure_chat_deployment_ << "/responses";
            return append_api_version(oss.str(), azure_chat_api_version_);
        };

        auto normalize = [&](const std::string &value) -> std::string
        {
            if (value.empty())
            {
                return "";
            }
            if (value.find("responses") != std::string::npos)
            {
                return append_api_version(value, azure_chat_api_version_);
            }
            if (value.find("chat/completions") != std::string::npos)
            {
                if (value.find("/openai/v1") != std::string::npos)
                {
                    return value;
                }
                return append_api_version(value, azure_chat_api_version_);
            }
            if (value.find("openai/v1") != std::string::npos)
            {
                return strip_trailing_slashes(value) + "/chat/completions";
            }
            return build_responses(value);
        };

        if (!azure_chat_endpoint_override_.empty())
        {
            return normalize(azure_chat_endpoint_override_);
        }
        return normalize(azure_endpoint_);
    }

} // namespace courserag
