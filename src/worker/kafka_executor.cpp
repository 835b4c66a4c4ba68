#include "worker/kafka_executor.hpp"

#include <chrono>
#include <memory>
#include <sstream>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

#include "mq/kafka_consumer.hpp"
#include "mq/kafka_producer.hpp"
#include "storage/minio_client.hpp"
#include "util/errors.hpp"
#include "util/log.hpp"
#include "util/time.hpp"

namespace courserag {
namespace {

constexpr std::string_view kIngestRequestTopic = "course_ingest_request";
constexpr std::string_view kQueryRequestTopic = "course_query_request";
constexpr std::string_view kIngestResultTopic = "course_ingest_result";
constexpr std::string_view kQueryResultTopic = "course_query_result";
constexpr std::string_view kFailureTopic = "course_failed";

constexpr int kPollTimeoutMs = 1000;

enum class TaskType { Ingest, Query };

struct RequestContext {
    TaskType type = TaskType::Ingest;
    std::string request_id;
    std::string trace_id;
    std::string topic;
    int partition = 0;
    long long offset = 0;
};

std::string task_type_name(TaskType type) {
    return (type == TaskType::Ingest) ? "INGEST" : "QUERY";
}

std::string read_payload(const RdKafka::Message& message) {
    if (message.len() == 0 || message.payload() == nullptr) {
        return {};
    }
    const char* ptr = static_cast<const char*>(message.payload());
    return std::string(ptr, ptr + message.len());
}

nlohmann::json parse_json(const std::string& body) {
    try {
        return nlohmann::json::parse(body);
    } catch (const nlohmann::json::exception& ex) {
        throw std::invalid_argument(std::string{"invalid JSON: "} + ex.what());
    }
}

template <typename T>
T require_field(const nlohmann::json& json, const char* field) {
    if (!json.contains(field)) {
        throw std::invalid_argument(std::string{"missing field: "} + field);
    }
    try {
        return json.at(field).get<T>();
    } catch (const nlohmann::json::exception&) {
        throw std::invalid_argument(std::string{"invalid field type: "} + field);
    }
}

// Only unavailable collaborators are retried; everything else is a property
// of the request and fails the same way again.
template <typename Fn>
auto execute_with_retry(const std::string& request_id, const RetryPolicy& policy, Fn&& fn) -> decltype(fn()) {
    for (int attempt = 1;; ++attempt) {
        try {
            return fn();
        } catch (const ServiceUnavailable& ex) {
            if (attempt >= policy.max_attempts) {
                throw;
            }
            log::warn("kafka_worker request_id=" + request_id + " attempt=" + std::to_string(attempt) +
                      " unavailable: " + ex.what());
            std::this_thread::sleep_for(policy.backoff * attempt);
        }
    }
}

void produce_failure(KafkaProducer& producer,
                     const RequestContext& ctx,
                     const std::string& code,
                     const std::string& message) {
    nlohmann::json body;
    body["request_id"] = ctx.request_id;
    body["trace_id"] = ctx.trace_id;
    body["type"] = task_type_name(ctx.type);
    body["error"] = {{"code", code}, {"message", message}};
    producer.send(std::string{kFailureTopic}, ctx.request_id, body.dump());
}

void produce_ingest_result(KafkaProducer& producer, const RequestContext& ctx, const IngestResult& result) {
    nlohmann::json body;
    body["request_id"] = ctx.request_id;
    body["trace_id"] = ctx.trace_id;
    body["status"] = "OK";
    body["course_title"] = result.course.title;
    body["lesson_count"] = result.course.lessons.size();
    body["chunk_count"] = result.chunk_count;
    producer.send(std::string{kIngestResultTopic}, ctx.request_id, body.dump());
}

void produce_query_result(KafkaProducer& producer, const RequestContext& ctx, const QueryResponse& response) {
    nlohmann::json body;
    body["request_id"] = ctx.request_id;
    body["trace_id"] = ctx.trace_id;
    body["status"] = "OK";
    body["session_id"] = response.session_id;
    body["answer"] = response.answer;
    body["partial"] = response.partial;
    body["sources"] = nlohmann::json::array();
    for (const auto& source : response.sources) {
        nlohmann::json item;
        item["label"] = source.label();
        item["course_title"] = source.course_title;
        item["lesson_number"] = source.lesson_number ? nlohmann::json(*source.lesson_number) : nlohmann::json(nullptr);
        item["link"] = source.link ? nlohmann::json(*source.link) : nlohmann::json(nullptr);
        body["sources"].push_back(std::move(item));
    }
    producer.send(std::string{kQueryResultTopic}, ctx.request_id, body.dump());
}

void log_completion(const RequestContext& ctx, long latency_ms, bool success, const std::string& code) {
    std::ostringstream oss;
    oss << "kafka_worker type=" << task_type_name(ctx.type) << " request_id=" << ctx.request_id
        << " trace_id=" << ctx.trace_id << " topic=" << ctx.topic << " partition=" << ctx.partition
        << " offset=" << ctx.offset << " status=" << (success ? "OK" : "ERROR") << " code=" << code
        << " latency_ms=" << latency_ms;
    if (success) {
        log::info(oss.str());
    } else {
        log::error(oss.str());
    }
}

void commit_or_log(KafkaConsumer& consumer, const RdKafka::Message& message) {
    try {
        consumer.commit(message);
    } catch (const std::exception& ex) {
        log::error(std::string{"commit failed: "} + ex.what());
    }
}

}  // namespace

QueryResponse run_query_request(QueryOrchestrator& orchestrator,
                                SessionStore& sessions,
                                std::string session_id,
                                const std::string& query,
                                const RetryPolicy& policy,
                                const std::string& request_id) {
    if (session_id.empty()) {
        session_id = sessions.create_session();
    }
    return execute_with_retry(request_id, policy, [&]() { return orchestrator.query(session_id, query); });
}

int run_kafka_executor(const Config& config, Services& services) {
    if (!services.orchestrator) {
        log::error("kafka executor requires a generation client");
        return 2;
    }
    try {
        const std::vector<std::string> topics = {
            std::string{kIngestRequestTopic},
            std::string{kQueryRequestTopic},
        };
        KafkaConsumer consumer(config.kafka_brokers(), config.kafka_worker_group(), topics);
        KafkaProducer producer(config.kafka_brokers());
        MinioClient minio(config.minio_endpoint());

        while (true) {
            auto message = consumer.poll(kPollTimeoutMs);
            if (!message) {
                continue;
            }

            const auto start = std::chrono::steady_clock::now();
            RequestContext ctx;
            ctx.topic = message->topic_name();
            ctx.partition = message->partition();
            ctx.offset = message->offset();

            if (ctx.topic == kIngestRequestTopic) {
                ctx.type = TaskType::Ingest;
            } else if (ctx.topic == kQueryRequestTopic) {
                ctx.type = TaskType::Query;
            } else {
                log::error("kafka_worker received message from unexpected topic: " + ctx.topic);
                commit_or_log(consumer, *message);
                continue;
            }

            bool success = false;
            std::string code = "OK";

            try {
                const auto json = parse_json(read_payload(*message));
                ctx.request_id = require_field<std::string>(json, "request_id");
                ctx.trace_id = require_field<std::string>(json, "trace_id");

                if (ctx.type == TaskType::Ingest) {
                    const auto object_key = require_field<std::string>(json, "object_key");
                    const auto result = execute_with_retry(ctx.request_id, RetryPolicy{}, [&]() {
                        const auto text = minio.fetch_text(config.minio_bucket(), object_key);
                        return services.ingest->ingest(text);
                    });
                    produce_ingest_result(producer, ctx, result);
                } else {
                    const auto query = require_field<std::string>(json, "query");
                    std::string session_id;
                    if (json.contains("session_id") && !json["session_id"].is_null()) {
                        session_id = require_field<std::string>(json, "session_id");
                    }
                    const auto response = run_query_request(
                        *services.orchestrator, *services.sessions, session_id, query, RetryPolicy{}, ctx.request_id);
                    produce_query_result(producer, ctx, response);
                }
                success = true;
            } catch (const std::exception& ex) {
                code = classify_error(ex).code;
                produce_failure(producer, ctx, code, ex.what());
            }

            commit_or_log(consumer, *message);
            log_completion(ctx, time::elapsed_ms(start), success, code);
        }
    } catch (const std::exception& ex) {
        log::error(std::string{"kafka executor failed: "} + ex.what());
        return 2;
    }
}

}  // namespace courserag
