#include "http/internal_server.hpp"

#include <chrono>
#include <sstream>
#include <string>
#include <string_view>

#include <httplib.h>
#include <nlohmann/json.hpp>

#include "util/cancellation.hpp"
#include "util/errors.hpp"
#include "util/log.hpp"
#include "util/time.hpp"
#include "util/uuid.hpp"

namespace courserag
{
    namespace
    {

        constexpr std::string_view kJson = "application/json";

        struct HttpError
        {
            int status = 500;
            std::string code = "INTERNAL_ERROR";
            std::string message = "internal server error";
        };

        HttpError classify_exception(const std::exception &ex)
        {
            const auto error_class = classify_error(ex);
            return HttpError{error_class.http_status, error_class.code, ex.what()};
        }

        void set_error_response(httplib::Response &res, const HttpError &error)
        {
            nlohmann::json body;
            body["error"] = {{"code", error.code}, {"message", error.message}};
            res.status = error.status;
            res.set_content(body.dump(), std::string{kJson});
        }

        void set_success(httplib::Response &res, const nlohmann::json &json)
        {
            res.status = 200;
            res.set_content(json.dump(), std::string{kJson});
        }

        nlohmann::json parse_json_or_throw(const std::string &body)
        {
            try
            {
                return nlohmann::json::parse(body);
            }
            catch (const nlohmann::json::exception &ex)
            {
                throw std::invalid_argument(std::string{"invalid JSON: "} + ex.what());
            }
        }

        template <typename T>
        T require_field(const nlohmann::json &json, const char *field)
        {
            if (!json.contains(field))
            {
                throw std::invalid_argument(std::string{"missing field: "} + field);
            }
            try
            {
                return json.at(field).get<T>();
            }
            catch (const nlohmann::json::exception &)
            {
                throw std::invalid_argument(std::string{"invalid field type: "} + field);
            }
        }

        nlohmann::json source_to_json(const SourceAttribution &source)
        {
            nlohmann::json json;
            json["label"] = source.label();
            json["course_title"] = source.course_title;
            json["lesson_number"] = source.lesson_number ? nlohmann::json(*source.lesson_number) : nlohmann::json(nullptr);
            json["link"] = source.link ? nlohmann::json(*source.link) : nlohmann::json(nullptr);
            return json;
        }

        void log_request(const std::string &action,
                         const std::string &trace_id,
                         const std::string &session_id,
                         long latency_ms,
                         int status)
        {
            std::ostringstream oss;
            oss << action << " trace_id=" << trace_id;
            if (!session_id.empty())
            {
                oss << " session=" << session_id;
            }
            oss << " status=" << status << " latency_ms=" << latency_ms;
            log::info(oss.str());
        }

        // Runs a handler body, maps failures to JSON errors and logs the request.
        template <typename Handler>
        void handle(const char *action, httplib::Response &res, Handler &&handler)
        {
            const auto trace_id = uuid::generate();
            const auto start = std::chrono::steady_clock::now();
            std::string session_id;
            try
            {
                handler(trace_id, session_id);
            }
            catch (const std::exception &ex)
            {
                const auto error = classify_exception(ex);
                set_error_response(res, error);
                if (error.status >= 500)
                {
                    log::error(std::string{action} + " trace_id=" + trace_id + " failed: " + ex.what());
                }
                else
                {
                    log::warn(std::string{action} + " trace_id=" + trace_id + " rejected: " + ex.what());
                }
            }
            log_request(action, trace_id, session_id, time::elapsed_ms(start), res.status);
        }

    } // namespace

    int run_http_server(Services &services, const std::string &host, int port)
    {
        httplib::Server server;

        server.Post("/api/query", [&](const httplib::Request &req, httplib::Response &res)
                    { handle("query_http", res, [&](const std::string &, std::string &session_id)
                             {
            if (!services.orchestrator) {
                throw std::runtime_error("query endpoint requires a generation client");
            }
            const auto json = parse_json_or_throw(req.body);
            const auto query = require_field<std::string>(json, "query");
            if (json.contains("session_id") && !json["session_id"].is_null()) {
                session_id = require_field<std::string>(json, "session_id");
            }

            CancellationToken cancel;
            const CancelOnDisconnect watch{cancel, req.is_connection_closed};
            const auto response = services.orchestrator->query(session_id, query, &cancel);
            session_id = response.session_id;

            nlohmann::json body;
            body["answer"] = response.answer;
            body["session_id"] = response.session_id;
            body["partial"] = response.partial;
            body["sources"] = nlohmann::json::array();
            for (const auto& source : response.sources) {
                body["sources"].push_back(source_to_json(source));
            }
            set_success(res, body); }); });

        server.Get("/api/courses", [&](const httplib::Request &, httplib::Response &res)
                   { handle("courses_http", res, [&](const std::string &, std::string &)
                            {
            const auto analytics = services.ingest->analytics();
            set_success(res, {{"total_courses", analytics.total_courses}, {"course_titles", analytics.course_titles}}); }); });

        server.Post("/api/ingest", [&](const httplib::Request &req, httplib::Response &res)
                    { handle("ingest_http", res, [&](const std::string &, std::string &)
                             {
            const auto result = services.ingest->ingest(req.body);

            nlohmann::json lessons = nlohmann::json::array();
            for (const auto& lesson : result.course.lessons) {
                lessons.push_back({
                    {"lesson_number", lesson.number},
                    {"lesson_title", lesson.title},
                    {"lesson_link", lesson.link ? nlohmann::json(*lesson.link) : nlohmann::json(nullptr)},
                });
            }
            nlohmann::json body;
            body["title"] = result.course.title;
            body["instructor"] = result.course.instructor ? nlohmann::json(*result.course.instructor) : nlohmann::json(nullptr);
            body["course_link"] = result.course.link ? nlohmann::json(*result.course.link) : nlohmann::json(nullptr);
            body["lessons"] = lessons;
            body["chunk_count"] = result.chunk_count;
            set_success(res, body); }); });

        server.Post(R"(/api/sessions/([^/]+)/clear)", [&](const httplib::Request &req, httplib::Response &res)
                    { handle("session_clear_http", res, [&](const std::string &, std::string &session_id)
                             {
            session_id = req.matches[1].str();
            services.sessions->clear(session_id);
            set_success(res, {{"session_id", session_id}, {"cleared", true}}); }); });

        server.set_error_handler([](const httplib::Request &, httplib::Response &res)
                                 {
        HttpError error{res.status, "NOT_FOUND", "no such endpoint"};
        if (res.status != 404) {
            error = HttpError{};
        }
        set_error_response(res, error); });

        log::info("http server listening on " + host + ":" + std::to_string(port));
        if (!server.listen(host.c_str(), port))
        {
            log::error("http server failed to start");
            return 2;
        }
        return 0;
    }

} // namespace courserag
