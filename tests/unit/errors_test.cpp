#include "util/errors.hpp"

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

void Expect(const std::exception& ex, int status, const std::string& code) {
    const auto error_class = courserag::classify_error(ex);
    Require(error_class.http_status == status && error_class.code == code,
            std::string{"unexpected classification for '"} + ex.what() + "': " +
                std::to_string(error_class.http_status) + " " + error_class.code);
}

void ScenarioTypedErrors() {
    courserag::tests::Log("scenario: typed errors map to fixed statuses and codes");
    Expect(courserag::ParseError("missing title"), 422, "PARSE_ERROR");
    Expect(courserag::ServiceUnavailable("qdrant unreachable"), 503, "SERVICE_UNAVAILABLE");
    Expect(courserag::TurnCancelled(), 499, "CANCELLED");
    Expect(courserag::ConfigError("missing azure key"), 500, "CONFIG_ERROR");
    Expect(std::invalid_argument("invalid JSON: unexpected end"), 400, "INVALID_JSON");
    Expect(std::invalid_argument("missing field: query"), 400, "INVALID_REQUEST");
}

void ScenarioUpstreamMessages() {
    courserag::tests::Log("scenario: untyped upstream failures are classified by origin");
    Expect(std::runtime_error("minio get_object failed for course-docs/a.txt"), 502, "OBJECT_FETCH_ERROR");
    Expect(std::runtime_error("qdrant search failed with status 400"), 502, "QDRANT_ERROR");
    Expect(std::runtime_error("azure chat unauthorized (status 401)"), 502, "AZURE_UNAUTHORIZED");
    Expect(std::runtime_error("azure chat failed with status 400"), 502, "AZURE_ERROR");
    Expect(std::runtime_error("something else broke"), 500, "INTERNAL_ERROR");
}

}  // namespace

int main() {
    try {
        courserag::tests::Log("errors_test: start");
        ScenarioTypedErrors();
        ScenarioUpstreamMessages();
        courserag::tests::Log("errors_test: finished");
        return EXIT_SUCCESS;
    } catch (const std::exception& ex) {
        courserag::tests::LogError(ex.what());
        return EXIT_FAILURE;
    }
}
