#pragma once

#include <exception>
#include <stdexcept>
#include <string>

namespace courserag {

// Invalid or inconsistent settings; fatal at startup.
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Malformed course document. Ingestion of that document is aborted.
class ParseError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Vector database or generation service could not be reached, or kept
// failing with retryable statuses.
class ServiceUnavailable : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Tool-call loop bound exceeded or malformed tool arguments. Never escapes a
// query turn.
class OrchestrationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class TurnCancelled : public std::runtime_error {
public:
    TurnCancelled() : std::runtime_error("query turn cancelled") {}
};

// How a failure is reported to the outside: HTTP status for the API and a
// stable code for JSON error bodies and the Kafka failure topic.
struct ErrorClass {
    int http_status = 500;
    std::string code = "INTERNAL_ERROR";
};

ErrorClass classify_error(const std::exception& ex);

}  // namespace courserag
