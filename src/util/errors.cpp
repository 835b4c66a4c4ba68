#include "util/errors.hpp"

namespace courserag {

ErrorClass classify_error(const std::exception& ex) {
    if (dynamic_cast<const ParseError*>(&ex) != nullptr) {
        return {422, "PARSE_ERROR"};
    }
    if (dynamic_cast<const ServiceUnavailable*>(&ex) != nullptr) {
        return {503, "SERVICE_UNAVAILABLE"};
    }
    if (dynamic_cast<const TurnCancelled*>(&ex) != nullptr) {
        return {499, "CANCELLED"};
    }
    if (dynamic_cast<const ConfigError*>(&ex) != nullptr) {
        return {500, "CONFIG_ERROR"};
    }

    const std::string message = ex.what();
    if (dynamic_cast<const std::invalid_argument*>(&ex) != nullptr) {
        return {400, message.rfind("invalid JSON", 0) == 0 ? "INVALID_JSON" : "INVALID_REQUEST"};
    }
    if (message.find("minio") != std::string::npos) {
        return {502, "OBJECT_FETCH_ERROR"};
    }
    if (message.find("qdrant") != std::string::npos) {
        return {502, "QDRANT_ERROR"};
    }
    if (message.find("azure") != std::string::npos) {
        return {502, message.find("unauthorized") != std::string::npos ? "AZURE_UNAUTHORIZED" : "AZURE_ERROR"};
    }
    return {};
}

}  // namespace courserag
