#pragma once

#include <atomic>
#include <cstddef>
#include <string>
#include <vector>

namespace courserag {

struct HttpRequest {
    std::string method = "GET";
    std::string url;
    std::vector<std::string> headers;
    std::string body;
    long timeout_seconds = 30;
    // When set and raised while the transfer is running, the request is
    // aborted and TurnCancelled is thrown.
    const std::atomic<bool>* cancel_flag = nullptr;
};

struct HttpResponse {
    long status = 0;
    std::string body;
};

// Throws ServiceUnavailable when the transfer itself fails (DNS, connect,
// timeout). Any HTTP status is returned to the caller.
HttpResponse perform_http_request(const HttpRequest& request);

// Truncates a response body for inclusion in error messages.
std::string body_preview(const std::string& body, std::size_t limit = 512);

}  // namespace courserag
