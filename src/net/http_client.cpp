#include "net/http_client.hpp"

#include <curl/curl.h>

#include <memory>
#include <stdexcept>
#include <string_view>

#include "util/errors.hpp"

namespace courserag {
namespace {

class CurlGlobal {
public:
    CurlGlobal() { curl_global_init(CURL_GLOBAL_DEFAULT); }
    ~CurlGlobal() { curl_global_cleanup(); }
};

CurlGlobal& global_curl() {
    static CurlGlobal global;
    return global;
}

struct CurlEasyDeleter {
    void operator()(CURL* curl) const { curl_easy_cleanup(curl); }
};

struct CurlSlistDeleter {
    void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};

size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    const size_t total = size * nmemb;
    auto* buffer = static_cast<std::string*>(userdata);
    buffer->append(ptr, total);
    return total;
}

// Non-zero return aborts the transfer with CURLE_ABORTED_BY_CALLBACK.
int progress_callback(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    const auto* flag = static_cast<const std::atomic<bool>*>(clientp);
    return (flag != nullptr && flag->load(std::memory_order_acquire)) ? 1 : 0;
}

}  // namespace

HttpResponse perform_http_request(const HttpRequest& request) {
    global_curl();
    std::unique_ptr<CURL, CurlEasyDeleter> curl(curl_easy_init());
    if (!curl) {
        throw std::runtime_error("failed to initialize curl");
    }

    std::string response_body;
    curl_easy_setopt(curl.get(), CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response_body);
    curl_easy_setopt(curl.get(), CURLOPT_CUSTOMREQUEST, request.method.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    if (request.timeout_seconds > 0) {
        curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, request.timeout_seconds);
    }
    if (request.cancel_flag != nullptr) {
        curl_easy_setopt(curl.get(), CURLOPT_XFERINFOFUNCTION, progress_callback);
        curl_easy_setopt(curl.get(), CURLOPT_XFERINFODATA, const_cast<std::atomic<bool>*>(request.cancel_flag));
        curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 0L);
    }

    std::unique_ptr<curl_slist, CurlSlistDeleter> headers;
    for (const auto& header : request.headers) {
        curl_slist* appended = curl_slist_append(headers.get(), header.c_str());
        if (appended == nullptr) {
            throw std::runtime_error("failed to append curl header");
        }
        headers.release();
        headers.reset(appended);
    }
    if (headers) {
        curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
    }

    if (!request.body.empty()) {
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, request.body.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body.size()));
    } else if (request.method == "POST" || request.method == "PUT" || request.method == "PATCH") {
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, 0L);
    }

    const CURLcode code = curl_easy_perform(curl.get());
    if (code == CURLE_ABORTED_BY_CALLBACK) {
        throw TurnCancelled();
    }
    if (code != CURLE_OK) {
        throw ServiceUnavailable(std::string{"curl request failed: "} + curl_easy_strerror(code) + " url=" +
                                 request.url);
    }

    long status_code = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &status_code);
    return HttpResponse{status_code, std::move(response_body)};
}

std::string body_preview(const std::string& body, std::size_t limit) {
    return body.size() > limit ? body.substr(0, limit) + "..." : body;
}

}  // namespace courserag
