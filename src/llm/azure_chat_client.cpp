#include "llm/azure_chat_client.hpp"

#include <chrono>
#include <stdexcept>
#include <thread>

#include <nlohmann/json.hpp>

#include "config/config.hpp"
#include "llm/chat_wire.hpp"
#include "net/http_client.hpp"
#include "util/errors.hpp"
#include "util/log.hpp"

namespace courserag {
namespace {

constexpr int kMaxAttempts = 3;

}  // namespace

AzureChatClient::AzureChatClient(const Config& config)
    : url_(config.azure_chat_url()),
      api_key_(config.azure_api_key()),
      deployment_(config.azure_chat_deployment()),
      max_output_tokens_(800),
      use_responses_(false),
      use_chat_completions_(false) {
    if (url_.empty()) {
        throw ConfigError("missing Azure chat configuration (endpoint/deployment/version)");
    }
    if (api_key_.empty()) {
        throw ConfigError("missing AZURE_OPENAI_API_KEY");
    }

    if (url_.find("responses") != std::string::npos) {
        use_responses_ = true;
    } else if (url_.find("chat/completions") != std::string::npos) {
        use_chat_completions_ = true;
    }

    if (!use_responses_ && !use_chat_completions_) {
        throw ConfigError("unsupported Azure chat endpoint (must contain /responses or /chat/completions)");
    }
    if (use_chat_completions_ && deployment_.empty()) {
        throw ConfigError("AZURE_OPENAI_CHAT_DEPLOYMENT required for chat completions");
    }
}

GenerationResult AzureChatClient::generate(const GenerationRequest& request) {
    const nlohmann::json body = use_responses_
                                    ? chat_wire::build_responses_body(request, max_output_tokens_)
                                    : chat_wire::build_chat_completions_body(request, deployment_, max_output_tokens_);
    const HttpRequest base_request{
        .method = "POST",
        .url = url_,
        .headers = {"Content-Type: application/json", "api-key: " + api_key_},
        .body = body.dump(),
        .timeout_seconds = 45,
        .cancel_flag = request.cancel != nullptr ? request.cancel->flag() : nullptr,
    };

    for (int attempt = 0; attempt < kMaxAttempts; ++attempt) {
        if (request.cancel != nullptr) {
            request.cancel->throw_if_cancelled();
        }
        try {
            const auto response = perform_http_request(base_request);
            if (response.status == 200) {
                auto json = nlohmann::json::parse(response.body);
                return use_responses_ ? chat_wire::parse_responses_result(json)
                                      : chat_wire::parse_chat_completions_result(json);
            }

            if (response.status == 401 || response.status == 403) {
                throw std::runtime_error("azure chat unauthorized (status " + std::to_string(response.status) +
                                         ") body: " + body_preview(response.body));
            }

            if (response.status == 429 || response.status >= 500) {
                if (attempt + 1 < kMaxAttempts) {
                    log::warn("azure chat status " + std::to_string(response.status) + ", retrying");
                    std::this_thread::sleep_for(std::chrono::seconds(1 << attempt));
                    continue;
                }
                throw ServiceUnavailable("azure chat unavailable (status " + std::to_string(response.status) +
                                         ") body: " + body_preview(response.body));
            }

            throw std::runtime_error("azure chat failed with status " + std::to_string(response.status) +
                                     " body: " + body_preview(response.body));
        } catch (const nlohmann::json::exception& ex) {
            throw std::runtime_error(std::string{"failed to parse azure chat response: "} + ex.what());
        }
    }

    throw ServiceUnavailable("azure chat failed after retries");
}

}  // namespace courserag
