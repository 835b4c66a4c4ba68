#pragma once

#include <string>

#include "llm/generation_client.hpp"

namespace courserag {

class Config;

// Azure OpenAI chat with function calling, over either the Responses or the
// Chat Completions endpoint (picked from the configured URL).
class AzureChatClient final : public GenerationClient {
public:
    explicit AzureChatClient(const Config& config);

    GenerationResult generate(const GenerationRequest& request) override;

private:
    std::string url_;
    std::string api_key_;
    std::string deployment_;
    int max_output_tokens_;
    bool use_responses_;
    bool use_chat_completions_;
};

}  // namespace courserag
