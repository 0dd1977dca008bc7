#pragma once
#include <string>
#include <nlohmann/json.hpp>

#include "llm_dispatch/providers/ProviderClient.hpp"

namespace llm_dispatch {

class GeminiClient : public ProviderClient {
public:
    explicit GeminiClient(std::string model_name,
                          std::string base_url = "https://generativelanguage.googleapis.com/v1beta/");

    ProviderReply call(const nlohmann::json& payload,
                       const Credential& credential,
                       TimePoint deadline,
                       const CancellationToken& cancel) override;

    std::string name() const override { return "gemini"; }

    // A payload with "contents" passes through; otherwise it is built from
    // system_prompt / prompt / temperature / top_p / top_k / max_tokens.
    static nlohmann::json build_request_body(const nlohmann::json& payload);

    // Concatenated text of the first candidate; INVALID_RESPONSE if absent.
    static ProviderReply parse_response(const std::string& body);

    std::string endpoint_for(const nlohmann::json& payload) const;

private:
    std::string model_name_;
    std::string base_url_;
};

}
