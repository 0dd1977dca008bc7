#pragma once
#include <string>
#include <nlohmann/json.hpp>

#include "llm_dispatch/providers/ProviderClient.hpp"

namespace llm_dispatch {

class OpenAIClient : public ProviderClient {
public:
    explicit OpenAIClient(std::string model_name, std::string base_url = "https://api.openai.com/v1/");

    ProviderReply call(const nlohmann::json& payload,
                       const Credential& credential,
                       TimePoint deadline,
                       const CancellationToken& cancel) override;

    std::string name() const override { return "openai"; }

    // A payload with "messages" passes through (model filled in if missing).
    nlohmann::json build_request_body(const nlohmann::json& payload) const;

    static ProviderReply parse_response(const std::string& body);

private:
    std::string model_name_;
    std::string base_url_;
};

}
