#include "llm_dispatch/providers/OpenAIClient.hpp"

#include <cpr/cpr.h>
#include <spdlog/spdlog.h>

#include "llm_dispatch/providers/ProviderHttp.hpp"

namespace llm_dispatch {

using json = nlohmann::json;

OpenAIClient::OpenAIClient(std::string model_name, std::string base_url)
    : model_name_(std::move(model_name)), base_url_(std::move(base_url)) {
    if (!base_url_.empty() && base_url_.back() != '/') base_url_ += '/';
}

json OpenAIClient::build_request_body(const json& payload) const {
    json body;
    if (payload.contains("messages")) {
        body = payload;
    } else {
        json messages = json::array();
        std::string system_prompt = payload.value("system_prompt", "");
        if (!system_prompt.empty()) messages.push_back({{"role", "system"}, {"content", system_prompt}});
        messages.push_back({{"role", "user"}, {"content", payload.value("prompt", "")}});
        body["messages"] = messages;

        if (payload.contains("temperature")) body["temperature"] = payload["temperature"];
        if (payload.contains("top_p")) body["top_p"] = payload["top_p"];
        if (payload.contains("max_tokens")) body["max_tokens"] = payload["max_tokens"];
    }
    if (!body.contains("model")) body["model"] = payload.value("model", model_name_);
    return body;
}

ProviderReply OpenAIClient::parse_response(const std::string& body) {
    try {
        auto j = json::parse(body);
        if (!j.contains("choices") || !j["choices"].is_array() || j["choices"].empty()) {
            return ProviderReply::failure(ProviderErrorKind::INVALID_RESPONSE, "no choices in response", 200);
        }
        const auto& message = j["choices"][0].value("message", json::object());
        if (!message.contains("content") || !message["content"].is_string()) {
            return ProviderReply::failure(ProviderErrorKind::INVALID_RESPONSE, "choice has no text content", 200);
        }
        return ProviderReply::success(message["content"].get<std::string>());
    } catch (const json::exception& e) {
        return ProviderReply::failure(ProviderErrorKind::INVALID_RESPONSE,
                                      std::string("unparsable response: ") + e.what(), 200);
    }
}

ProviderReply OpenAIClient::call(const json& payload, const Credential& credential, TimePoint deadline,
                                 const CancellationToken& cancel) {
    if (cancel.is_cancelled()) return ProviderReply::failure(ProviderErrorKind::CANCELLED, "cancelled");

    cpr::Response r = cpr::Post(cpr::Url{base_url_ + "chat/completions"},
                                cpr::Body{build_request_body(payload).dump()},
                                cpr::Header{{"Content-Type", "application/json"},
                                            {"Authorization", "Bearer " + credential.key}},
                                cpr::Timeout{remaining_ms(deadline)},
                                cancel_progress(cancel));

    if (r.error.code == cpr::ErrorCode::OK && r.status_code == 200 && !cancel.is_cancelled()) {
        return parse_response(r.text);
    }
    ProviderReply reply = classify_response(r, cancel);
    spdlog::debug("OpenAI {} -> {} ({})", credential.label, provider_error_to_string(reply.error), reply.message);
    return reply;
}

}
