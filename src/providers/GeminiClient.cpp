#include "llm_dispatch/providers/GeminiClient.hpp"

#include <cpr/cpr.h>
#include <spdlog/spdlog.h>

#include "llm_dispatch/providers/ProviderHttp.hpp"

namespace llm_dispatch {

using json = nlohmann::json;

GeminiClient::GeminiClient(std::string model_name, std::string base_url)
    : model_name_(std::move(model_name)), base_url_(std::move(base_url)) {
    if (!base_url_.empty() && base_url_.back() != '/') base_url_ += '/';
}

std::string GeminiClient::endpoint_for(const json& payload) const {
    std::string model = payload.value("model", model_name_);
    return base_url_ + "models/" + model + ":generateContent";
}

json GeminiClient::build_request_body(const json& payload) {
    if (payload.contains("contents")) {
        json body = payload;
        body.erase("model");
        return body;
    }

    std::string prompt = payload.value("prompt", "");
    std::string system_prompt = payload.value("system_prompt", "");

    json body = {
        {"contents", {{{"role", "user"}, {"parts", {{{"text", prompt}}}}}}}
    };
    if (!system_prompt.empty()) {
        body["systemInstruction"] = {{"parts", {{{"text", system_prompt}}}}};
    }

    json generation = json::object();
    if (payload.contains("temperature")) generation["temperature"] = payload["temperature"];
    if (payload.contains("top_p")) generation["topP"] = payload["top_p"];
    if (payload.contains("top_k")) generation["topK"] = payload["top_k"];
    if (payload.contains("max_tokens")) generation["maxOutputTokens"] = payload["max_tokens"];
    if (payload.contains("response_mime_type")) generation["responseMimeType"] = payload["response_mime_type"];
    if (!generation.empty()) body["generationConfig"] = generation;
    return body;
}

ProviderReply GeminiClient::parse_response(const std::string& body) {
    try {
        auto j = json::parse(body);
        if (!j.contains("candidates") || !j["candidates"].is_array() || j["candidates"].empty()) {
            return ProviderReply::failure(ProviderErrorKind::INVALID_RESPONSE, "no candidates in response", 200);
        }
        const auto& candidate = j["candidates"][0];
        if (!candidate.contains("content") || !candidate["content"].contains("parts")) {
            std::string reason = candidate.value("finishReason", "unknown");
            return ProviderReply::failure(ProviderErrorKind::INVALID_RESPONSE,
                                          "candidate has no content (finishReason=" + reason + ")", 200);
        }
        std::string text;
        for (const auto& part : candidate["content"]["parts"]) {
            if (part.contains("text") && part["text"].is_string()) text += part["text"].get<std::string>();
        }
        if (text.empty()) {
            return ProviderReply::failure(ProviderErrorKind::INVALID_RESPONSE, "empty text in response", 200);
        }
        return ProviderReply::success(std::move(text));
    } catch (const json::exception& e) {
        return ProviderReply::failure(ProviderErrorKind::INVALID_RESPONSE,
                                      std::string("unparsable response: ") + e.what(), 200);
    }
}

ProviderReply GeminiClient::call(const json& payload, const Credential& credential, TimePoint deadline,
                                 const CancellationToken& cancel) {
    if (cancel.is_cancelled()) return ProviderReply::failure(ProviderErrorKind::CANCELLED, "cancelled");

    cpr::Response r = cpr::Post(cpr::Url{endpoint_for(payload)},
                                cpr::Body{build_request_body(payload).dump()},
                                cpr::Header{{"Content-Type", "application/json"},
                                            {"x-goog-api-key", credential.key}},
                                cpr::Timeout{remaining_ms(deadline)},
                                cancel_progress(cancel));

    if (r.error.code == cpr::ErrorCode::OK && r.status_code == 200 && !cancel.is_cancelled()) {
        return parse_response(r.text);
    }
    ProviderReply reply = classify_response(r, cancel);
    spdlog::debug("Gemini {} -> {} ({})", credential.label, provider_error_to_string(reply.error), reply.message);
    return reply;
}

}
