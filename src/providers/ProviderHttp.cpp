#include "llm_dispatch/providers/ProviderHttp.hpp"

#include <algorithm>
#include <cctype>
#include <nlohmann/json.hpp>

namespace llm_dispatch {

using json = nlohmann::json;

namespace {

bool mentions_api_key(std::string body) {
    std::transform(body.begin(), body.end(), body.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return body.find("api key") != std::string::npos || body.find("api_key") != std::string::npos ||
           body.find("permission") != std::string::npos;
}

}

ProviderErrorKind classify_http_status(long status_code, const std::string& body) {
    if (status_code == 200) return ProviderErrorKind::NONE;
    if (status_code == 401 || status_code == 403) return ProviderErrorKind::AUTH_ERROR;
    if (status_code == 400) {
        return mentions_api_key(body) ? ProviderErrorKind::AUTH_ERROR : ProviderErrorKind::INVALID_RESPONSE;
    }
    if (status_code == 404 || status_code == 422) return ProviderErrorKind::INVALID_RESPONSE;
    if (status_code == 429) return ProviderErrorKind::RATE_LIMITED;
    if (status_code == 408 || status_code == 504) return ProviderErrorKind::TIMEOUT;
    if (status_code >= 500) return ProviderErrorKind::TRANSPORT_ERROR;
    // Anything else unexpected from the endpoint is not worth another key.
    return ProviderErrorKind::INVALID_RESPONSE;
}

std::string extract_error_message(const std::string& body) {
    try {
        auto j = json::parse(body);
        if (j.contains("error")) {
            const auto& e = j["error"];
            if (e.is_object() && e.contains("message") && e["message"].is_string()) {
                return e["message"].get<std::string>();
            }
            if (e.is_string()) return e.get<std::string>();
        }
    } catch (const json::exception&) {
        // not JSON, fall through to the raw body
    }
    return body.size() > 200 ? body.substr(0, 200) + "..." : body;
}

ProviderReply classify_response(const cpr::Response& r, const CancellationToken& cancel) {
    if (cancel.is_cancelled()) {
        return ProviderReply::failure(ProviderErrorKind::CANCELLED, "cancelled");
    }
    if (r.error.code == cpr::ErrorCode::OPERATION_TIMEDOUT) {
        return ProviderReply::failure(ProviderErrorKind::TIMEOUT, r.error.message);
    }
    if (r.error.code != cpr::ErrorCode::OK) {
        return ProviderReply::failure(ProviderErrorKind::TRANSPORT_ERROR, r.error.message);
    }
    ProviderErrorKind kind = classify_http_status(r.status_code, r.text);
    std::string msg = "HTTP " + std::to_string(r.status_code) + ": " + extract_error_message(r.text);
    return ProviderReply::failure(kind, msg, r.status_code);
}

cpr::ProgressCallback cancel_progress(const CancellationToken& cancel) {
    return cpr::ProgressCallback{[cancel](auto&&...) { return !cancel.is_cancelled(); }};
}

long remaining_ms(TimePoint deadline) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - SteadyClock::now()).count();
    return std::max<long>(1, static_cast<long>(left));
}

}
