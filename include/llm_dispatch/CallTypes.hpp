#pragma once
#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace llm_dispatch {

using SteadyClock = std::chrono::steady_clock;
using TimePoint = SteadyClock::time_point;

// Outcome classes reported by the provider capability. NONE means success.
enum class ProviderErrorKind {
    NONE,
    TIMEOUT,
    RATE_LIMITED,
    INVALID_RESPONSE,
    AUTH_ERROR,
    TRANSPORT_ERROR,
    CANCELLED
};

inline std::string provider_error_to_string(ProviderErrorKind k) {
    switch (k) {
        case ProviderErrorKind::NONE: return "none";
        case ProviderErrorKind::TIMEOUT: return "timeout";
        case ProviderErrorKind::RATE_LIMITED: return "rate_limited";
        case ProviderErrorKind::INVALID_RESPONSE: return "invalid_response";
        case ProviderErrorKind::AUTH_ERROR: return "auth_error";
        case ProviderErrorKind::TRANSPORT_ERROR: return "transport_error";
        case ProviderErrorKind::CANCELLED: return "cancelled";
    }
    return "unknown";
}

inline ProviderErrorKind string_to_provider_error(const std::string& s) {
    if (s == "timeout") return ProviderErrorKind::TIMEOUT;
    if (s == "rate_limited") return ProviderErrorKind::RATE_LIMITED;
    if (s == "invalid_response") return ProviderErrorKind::INVALID_RESPONSE;
    if (s == "auth_error") return ProviderErrorKind::AUTH_ERROR;
    if (s == "transport_error") return ProviderErrorKind::TRANSPORT_ERROR;
    if (s == "cancelled") return ProviderErrorKind::CANCELLED;
    return ProviderErrorKind::NONE;
}

// Transient errors rotate to another credential within the retry budget.
inline bool is_retryable(ProviderErrorKind k) {
    return k == ProviderErrorKind::TIMEOUT ||
           k == ProviderErrorKind::RATE_LIMITED ||
           k == ProviderErrorKind::TRANSPORT_ERROR;
}

enum class RequestState {
    PENDING,
    DISPATCHED,
    RETRYING,
    SUCCEEDED,
    FAILED_EXHAUSTED,
    FAILED_NONRETRYABLE
};

inline std::string request_state_to_string(RequestState s) {
    switch (s) {
        case RequestState::PENDING: return "PENDING";
        case RequestState::DISPATCHED: return "DISPATCHED";
        case RequestState::RETRYING: return "RETRYING";
        case RequestState::SUCCEEDED: return "SUCCEEDED";
        case RequestState::FAILED_EXHAUSTED: return "FAILED_EXHAUSTED";
        case RequestState::FAILED_NONRETRYABLE: return "FAILED_NONRETRYABLE";
    }
    return "UNKNOWN";
}

inline bool is_terminal(RequestState s) {
    return s == RequestState::SUCCEEDED ||
           s == RequestState::FAILED_EXHAUSTED ||
           s == RequestState::FAILED_NONRETRYABLE;
}

enum class FailureKind {
    RETRIES_EXHAUSTED,
    NON_RETRYABLE,
    POOL_EXHAUSTED,
    ALL_ATTEMPTS_FAILED,
    BATCH_TIMEOUT,
    CANCELLED,
    UNKNOWN_PROVIDER,
    INTERNAL_ERROR
};

inline std::string failure_kind_to_string(FailureKind k) {
    switch (k) {
        case FailureKind::RETRIES_EXHAUSTED: return "retries_exhausted";
        case FailureKind::NON_RETRYABLE: return "non_retryable";
        case FailureKind::POOL_EXHAUSTED: return "pool_exhausted";
        case FailureKind::ALL_ATTEMPTS_FAILED: return "all_attempts_failed";
        case FailureKind::BATCH_TIMEOUT: return "batch_timeout";
        case FailureKind::CANCELLED: return "cancelled";
        case FailureKind::UNKNOWN_PROVIDER: return "unknown_provider";
        case FailureKind::INTERNAL_ERROR: return "internal_error";
    }
    return "unknown";
}

// Handle to one pooled API key. Health state stays inside the pool.
struct Credential {
    size_t index = 0;
    std::string provider;
    std::string key;
    std::string label; // masked, safe to log
};

struct ProviderReply {
    std::string text;
    ProviderErrorKind error = ProviderErrorKind::NONE;
    std::string message;
    long status_code = 0;

    bool ok() const { return error == ProviderErrorKind::NONE; }

    static ProviderReply success(std::string text, long status = 200) {
        ProviderReply r;
        r.text = std::move(text);
        r.status_code = status;
        return r;
    }

    static ProviderReply failure(ProviderErrorKind kind, std::string message, long status = 0) {
        ProviderReply r;
        r.error = kind;
        r.message = std::move(message);
        r.status_code = status;
        return r;
    }
};

// Immutable once submitted. Unset overrides fall back to the dispatcher policy.
struct CallRequest {
    std::string id;
    std::string provider;
    nlohmann::json payload = nlohmann::json::object();
    std::optional<std::chrono::milliseconds> call_timeout;
    std::optional<std::chrono::milliseconds> retry_timeout;
    std::optional<int> max_retries;
};

struct CallAttempt {
    int attempt_number = 0;
    size_t credential_index = 0;
    std::string credential_label;
    TimePoint started_at{};
    std::chrono::milliseconds latency{0};
    ProviderErrorKind outcome = ProviderErrorKind::NONE;
    std::string message;

    bool succeeded() const { return outcome == ProviderErrorKind::NONE; }

    nlohmann::json to_json() const {
        return {
            {"attempt", attempt_number},
            {"credential", credential_label},
            {"credential_index", credential_index},
            {"outcome", succeeded() ? std::string("success") : provider_error_to_string(outcome)},
            {"latency_ms", latency.count()},
            {"message", message}
        };
    }
};

struct CallFailure {
    FailureKind kind = FailureKind::INTERNAL_ERROR;
    std::string message;
    std::vector<std::string> errors; // one line per failed attempt
};

struct CallResult {
    std::string request_id;
    std::string provider;
    RequestState state = RequestState::PENDING;
    std::optional<std::string> text;
    std::optional<CallFailure> failure;
    std::vector<CallAttempt> attempts;
    std::chrono::milliseconds elapsed{0};

    bool succeeded() const { return state == RequestState::SUCCEEDED; }

    static CallResult success(const CallRequest& req, std::string text, std::vector<CallAttempt> attempts) {
        CallResult r;
        r.request_id = req.id;
        r.provider = req.provider;
        r.state = RequestState::SUCCEEDED;
        r.text = std::move(text);
        r.attempts = std::move(attempts);
        return r;
    }

    static CallResult failed(const CallRequest& req, RequestState state, FailureKind kind,
                             std::string message, std::vector<CallAttempt> attempts = {}) {
        CallResult r;
        r.request_id = req.id;
        r.provider = req.provider;
        r.state = state;
        CallFailure f;
        f.kind = kind;
        f.message = std::move(message);
        for (const auto& a : attempts) {
            if (!a.succeeded()) {
                f.errors.push_back(a.credential_label + ": " + provider_error_to_string(a.outcome) +
                                   (a.message.empty() ? "" : " (" + a.message + ")"));
            }
        }
        r.failure = std::move(f);
        r.attempts = std::move(attempts);
        return r;
    }

    nlohmann::json to_json() const {
        nlohmann::json attempts_json = nlohmann::json::array();
        for (const auto& a : attempts) attempts_json.push_back(a.to_json());

        nlohmann::json j = {
            {"request_id", request_id},
            {"provider", provider},
            {"state", request_state_to_string(state)},
            {"success", succeeded()},
            {"elapsed_ms", elapsed.count()},
            {"attempts", attempts_json}
        };
        if (text) j["text"] = *text;
        if (failure) {
            j["error"] = {
                {"kind", failure_kind_to_string(failure->kind)},
                {"message", failure->message},
                {"attempt_errors", failure->errors}
            };
        }
        return j;
    }
};

// Positional index of a request is its identity in the result.
struct BatchJob {
    std::vector<CallRequest> requests;
    size_t concurrency_limit = 0; // 0 = MAX_PARALLEL_API_KEYS
};

struct BatchResult {
    std::vector<CallResult> results; // index-aligned with BatchJob::requests
    bool timed_out = false;
    std::chrono::milliseconds elapsed{0};

    size_t succeeded_count() const {
        size_t n = 0;
        for (const auto& r : results) if (r.succeeded()) n++;
        return n;
    }

    size_t failed_count() const { return results.size() - succeeded_count(); }

    nlohmann::json to_json() const {
        nlohmann::json items = nlohmann::json::array();
        for (const auto& r : results) items.push_back(r.to_json());
        return {
            {"results", items},
            {"succeeded", succeeded_count()},
            {"failed", failed_count()},
            {"timed_out", timed_out},
            {"elapsed_ms", elapsed.count()}
        };
    }
};

}
