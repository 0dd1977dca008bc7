#include "llm_dispatch/DispatchService.hpp"

#include <stdexcept>
#include <spdlog/spdlog.h>

namespace llm_dispatch {

using json = nlohmann::json;

DispatchService::DispatchService(DispatchConfig config, ProviderRegistry registry, CredentialPool::ClockFn clock)
    : config_(std::move(config)), registry_(std::move(registry)) {
    config_.validate();
    const DispatchPolicy policy = config_.dispatch_policy();

    for (const auto& [provider, keys] : config_.credentials) {
        auto client = registry_.find(provider);
        if (!client) {
            spdlog::warn("⚠️ {} key(s) configured for unregistered provider '{}', ignored", keys.size(), provider);
            continue;
        }
        ProviderLane lane;
        lane.pool = std::make_shared<CredentialPool>(provider, keys, config_.rotation_strategy,
                                                     config_.quarantine, clock);
        lane.dispatcher = std::make_unique<CallDispatcher>(lane.pool, client, policy);
        lane.racer = std::make_unique<FailoverRacer>(lane.pool, client, policy, config_.max_parallel_api_keys);
        lanes_.emplace(provider, std::move(lane));
        spdlog::info("🔑 {} pool ready: {} key(s), {}", provider, keys.size(),
                     rotation_strategy_to_string(config_.rotation_strategy));
    }

    batches_ = std::make_unique<BatchCoordinator>(
        [this](const CallRequest& r, const CancellationToken& cancel) { return execute(r, cancel); },
        config_.batch_limits());
}

json DispatchService::normalize_payload(const json& payload) {
    if (payload.is_object()) return payload;
    if (payload.is_string()) return json{{"prompt", payload.get<std::string>()}};
    throw std::invalid_argument("payload must be a JSON object or a prompt string");
}

CallRequest DispatchService::request_from_json(const json& j) {
    if (!j.is_object()) throw std::invalid_argument("request must be a JSON object");

    CallRequest r;
    try {
        r.id = j.value("id", "");
        r.provider = j.value("provider", "");
        if (j.contains("payload")) {
            r.payload = normalize_payload(j["payload"]);
        } else if (j.contains("prompt") || j.contains("messages") || j.contains("contents")) {
            r.payload = j;
            for (const char* meta : {"id", "provider", "call_timeout", "retry_timeout", "max_retries"}) {
                r.payload.erase(meta);
            }
        } else {
            throw std::invalid_argument("request needs a 'payload' or a 'prompt'");
        }

        auto seconds = [&j](const char* name) -> std::optional<std::chrono::milliseconds> {
            if (!j.contains(name)) return std::nullopt;
            double secs = j[name].get<double>();
            if (secs <= 0) throw std::invalid_argument(std::string(name) + " must be positive");
            return std::chrono::milliseconds(static_cast<long long>(secs * 1000.0));
        };
        r.call_timeout = seconds("call_timeout");
        r.retry_timeout = seconds("retry_timeout");
        if (j.contains("max_retries")) {
            int n = j["max_retries"].get<int>();
            if (n < 0) throw std::invalid_argument("max_retries must be >= 0");
            r.max_retries = n;
        }
    } catch (const json::exception& e) {
        throw std::invalid_argument(std::string("malformed request: ") + e.what());
    }
    return r;
}

void DispatchService::prepare(CallRequest& request) {
    if (request.id.empty()) request.id = "req-" + std::to_string(next_id_.fetch_add(1));
    if (request.provider.empty()) request.provider = config_.default_provider;
}

CallResult DispatchService::execute(const CallRequest& request, const CancellationToken& cancel) {
    CallRequest normalized = request;
    try {
        normalized.payload = normalize_payload(request.payload);
    } catch (const std::invalid_argument& e) {
        return CallResult::failed(request, RequestState::FAILED_NONRETRYABLE, FailureKind::NON_RETRYABLE, e.what());
    }

    auto it = lanes_.find(normalized.provider);
    if (it == lanes_.end()) {
        std::string msg = registry_.find(normalized.provider)
            ? "no credentials configured for provider '" + normalized.provider + "'"
            : "unknown provider '" + normalized.provider + "'";
        spdlog::warn("🚫 {}: {}", normalized.id, msg);
        return CallResult::failed(normalized, RequestState::FAILED_NONRETRYABLE, FailureKind::UNKNOWN_PROVIDER, msg);
    }

    const ProviderLane& lane = it->second;
    if (config_.enable_fast_failover && lane.pool->size() > 1) {
        return lane.racer->race(normalized, cancel);
    }
    return lane.dispatcher->dispatch(normalized, cancel);
}

CallResult DispatchService::dispatch_one(CallRequest request, const CancellationToken& cancel) {
    prepare(request);
    CallResult result = execute(request, cancel);
    log_.add_call(result);
    return result;
}

BatchResult DispatchService::dispatch_batch(std::vector<CallRequest> requests, size_t concurrency_limit) {
    BatchJob job;
    job.concurrency_limit = concurrency_limit;
    for (auto& r : requests) prepare(r);
    job.requests = std::move(requests);

    BatchResult result = batches_->run(job, [&job](size_t idx, RequestState s) {
        spdlog::debug("📦 [{}] {} -> {}", idx, job.requests[idx].id, request_state_to_string(s));
    });

    for (const auto& r : result.results) log_.add_call(r);
    log_.add_batch(result);
    return result;
}

std::shared_ptr<CredentialPool> DispatchService::pool_for(const std::string& provider) const {
    auto it = lanes_.find(provider);
    return it == lanes_.end() ? nullptr : it->second.pool;
}

json DispatchService::pool_status() const {
    json pools = json::object();
    for (const auto& [provider, lane] : lanes_) pools[provider] = lane.pool->status_json();
    return {
        {"default_provider", config_.default_provider},
        {"fast_failover", config_.enable_fast_failover},
        {"pools", pools}
    };
}

json DispatchService::recent_calls() const {
    return {
        {"calls", log_.get_calls_json()},
        {"batches", log_.get_batches_json()}
    };
}

}
