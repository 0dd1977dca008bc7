#pragma once
#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "llm_dispatch/BatchCoordinator.hpp"
#include "llm_dispatch/CallDispatcher.hpp"
#include "llm_dispatch/CallLog.hpp"
#include "llm_dispatch/CredentialPool.hpp"
#include "llm_dispatch/DispatchConfig.hpp"
#include "llm_dispatch/FailoverRacer.hpp"
#include "llm_dispatch/providers/ProviderRegistry.hpp"

namespace llm_dispatch {

// Entry point for calling code: one credential pool per provider that has
// keys, single calls through the dispatcher or the racer, batches through
// the coordinator.
class DispatchService {
public:
    DispatchService(DispatchConfig config,
                    ProviderRegistry registry,
                    CredentialPool::ClockFn clock = nullptr);

    CallResult dispatch_one(CallRequest request, const CancellationToken& cancel = {});

    // Throws BatchValidationError when the batch is larger than MAX_BATCH_SIZE.
    BatchResult dispatch_batch(std::vector<CallRequest> requests, size_t concurrency_limit = 0);

    std::shared_ptr<CredentialPool> pool_for(const std::string& provider) const;
    nlohmann::json pool_status() const;
    nlohmann::json recent_calls() const;

    const DispatchConfig& config() const { return config_; }

    // Wraps a bare string payload as {"prompt": ...}; any other non-object is rejected.
    static nlohmann::json normalize_payload(const nlohmann::json& payload);

    // {"id"?, "provider"?, "payload" | "prompt", "call_timeout"?, "retry_timeout"?, "max_retries"?}
    // Timeouts in seconds. Throws std::invalid_argument on a malformed object.
    static CallRequest request_from_json(const nlohmann::json& j);

private:
    struct ProviderLane {
        std::shared_ptr<CredentialPool> pool;
        std::unique_ptr<CallDispatcher> dispatcher;
        std::unique_ptr<FailoverRacer> racer;
    };

    void prepare(CallRequest& request);
    CallResult execute(const CallRequest& request, const CancellationToken& cancel);

    DispatchConfig config_;
    ProviderRegistry registry_;
    std::map<std::string, ProviderLane> lanes_;
    std::atomic<uint64_t> next_id_{1};
    CallLog log_;
    // Declared last: its workers are joined before the lanes they call into go away.
    std::unique_ptr<BatchCoordinator> batches_;
};

}
