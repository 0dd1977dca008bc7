#pragma once
#include <chrono>
#include <memory>

#include "llm_dispatch/CallTypes.hpp"
#include "llm_dispatch/CancellationToken.hpp"
#include "llm_dispatch/CredentialPool.hpp"
#include "llm_dispatch/providers/ProviderClient.hpp"

namespace llm_dispatch {

struct DispatchPolicy {
    std::chrono::milliseconds call_timeout{60000};  // first attempt
    std::chrono::milliseconds retry_timeout{30000}; // every later attempt
    int max_retries = 2;                            // retries after the first attempt
};

// Sequential dispatch of one request: acquire, call under a deadline, and on
// a transient failure rotate to a freshly acquired key until the retry
// budget or the pool runs out.
class CallDispatcher {
public:
    CallDispatcher(std::shared_ptr<CredentialPool> pool,
                   std::shared_ptr<ProviderClient> provider,
                   DispatchPolicy policy);

    CallResult dispatch(const CallRequest& request, const CancellationToken& cancel = {}) const;

    const DispatchPolicy& policy() const { return policy_; }

private:
    std::shared_ptr<CredentialPool> pool_;
    std::shared_ptr<ProviderClient> provider_;
    DispatchPolicy policy_;
};

}
