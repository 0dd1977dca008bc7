#pragma once
#include <memory>

#include "llm_dispatch/CallDispatcher.hpp"

namespace llm_dispatch {

// Fast-failover mode: the same request goes to several keys at once and the
// first success wins. Losers are cancelled cooperatively; whatever they
// return afterwards is discarded.
class FailoverRacer {
public:
    FailoverRacer(std::shared_ptr<CredentialPool> pool,
                  std::shared_ptr<ProviderClient> provider,
                  DispatchPolicy policy,
                  size_t max_parallel);

    CallResult race(const CallRequest& request, const CancellationToken& cancel = {}) const;

    size_t max_parallel() const { return max_parallel_; }

private:
    std::shared_ptr<CredentialPool> pool_;
    std::shared_ptr<ProviderClient> provider_;
    DispatchPolicy policy_;
    size_t max_parallel_;
};

}
