#pragma once
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "llm_dispatch/CallTypes.hpp"
#include "llm_dispatch/CancellationToken.hpp"
#include "llm_dispatch/CredentialPool.hpp"
#include "llm_dispatch/providers/ProviderClient.hpp"

namespace llm_dispatch {

struct AttemptOutcome {
    std::optional<size_t> winner;      // slot of the first success
    std::optional<std::string> text;
    std::vector<CallAttempt> attempts; // launch order
    bool parent_cancelled = false;
};

// A set of concurrent provider calls for one request, each on its own
// thread with its own deadline and a cancellation token linked to the
// parent. Every attempt is settled exactly once, either by its thread or by
// the waiter (deadline, winner found, parent cancelled); the settler reports
// health to the pool, and a result arriving after settlement is dropped.
class AttemptGroup {
public:
    AttemptGroup(std::shared_ptr<ProviderClient> provider,
                 std::shared_ptr<CredentialPool> pool,
                 const CancellationToken& parent = {});
    ~AttemptGroup();

    AttemptGroup(const AttemptGroup&) = delete;
    AttemptGroup& operator=(const AttemptGroup&) = delete;

    size_t launch(const nlohmann::json& payload,
                  const Credential& credential,
                  std::chrono::milliseconds timeout,
                  int attempt_number);

    // Blocks until one attempt succeeds, every attempt has settled, or the
    // parent is cancelled. Unsettled losers are cancelled without reporting.
    AttemptOutcome await_first_success();

    size_t size() const;

private:
    struct Shared;
    std::shared_ptr<Shared> shared_;
};

}
