#pragma once
#include <string>
#include <nlohmann/json.hpp>

#include "llm_dispatch/CallTypes.hpp"
#include "llm_dispatch/CancellationToken.hpp"

namespace llm_dispatch {

// The network call against one provider. Implementations must return by
// `deadline`, should stop early once `cancel` fires, and report every
// failure through the reply instead of throwing.
class ProviderClient {
public:
    virtual ~ProviderClient() = default;

    virtual ProviderReply call(const nlohmann::json& payload,
                               const Credential& credential,
                               TimePoint deadline,
                               const CancellationToken& cancel) = 0;

    virtual std::string name() const = 0;
};

}
