#pragma once
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "llm_dispatch/providers/ProviderClient.hpp"

namespace llm_dispatch {

struct DispatchConfig;

// Explicit provider lookup by identifier. Filled once at startup, read-only after.
class ProviderRegistry {
public:
    // Throws std::invalid_argument on a null client or a duplicate id.
    void register_provider(const std::string& id, std::shared_ptr<ProviderClient> client);

    std::shared_ptr<ProviderClient> find(const std::string& id) const;
    std::vector<std::string> providers() const;

    static ProviderRegistry with_defaults(const DispatchConfig& config);

private:
    std::map<std::string, std::shared_ptr<ProviderClient>> clients_;
};

}
