#include "llm_dispatch/providers/ProviderRegistry.hpp"

#include <stdexcept>

#include "llm_dispatch/DispatchConfig.hpp"
#include "llm_dispatch/providers/GeminiClient.hpp"
#include "llm_dispatch/providers/OpenAIClient.hpp"

namespace llm_dispatch {

void ProviderRegistry::register_provider(const std::string& id, std::shared_ptr<ProviderClient> client) {
    if (!client) throw std::invalid_argument("null client for provider '" + id + "'");
    if (clients_.count(id)) throw std::invalid_argument("provider '" + id + "' already registered");
    clients_.emplace(id, std::move(client));
}

std::shared_ptr<ProviderClient> ProviderRegistry::find(const std::string& id) const {
    auto it = clients_.find(id);
    return it == clients_.end() ? nullptr : it->second;
}

std::vector<std::string> ProviderRegistry::providers() const {
    std::vector<std::string> ids;
    for (const auto& [id, _] : clients_) ids.push_back(id);
    return ids;
}

ProviderRegistry ProviderRegistry::with_defaults(const DispatchConfig& config) {
    ProviderRegistry registry;
    registry.register_provider("gemini", std::make_shared<GeminiClient>(config.gemini_model_name));
    registry.register_provider("openai", std::make_shared<OpenAIClient>(config.openai_model_name));
    return registry;
}

}
