#pragma once
#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "llm_dispatch/BatchCoordinator.hpp"
#include "llm_dispatch/CallDispatcher.hpp"
#include "llm_dispatch/CredentialPool.hpp"
#include "llm_dispatch/DispatchErrors.hpp"

namespace llm_dispatch {

struct DispatchConfig {
    RotationStrategy rotation_strategy = RotationStrategy::ROUND_ROBIN;
    size_t max_parallel_api_keys = 5;
    std::chrono::milliseconds api_call_timeout{60000};
    std::chrono::milliseconds api_retry_timeout{30000};
    bool enable_fast_failover = true;
    size_t max_batch_size = 10;
    std::chrono::milliseconds batch_timeout{30000};
    int max_retries = 2;
    QuarantinePolicy quarantine;

    std::string default_provider = "gemini";
    std::map<std::string, std::vector<std::string>> credentials; // provider -> keys
    std::string gemini_model_name = "gemini-3-flash-preview";
    std::string openai_model_name = "gpt-4o-mini";

    std::string host = "0.0.0.0";
    int port = 8000;
    bool debug = true;

    // .env first, then the process environment on top, then keys.json if found.
    static DispatchConfig from_env(const std::string& dotenv_path = ".env");

    // Settings keyed by upper-case option name (API_CALL_TIMEOUT, ...).
    static DispatchConfig from_settings(const std::map<std::string, std::string>& settings);

    static std::map<std::string, std::string> read_dotenv(const std::string& path);
    static std::optional<std::string> find_key_vault();

    // {"gemini": [...], "openai": [...]} or {"keys": [...]} for the default provider.
    void merge_key_vault(const nlohmann::json& vault);

    // Throws ConfigError on unusable limits; clamps the retry timeout.
    void validate();

    DispatchPolicy dispatch_policy() const;
    BatchLimits batch_limits() const;

    // Credentials appear as counts only.
    nlohmann::json to_json() const;

    static const std::vector<std::string>& known_options();
};

}
