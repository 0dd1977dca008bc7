#include "llm_dispatch/DispatchConfig.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace llm_dispatch {

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

std::string trim(const std::string& s) {
    size_t b = 0, e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

std::string upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

const std::string* lookup(const std::map<std::string, std::string>& settings, const std::string& name) {
    auto it = settings.find(name);
    if (it == settings.end()) return nullptr;
    return &it->second;
}

long long parse_int(const std::string& name, const std::string& raw) {
    std::string v = trim(raw);
    try {
        size_t used = 0;
        long long out = std::stoll(v, &used);
        if (used != v.size()) throw std::invalid_argument(v);
        return out;
    } catch (const std::exception&) {
        throw ConfigError(name, "expected an integer, got '" + raw + "'");
    }
}

std::chrono::milliseconds parse_seconds(const std::string& name, const std::string& raw) {
    std::string v = trim(raw);
    try {
        size_t used = 0;
        double secs = std::stod(v, &used);
        if (used != v.size() || !std::isfinite(secs)) throw std::invalid_argument(v);
        return std::chrono::milliseconds(static_cast<long long>(std::llround(secs * 1000.0)));
    } catch (const std::exception&) {
        throw ConfigError(name, "expected seconds, got '" + raw + "'");
    }
}

bool parse_bool(const std::string& name, const std::string& raw) {
    std::string v = lower(trim(raw));
    if (v == "true" || v == "1" || v == "yes" || v == "on") return true;
    if (v == "false" || v == "0" || v == "no" || v == "off") return false;
    throw ConfigError(name, "expected a boolean, got '" + raw + "'");
}

std::vector<std::string> split_keys(const std::string& raw) {
    std::vector<std::string> out;
    std::stringstream ss(raw);
    std::string item;
    while (std::getline(ss, item, ',')) {
        item = trim(item);
        if (!item.empty()) out.push_back(item);
    }
    return out;
}

// A comma list wins over the single-key option, as in the original settings.
void load_provider_keys(DispatchConfig& cfg, const std::map<std::string, std::string>& settings,
                        const std::string& provider) {
    const std::string prefix = upper(provider);
    std::vector<std::string> keys;
    if (auto list = lookup(settings, prefix + "_API_KEYS")) keys = split_keys(*list);
    if (keys.empty()) {
        if (auto single = lookup(settings, prefix + "_API_KEY")) {
            std::string k = trim(*single);
            if (!k.empty()) keys.push_back(k);
        }
    }
    if (!keys.empty()) cfg.credentials[provider] = std::move(keys);
}

} // namespace

const std::vector<std::string>& DispatchConfig::known_options() {
    static const std::vector<std::string> options = {
        "API_KEY_ROTATION_STRATEGY", "MAX_PARALLEL_API_KEYS", "API_CALL_TIMEOUT", "API_RETRY_TIMEOUT",
        "ENABLE_FAST_FAILOVER", "MAX_BATCH_SIZE", "BATCH_TIMEOUT", "MAX_RETRIES",
        "CREDENTIAL_FAILURE_THRESHOLD", "CREDENTIAL_COOLDOWN", "CREDENTIAL_AUTH_COOLDOWN",
        "DEFAULT_LLM_PROVIDER", "GEMINI_API_KEYS", "GEMINI_API_KEY", "OPENAI_API_KEYS", "OPENAI_API_KEY",
        "GEMINI_MODEL_NAME", "OPENAI_MODEL_NAME", "HOST", "PORT", "DEBUG"
    };
    return options;
}

std::map<std::string, std::string> DispatchConfig::read_dotenv(const std::string& path) {
    std::map<std::string, std::string> out;
    std::ifstream f(path);
    if (!f.is_open()) return out;

    std::string line;
    while (std::getline(f, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;
        if (line.rfind("export ", 0) == 0) line = trim(line.substr(7));

        size_t eq = line.find('=');
        if (eq == std::string::npos) continue;

        std::string key = upper(trim(line.substr(0, eq)));
        std::string value = trim(line.substr(eq + 1));
        if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') && value.back() == value.front()) {
            value = value.substr(1, value.size() - 2);
        } else {
            size_t hash = value.find(" #");
            if (hash != std::string::npos) value = trim(value.substr(0, hash));
        }
        if (!key.empty()) out[key] = value;
    }
    return out;
}

std::optional<std::string> DispatchConfig::find_key_vault() {
    const std::vector<std::string> search_paths = {
        "keys.json", "../keys.json", "build/keys.json", "../../keys.json"
    };
    for (const auto& path : search_paths) {
        if (fs::exists(path)) return path;
    }
    return std::nullopt;
}

DispatchConfig DispatchConfig::from_settings(const std::map<std::string, std::string>& settings) {
    DispatchConfig cfg;

    if (auto v = lookup(settings, "API_KEY_ROTATION_STRATEGY")) {
        try {
            cfg.rotation_strategy = parse_rotation_strategy(trim(*v));
        } catch (const std::invalid_argument& e) {
            throw ConfigError("API_KEY_ROTATION_STRATEGY", e.what());
        }
    }
    if (auto v = lookup(settings, "MAX_PARALLEL_API_KEYS")) {
        long long n = parse_int("MAX_PARALLEL_API_KEYS", *v);
        if (n < 1) throw ConfigError("MAX_PARALLEL_API_KEYS", "must be >= 1");
        cfg.max_parallel_api_keys = static_cast<size_t>(n);
    }
    if (auto v = lookup(settings, "API_CALL_TIMEOUT")) cfg.api_call_timeout = parse_seconds("API_CALL_TIMEOUT", *v);
    if (auto v = lookup(settings, "API_RETRY_TIMEOUT")) cfg.api_retry_timeout = parse_seconds("API_RETRY_TIMEOUT", *v);
    if (auto v = lookup(settings, "ENABLE_FAST_FAILOVER")) cfg.enable_fast_failover = parse_bool("ENABLE_FAST_FAILOVER", *v);
    if (auto v = lookup(settings, "MAX_BATCH_SIZE")) {
        long long n = parse_int("MAX_BATCH_SIZE", *v);
        if (n < 1) throw ConfigError("MAX_BATCH_SIZE", "must be >= 1");
        cfg.max_batch_size = static_cast<size_t>(n);
    }
    if (auto v = lookup(settings, "BATCH_TIMEOUT")) cfg.batch_timeout = parse_seconds("BATCH_TIMEOUT", *v);
    if (auto v = lookup(settings, "MAX_RETRIES")) {
        long long n = parse_int("MAX_RETRIES", *v);
        if (n < 0) throw ConfigError("MAX_RETRIES", "must be >= 0");
        cfg.max_retries = static_cast<int>(n);
    }
    if (auto v = lookup(settings, "CREDENTIAL_FAILURE_THRESHOLD")) {
        long long n = parse_int("CREDENTIAL_FAILURE_THRESHOLD", *v);
        if (n < 0) throw ConfigError("CREDENTIAL_FAILURE_THRESHOLD", "must be >= 0");
        cfg.quarantine.failure_threshold = static_cast<int>(n);
    }
    if (auto v = lookup(settings, "CREDENTIAL_COOLDOWN")) cfg.quarantine.cooldown = parse_seconds("CREDENTIAL_COOLDOWN", *v);
    if (auto v = lookup(settings, "CREDENTIAL_AUTH_COOLDOWN")) cfg.quarantine.auth_cooldown = parse_seconds("CREDENTIAL_AUTH_COOLDOWN", *v);

    if (auto v = lookup(settings, "DEFAULT_LLM_PROVIDER")) cfg.default_provider = lower(trim(*v));
    if (auto v = lookup(settings, "GEMINI_MODEL_NAME")) cfg.gemini_model_name = trim(*v);
    if (auto v = lookup(settings, "OPENAI_MODEL_NAME")) cfg.openai_model_name = trim(*v);
    if (auto v = lookup(settings, "HOST")) cfg.host = trim(*v);
    if (auto v = lookup(settings, "PORT")) cfg.port = static_cast<int>(parse_int("PORT", *v));
    if (auto v = lookup(settings, "DEBUG")) cfg.debug = parse_bool("DEBUG", *v);

    load_provider_keys(cfg, settings, "gemini");
    load_provider_keys(cfg, settings, "openai");

    cfg.validate();
    return cfg;
}

DispatchConfig DispatchConfig::from_env(const std::string& dotenv_path) {
    auto settings = read_dotenv(dotenv_path);
    if (!settings.empty()) spdlog::info("📄 Loaded {} settings from {}", settings.size(), dotenv_path);

    for (const auto& name : known_options()) {
        if (const char* value = std::getenv(name.c_str())) settings[name] = value;
    }

    DispatchConfig cfg = from_settings(settings);

    if (auto vault_path = find_key_vault()) {
        try {
            std::ifstream f(*vault_path);
            cfg.merge_key_vault(json::parse(f));
            spdlog::info("🛰️ Key vault merged from {}", *vault_path);
        } catch (const json::exception& e) {
            spdlog::error("💥 Failed to parse {}: {}", *vault_path, e.what());
        }
    }
    return cfg;
}

void DispatchConfig::merge_key_vault(const json& vault) {
    if (!vault.is_object()) return;

    auto merge = [this](const std::string& provider, const json& list) {
        if (!list.is_array()) return;
        auto& keys = credentials[provider];
        for (const auto& k : list) {
            if (!k.is_string()) continue;
            std::string key = trim(k.get<std::string>());
            if (!key.empty() && std::find(keys.begin(), keys.end(), key) == keys.end()) keys.push_back(key);
        }
        if (keys.empty()) credentials.erase(provider);
    };

    for (auto it = vault.begin(); it != vault.end(); ++it) {
        if (it.key() == "keys") merge(default_provider, it.value());
        else merge(lower(it.key()), it.value());
    }
}

void DispatchConfig::validate() {
    if (max_parallel_api_keys < 1) throw ConfigError("MAX_PARALLEL_API_KEYS", "must be >= 1");
    if (max_batch_size < 1) throw ConfigError("MAX_BATCH_SIZE", "must be >= 1");
    if (api_call_timeout.count() <= 0) throw ConfigError("API_CALL_TIMEOUT", "must be positive");
    if (api_retry_timeout.count() <= 0) throw ConfigError("API_RETRY_TIMEOUT", "must be positive");
    if (batch_timeout.count() <= 0) throw ConfigError("BATCH_TIMEOUT", "must be positive");
    if (port <= 0 || port > 65535) throw ConfigError("PORT", "out of range");

    if (api_retry_timeout > api_call_timeout) {
        spdlog::warn("⚠️ API_RETRY_TIMEOUT ({} ms) exceeds API_CALL_TIMEOUT ({} ms); clamping",
                     api_retry_timeout.count(), api_call_timeout.count());
        api_retry_timeout = api_call_timeout;
    }
}

DispatchPolicy DispatchConfig::dispatch_policy() const {
    return DispatchPolicy{api_call_timeout, api_retry_timeout, max_retries};
}

BatchLimits DispatchConfig::batch_limits() const {
    return BatchLimits{max_batch_size, max_parallel_api_keys, batch_timeout};
}

json DispatchConfig::to_json() const {
    json keys = json::object();
    for (const auto& [provider, list] : credentials) keys[provider] = list.size();

    return {
        {"api_key_rotation_strategy", rotation_strategy_to_string(rotation_strategy)},
        {"max_parallel_api_keys", max_parallel_api_keys},
        {"api_call_timeout_ms", api_call_timeout.count()},
        {"api_retry_timeout_ms", api_retry_timeout.count()},
        {"enable_fast_failover", enable_fast_failover},
        {"max_batch_size", max_batch_size},
        {"batch_timeout_ms", batch_timeout.count()},
        {"max_retries", max_retries},
        {"credential_failure_threshold", quarantine.failure_threshold},
        {"credential_cooldown_ms", quarantine.cooldown.count()},
        {"credential_auth_cooldown_ms", quarantine.auth_cooldown.count()},
        {"default_llm_provider", default_provider},
        {"credentials", keys}
    };
}

}
