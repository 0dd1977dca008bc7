#pragma once
#include <chrono>
#include <functional>
#include <optional>
#include <random>
#include <set>
#include <shared_mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "llm_dispatch/CallTypes.hpp"

namespace llm_dispatch {

enum class RotationStrategy {
    ROUND_ROBIN,
    RANDOM,
    FAILOVER
};

// Throws std::invalid_argument for anything but round_robin | random | failover.
RotationStrategy parse_rotation_strategy(const std::string& s);
std::string rotation_strategy_to_string(RotationStrategy s);

struct QuarantinePolicy {
    int failure_threshold = 2;                    // quarantine once consecutive failures exceed this
    std::chrono::milliseconds cooldown{30000};
    std::chrono::milliseconds auth_cooldown{600000};
};

struct CredentialHealth {
    size_t index = 0;
    std::string label;
    int consecutive_failures = 0;
    std::optional<TimePoint> quarantined_until;
    std::optional<TimePoint> last_used_at;
    size_t total_successes = 0;
    size_t total_failures = 0;
    ProviderErrorKind last_error = ProviderErrorKind::NONE;
};

// Owns the API keys of one provider and their health. Shared by every
// concurrent dispatch; the lock is never held across a provider call.
class CredentialPool {
public:
    using ClockFn = std::function<TimePoint()>;

    CredentialPool(std::string provider,
                   std::vector<std::string> keys,
                   RotationStrategy strategy = RotationStrategy::ROUND_ROBIN,
                   QuarantinePolicy policy = {},
                   ClockFn clock = nullptr,
                   std::optional<uint32_t> seed = std::nullopt);

    // std::nullopt means PoolExhausted: empty pool or every key quarantined.
    std::optional<Credential> acquire();

    // Like acquire(), but skips `excluded` indices while another healthy key
    // exists. Falls back to an excluded key only when it is the last one.
    std::optional<Credential> acquire_excluding(const std::set<size_t>& excluded);

    // Up to `max_count` distinct healthy keys in strategy order, one critical section.
    std::vector<Credential> acquire_distinct(size_t max_count);

    void report_success(const Credential& credential);
    void report_failure(const Credential& credential, ProviderErrorKind kind = ProviderErrorKind::TRANSPORT_ERROR);
    void quarantine(const Credential& credential, std::chrono::milliseconds duration);

    size_t size() const;
    size_t healthy_count() const;
    size_t cursor() const;
    const std::string& provider() const { return provider_; }
    RotationStrategy strategy() const { return strategy_; }
    const QuarantinePolicy& policy() const { return policy_; }

    std::vector<CredentialHealth> snapshot() const;
    nlohmann::json status_json() const;

    static std::string mask_key(const std::string& key);

private:
    struct Entry {
        std::string key;
        CredentialHealth health;
    };

    bool owns(const Credential& credential) const;
    // Lifts an expired quarantine. Caller holds the writer lock.
    bool is_available(Entry& entry, TimePoint now);
    Credential make_handle(size_t index, TimePoint now);
    std::vector<size_t> available_indices(TimePoint now);
    std::optional<size_t> select_index(TimePoint now, const std::set<size_t>& excluded);

    std::string provider_;
    std::vector<Entry> entries_;
    RotationStrategy strategy_;
    QuarantinePolicy policy_;
    ClockFn clock_;

    mutable std::shared_mutex pool_mutex_;
    size_t cursor_ = 0;
    std::mt19937 rng_;
};

}
