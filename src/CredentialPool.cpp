#include "llm_dispatch/CredentialPool.hpp"

#include <algorithm>
#include <cctype>
#include <mutex>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace llm_dispatch {

RotationStrategy parse_rotation_strategy(const std::string& s) {
    std::string v = s;
    std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (v == "round_robin") return RotationStrategy::ROUND_ROBIN;
    if (v == "random") return RotationStrategy::RANDOM;
    if (v == "failover") return RotationStrategy::FAILOVER;
    throw std::invalid_argument("unknown rotation strategy '" + s + "'");
}

std::string rotation_strategy_to_string(RotationStrategy s) {
    switch (s) {
        case RotationStrategy::ROUND_ROBIN: return "round_robin";
        case RotationStrategy::RANDOM: return "random";
        case RotationStrategy::FAILOVER: return "failover";
    }
    return "round_robin";
}

std::string CredentialPool::mask_key(const std::string& key) {
    if (key.size() < 12) return "***";
    return key.substr(0, 4) + "..." + key.substr(key.size() - 2);
}

CredentialPool::CredentialPool(std::string provider,
                               std::vector<std::string> keys,
                               RotationStrategy strategy,
                               QuarantinePolicy policy,
                               ClockFn clock,
                               std::optional<uint32_t> seed)
    : provider_(std::move(provider)),
      strategy_(strategy),
      policy_(policy),
      clock_(clock ? std::move(clock) : ClockFn([] { return SteadyClock::now(); })),
      rng_(seed ? *seed : std::random_device{}()) {

    entries_.reserve(keys.size());
    for (size_t i = 0; i < keys.size(); ++i) {
        Entry e;
        e.health.index = i;
        e.health.label = mask_key(keys[i]);
        e.key = std::move(keys[i]);
        entries_.push_back(std::move(e));
    }

    if (entries_.empty()) {
        spdlog::warn("⚠️ Credential pool '{}' is empty. Every dispatch will fail with pool_exhausted.", provider_);
    } else {
        spdlog::info("🛰️ Credential pool '{}': {} keys, strategy={}", provider_, entries_.size(),
                     rotation_strategy_to_string(strategy_));
    }
}

bool CredentialPool::owns(const Credential& credential) const {
    return credential.provider == provider_ && credential.index < entries_.size();
}

bool CredentialPool::is_available(Entry& entry, TimePoint now) {
    auto& h = entry.health;
    if (!h.quarantined_until) return true;
    if (now < *h.quarantined_until) return false;

    // Cooldown elapsed: the key gets a clean slate.
    h.quarantined_until.reset();
    h.consecutive_failures = 0;
    spdlog::info("♻️ Key {} ({}) released from quarantine", h.label, provider_);
    return true;
}

Credential CredentialPool::make_handle(size_t index, TimePoint now) {
    auto& e = entries_[index];
    e.health.last_used_at = now;
    return Credential{index, provider_, e.key, e.health.label};
}

std::vector<size_t> CredentialPool::available_indices(TimePoint now) {
    std::vector<size_t> out;
    for (size_t i = 0; i < entries_.size(); ++i) {
        if (is_available(entries_[i], now)) out.push_back(i);
    }
    return out;
}

std::optional<size_t> CredentialPool::select_index(TimePoint now, const std::set<size_t>& excluded) {
    const size_t n = entries_.size();
    auto usable = [&](size_t idx) { return !excluded.count(idx) && is_available(entries_[idx], now); };

    switch (strategy_) {
        case RotationStrategy::ROUND_ROBIN: {
            for (size_t i = 0; i < n; ++i) {
                size_t idx = (cursor_ + i) % n;
                if (usable(idx)) {
                    cursor_ = (idx + 1) % n;
                    return idx;
                }
            }
            break;
        }
        case RotationStrategy::RANDOM: {
            std::vector<size_t> candidates;
            for (size_t idx : available_indices(now)) {
                if (!excluded.count(idx)) candidates.push_back(idx);
            }
            if (candidates.empty()) break;
            std::uniform_int_distribution<size_t> pick(0, candidates.size() - 1);
            return candidates[pick(rng_)];
        }
        case RotationStrategy::FAILOVER: {
            for (size_t idx = 0; idx < n; ++idx) {
                if (usable(idx)) {
                    cursor_ = idx;
                    return idx;
                }
            }
            break;
        }
    }
    return std::nullopt;
}

std::optional<Credential> CredentialPool::acquire() {
    return acquire_excluding({});
}

std::optional<Credential> CredentialPool::acquire_excluding(const std::set<size_t>& excluded) {
    std::unique_lock lock(pool_mutex_);
    const size_t n = entries_.size();
    if (n == 0) return std::nullopt;

    const TimePoint now = clock_();
    auto idx = select_index(now, excluded);
    if (!idx && !excluded.empty()) idx = select_index(now, {});
    if (idx) return make_handle(*idx, now);

    spdlog::warn("🔥 Pool '{}' exhausted: all {} keys quarantined", provider_, n);
    return std::nullopt;
}

std::vector<Credential> CredentialPool::acquire_distinct(size_t max_count) {
    std::unique_lock lock(pool_mutex_);
    std::vector<Credential> out;
    const size_t n = entries_.size();
    if (n == 0 || max_count == 0) return out;

    const TimePoint now = clock_();

    switch (strategy_) {
        case RotationStrategy::ROUND_ROBIN: {
            for (size_t i = 0; i < n && out.size() < max_count; ++i) {
                size_t idx = (cursor_ + i) % n;
                if (is_available(entries_[idx], now)) {
                    out.push_back(make_handle(idx, now));
                }
            }
            if (!out.empty()) cursor_ = (out.back().index + 1) % n;
            break;
        }
        case RotationStrategy::RANDOM: {
            auto candidates = available_indices(now);
            std::shuffle(candidates.begin(), candidates.end(), rng_);
            for (size_t i = 0; i < candidates.size() && out.size() < max_count; ++i) {
                out.push_back(make_handle(candidates[i], now));
            }
            break;
        }
        case RotationStrategy::FAILOVER: {
            for (size_t idx = 0; idx < n && out.size() < max_count; ++idx) {
                if (is_available(entries_[idx], now)) out.push_back(make_handle(idx, now));
            }
            if (!out.empty()) cursor_ = out.front().index;
            break;
        }
    }

    if (out.empty()) spdlog::warn("🔥 Pool '{}' exhausted: all {} keys quarantined", provider_, n);
    return out;
}

void CredentialPool::report_success(const Credential& credential) {
    std::unique_lock lock(pool_mutex_);
    if (!owns(credential)) return;

    auto& h = entries_[credential.index].health;
    h.consecutive_failures = 0;
    h.quarantined_until.reset();
    h.total_successes++;
}

void CredentialPool::report_failure(const Credential& credential, ProviderErrorKind kind) {
    if (kind == ProviderErrorKind::NONE || kind == ProviderErrorKind::CANCELLED) return;

    std::unique_lock lock(pool_mutex_);
    if (!owns(credential)) return;

    const TimePoint now = clock_();
    auto& h = entries_[credential.index].health;
    h.consecutive_failures++;
    h.total_failures++;
    h.last_error = kind;

    std::optional<std::chrono::milliseconds> cooldown;
    if (kind == ProviderErrorKind::AUTH_ERROR) {
        cooldown = policy_.auth_cooldown;
    } else if (h.consecutive_failures > policy_.failure_threshold) {
        cooldown = policy_.cooldown;
    }
    if (!cooldown) return;

    TimePoint until = now + *cooldown;
    if (!h.quarantined_until || *h.quarantined_until < until) {
        h.quarantined_until = until;
        spdlog::warn("⚠️ Key {} ({}) quarantined for {} ms after {} consecutive failures (last: {})",
                     h.label, provider_, cooldown->count(), h.consecutive_failures,
                     provider_error_to_string(kind));
    }
}

void CredentialPool::quarantine(const Credential& credential, std::chrono::milliseconds duration) {
    std::unique_lock lock(pool_mutex_);
    if (!owns(credential)) return;

    auto& h = entries_[credential.index].health;
    h.quarantined_until = clock_() + duration;
    spdlog::warn("⚠️ Key {} ({}) quarantined for {} ms", h.label, provider_, duration.count());
}

size_t CredentialPool::size() const {
    std::shared_lock lock(pool_mutex_);
    return entries_.size();
}

size_t CredentialPool::healthy_count() const {
    std::shared_lock lock(pool_mutex_);
    const TimePoint now = clock_();
    size_t count = 0;
    for (const auto& e : entries_) {
        if (!e.health.quarantined_until || now >= *e.health.quarantined_until) count++;
    }
    return count;
}

size_t CredentialPool::cursor() const {
    std::shared_lock lock(pool_mutex_);
    return cursor_;
}

std::vector<CredentialHealth> CredentialPool::snapshot() const {
    std::shared_lock lock(pool_mutex_);
    std::vector<CredentialHealth> out;
    out.reserve(entries_.size());
    for (const auto& e : entries_) out.push_back(e.health);
    return out;
}

nlohmann::json CredentialPool::status_json() const {
    const TimePoint now = clock_();
    nlohmann::json keys = nlohmann::json::array();
    size_t healthy = 0;

    for (const auto& h : snapshot()) {
        long long quarantined_ms = 0;
        if (h.quarantined_until && now < *h.quarantined_until) {
            quarantined_ms = std::chrono::duration_cast<std::chrono::milliseconds>(*h.quarantined_until - now).count();
        } else {
            healthy++;
        }
        long long idle_ms = -1;
        if (h.last_used_at) {
            idle_ms = std::chrono::duration_cast<std::chrono::milliseconds>(now - *h.last_used_at).count();
        }
        keys.push_back({
            {"index", h.index},
            {"label", h.label},
            {"consecutive_failures", h.consecutive_failures},
            {"quarantined_for_ms", quarantined_ms},
            {"idle_ms", idle_ms},
            {"successes", h.total_successes},
            {"failures", h.total_failures},
            {"last_error", provider_error_to_string(h.last_error)}
        });
    }

    return {
        {"provider", provider_},
        {"strategy", rotation_strategy_to_string(strategy_)},
        {"cursor", cursor()},
        {"size", keys.size()},
        {"healthy", healthy},
        {"keys", keys}
    };
}

}
