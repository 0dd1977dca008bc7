#include "llm_dispatch/FailoverRacer.hpp"

#include <algorithm>
#include <spdlog/spdlog.h>

#include "llm_dispatch/AttemptGroup.hpp"

namespace llm_dispatch {

FailoverRacer::FailoverRacer(std::shared_ptr<CredentialPool> pool,
                             std::shared_ptr<ProviderClient> provider,
                             DispatchPolicy policy,
                             size_t max_parallel)
    : pool_(std::move(pool)), provider_(std::move(provider)), policy_(policy),
      max_parallel_(std::max<size_t>(1, max_parallel)) {}

CallResult FailoverRacer::race(const CallRequest& request, const CancellationToken& cancel) const {
    const TimePoint start = SteadyClock::now();
    const auto timeout = request.call_timeout.value_or(policy_.call_timeout);

    auto finish = [start](CallResult r) {
        r.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(SteadyClock::now() - start);
        return r;
    };

    if (cancel.is_cancelled()) {
        return finish(CallResult::failed(request, RequestState::FAILED_EXHAUSTED, FailureKind::CANCELLED,
                                         "request cancelled"));
    }

    // min(MAX_PARALLEL_API_KEYS, healthy keys), distinct, taken in one pool transaction
    auto credentials = pool_->acquire_distinct(max_parallel_);
    if (credentials.empty()) {
        return finish(CallResult::failed(request, RequestState::FAILED_EXHAUSTED, FailureKind::POOL_EXHAUSTED,
                                         "no usable credential for provider '" + pool_->provider() + "'"));
    }

    spdlog::debug("🏁 {} racing {} keys", request.id, credentials.size());

    AttemptGroup group(provider_, pool_, cancel);
    int n = 0;
    for (const auto& c : credentials) group.launch(request.payload, c, timeout, ++n);
    AttemptOutcome outcome = group.await_first_success();

    if (outcome.winner) {
        spdlog::debug("🏆 {} won by {}", request.id, outcome.attempts[*outcome.winner].credential_label);
        return finish(CallResult::success(request, std::move(*outcome.text), std::move(outcome.attempts)));
    }

    if (outcome.parent_cancelled) {
        return finish(CallResult::failed(request, RequestState::FAILED_EXHAUSTED, FailureKind::CANCELLED,
                                         "request cancelled", std::move(outcome.attempts)));
    }

    // Every racer lost. Only a malformed request on every key is non-retryable.
    bool all_invalid = std::all_of(outcome.attempts.begin(), outcome.attempts.end(), [](const CallAttempt& a) {
        return a.outcome == ProviderErrorKind::INVALID_RESPONSE;
    });

    CallResult r = all_invalid
        ? CallResult::failed(request, RequestState::FAILED_NONRETRYABLE, FailureKind::NON_RETRYABLE,
                             "every key rejected the request as invalid", std::move(outcome.attempts))
        : CallResult::failed(request, RequestState::FAILED_EXHAUSTED, FailureKind::ALL_ATTEMPTS_FAILED,
                             "all " + std::to_string(credentials.size()) + " racing keys failed",
                             std::move(outcome.attempts));

    spdlog::warn("❌ {} race lost on every key: {}", request.id, r.failure->message);
    return finish(std::move(r));
}

}
