#include "llm_dispatch/CallDispatcher.hpp"

#include <algorithm>
#include <set>
#include <spdlog/spdlog.h>

#include "llm_dispatch/AttemptGroup.hpp"
#include "llm_dispatch/RequestStateMachine.hpp"

namespace llm_dispatch {

CallDispatcher::CallDispatcher(std::shared_ptr<CredentialPool> pool,
                               std::shared_ptr<ProviderClient> provider,
                               DispatchPolicy policy)
    : pool_(std::move(pool)), provider_(std::move(provider)), policy_(policy) {}

CallResult CallDispatcher::dispatch(const CallRequest& request, const CancellationToken& cancel) const {
    const TimePoint start = SteadyClock::now();
    const int max_retries = request.max_retries.value_or(policy_.max_retries);
    const auto call_timeout = request.call_timeout.value_or(policy_.call_timeout);
    const auto retry_timeout = std::min(request.retry_timeout.value_or(policy_.retry_timeout), call_timeout);

    RequestStateMachine machine(max_retries, static_cast<int>(pool_->size()));
    std::vector<CallAttempt> history;
    std::set<size_t> failed_keys; // rotated away from unless nothing else is healthy
    std::optional<std::string> text;
    FailureKind failure_kind = FailureKind::RETRIES_EXHAUSTED;
    std::string failure_message;

    while (!machine.is_terminal()) {
        if (cancel.is_cancelled()) {
            machine.on_cancelled();
            failure_kind = FailureKind::CANCELLED;
            failure_message = "request cancelled";
            break;
        }

        auto credential = pool_->acquire_excluding(failed_keys);
        if (!credential) {
            machine.on_pool_exhausted();
            failure_kind = FailureKind::POOL_EXHAUSTED;
            failure_message = "no usable credential for provider '" + pool_->provider() + "'";
            break;
        }

        const bool first = history.empty();
        machine.on_dispatch();

        AttemptGroup group(provider_, pool_, cancel);
        group.launch(request.payload, *credential, first ? call_timeout : retry_timeout,
                     static_cast<int>(history.size()) + 1);
        AttemptOutcome outcome = group.await_first_success();
        for (auto& a : outcome.attempts) history.push_back(std::move(a));

        if (outcome.winner) {
            machine.on_success();
            text = std::move(outcome.text);
            break;
        }

        const CallAttempt& last = history.back();
        failed_keys.insert(last.credential_index);
        RequestState next = machine.on_failure(last.outcome);

        if (next == RequestState::RETRYING) {
            spdlog::debug("🔁 {} attempt {} failed on {} ({}), rotating", request.id, last.attempt_number,
                          last.credential_label, provider_error_to_string(last.outcome));
        } else if (next == RequestState::FAILED_NONRETRYABLE) {
            failure_kind = FailureKind::NON_RETRYABLE;
            failure_message = provider_error_to_string(last.outcome) + ": " + last.message;
        } else if (last.outcome == ProviderErrorKind::CANCELLED) {
            failure_kind = FailureKind::CANCELLED;
            failure_message = "request cancelled";
        } else {
            failure_kind = FailureKind::RETRIES_EXHAUSTED;
            failure_message = "gave up after " + std::to_string(machine.dispatch_count()) +
                              " attempts, last error " + provider_error_to_string(last.outcome);
        }
    }

    CallResult result = machine.state() == RequestState::SUCCEEDED
        ? CallResult::success(request, std::move(*text), std::move(history))
        : CallResult::failed(request, machine.state(), failure_kind, failure_message, std::move(history));
    result.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(SteadyClock::now() - start);

    if (!result.succeeded()) {
        spdlog::warn("❌ {} failed: {} ({} attempts)", request.id, failure_message, result.attempts.size());
    }
    return result;
}

}
