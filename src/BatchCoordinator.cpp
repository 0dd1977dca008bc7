#include "llm_dispatch/BatchCoordinator.hpp"

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <iterator>
#include <mutex>
#include <optional>
#include <vector>
#include <spdlog/spdlog.h>

namespace llm_dispatch {

struct BatchCoordinator::BatchState {
    std::vector<CallRequest> requests;
    std::vector<std::optional<CallResult>> results;
    std::vector<RequestState> states;
    BatchStateListener listener;

    std::atomic<size_t> next{0};
    std::mutex mtx;
    std::condition_variable cv;
    size_t completed = 0;
    bool sealed = false; // set once run() has returned its answer
    CancellationSource cancel;

    // The listener runs under the lock so it can never fire after sealing.
    void set_state(size_t idx, RequestState s) {
        std::lock_guard<std::mutex> lock(mtx);
        if (sealed) return;
        states[idx] = s;
        if (listener) listener(idx, s);
    }
};

BatchCoordinator::BatchCoordinator(RequestExecutor executor, BatchLimits limits)
    : executor_(std::move(executor)), limits_(limits) {}

BatchCoordinator::~BatchCoordinator() {
    std::vector<std::unique_ptr<ThreadPool>> pending;
    {
        std::lock_guard<std::mutex> lock(draining_mutex_);
        pending.swap(draining_);
    }
    if (!pending.empty()) {
        spdlog::debug("⏳ Joining {} draining batch worker pool(s)", pending.size());
    }
    // Each ThreadPool joins its threads; their batches were cancelled at timeout.
}

void BatchCoordinator::retire(std::unique_ptr<ThreadPool> workers) {
    std::lock_guard<std::mutex> lock(draining_mutex_);
    draining_.push_back(std::move(workers));
}

void BatchCoordinator::reap_idle() {
    std::vector<std::unique_ptr<ThreadPool>> finished;
    {
        std::lock_guard<std::mutex> lock(draining_mutex_);
        auto it = std::partition(draining_.begin(), draining_.end(),
                                 [](const std::unique_ptr<ThreadPool>& p) { return !p->idle(); });
        std::move(it, draining_.end(), std::back_inserter(finished));
        draining_.erase(it, draining_.end());
    }
    // Joined outside the lock; idle workers exit as soon as they are stopped.
}

size_t BatchCoordinator::draining_count() const {
    std::lock_guard<std::mutex> lock(draining_mutex_);
    return draining_.size();
}

void BatchCoordinator::validate(const BatchJob& job) const {
    if (job.requests.size() > limits_.max_batch_size) {
        spdlog::warn("🚫 Batch rejected: {} requests > MAX_BATCH_SIZE {}", job.requests.size(),
                     limits_.max_batch_size);
        throw BatchValidationError(job.requests.size(), limits_.max_batch_size);
    }
}

size_t BatchCoordinator::worker_count_for(const BatchJob& job) const {
    size_t cap = std::max<size_t>(1, limits_.max_parallel);
    size_t limit = job.concurrency_limit == 0 ? cap : std::min(job.concurrency_limit, cap);
    return std::min(limit, job.requests.size());
}

BatchResult BatchCoordinator::run(const BatchJob& job, BatchStateListener listener) {
    validate(job);

    const TimePoint start = SteadyClock::now();
    BatchResult out;
    const size_t n = job.requests.size();
    if (n == 0) return out;
    reap_idle();

    auto state = std::make_shared<BatchState>();
    state->requests = job.requests;
    state->results.resize(n);
    state->states.assign(n, RequestState::PENDING);
    state->listener = std::move(listener);

    const size_t workers = worker_count_for(job);
    auto pool = std::make_unique<ThreadPool>(workers);
    spdlog::info("📦 Batch of {} requests on {} workers", n, workers);

    // Each worker pulls the next unclaimed index until none remain.
    for (size_t w = 0; w < workers; ++w) {
        pool->enqueue([state, executor = executor_]() {
            const size_t total = state->requests.size();
            while (!state->cancel.is_cancelled()) {
                const size_t idx = state->next.fetch_add(1);
                if (idx >= total) return;

                const CallRequest& request = state->requests[idx];
                state->set_state(idx, RequestState::DISPATCHED);

                CallResult result;
                try {
                    result = executor(request, state->cancel.token());
                } catch (const std::exception& e) {
                    result = CallResult::failed(request, RequestState::FAILED_NONRETRYABLE,
                                                FailureKind::INTERNAL_ERROR, e.what());
                }
                const RequestState terminal = result.state;

                {
                    std::lock_guard<std::mutex> lock(state->mtx);
                    if (state->sealed) return; // batch already answered, result discarded
                    state->results[idx] = std::move(result);
                    state->states[idx] = terminal;
                    state->completed++;
                    if (state->listener) state->listener(idx, terminal);
                }
                state->cv.notify_all();
            }
        });
    }

    size_t finished = 0;
    {
        std::unique_lock<std::mutex> lock(state->mtx);
        const bool done = state->cv.wait_until(lock, start + limits_.batch_timeout,
                                               [&] { return state->completed == n; });
        state->sealed = true;
        out.timed_out = !done;
        finished = state->completed;

        out.results.reserve(n);
        for (size_t i = 0; i < n; ++i) {
            if (state->results[i]) {
                out.results.push_back(std::move(*state->results[i]));
                continue;
            }
            CallResult r = CallResult::failed(
                state->requests[i], RequestState::FAILED_EXHAUSTED, FailureKind::BATCH_TIMEOUT,
                "batch timeout of " + std::to_string(limits_.batch_timeout.count()) + " ms elapsed while " +
                    request_state_to_string(state->states[i]));
            r.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(SteadyClock::now() - start);
            out.results.push_back(std::move(r));
        }
    }

    if (out.timed_out) {
        // Stops workers from claiming more work and aborts in-flight attempts.
        state->cancel.cancel();
        spdlog::warn("⏱️ Batch timed out after {} ms: {}/{} requests finished", limits_.batch_timeout.count(),
                     finished, n);
        retire(std::move(pool));
    } else {
        pool->wait_all();
    }

    out.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(SteadyClock::now() - start);
    spdlog::info("✅ Batch done in {} ms: {} ok, {} failed", out.elapsed.count(), out.succeeded_count(),
                 out.failed_count());
    return out;
}

}
