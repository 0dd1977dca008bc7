#pragma once
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <vector>

#include "llm_dispatch/CallTypes.hpp"
#include "llm_dispatch/CancellationToken.hpp"
#include "llm_dispatch/DispatchErrors.hpp"
#include "llm_dispatch/ThreadPool.hpp"

namespace llm_dispatch {

// Runs one request to a terminal CallResult (dispatcher or racer).
using RequestExecutor = std::function<CallResult(const CallRequest&, const CancellationToken&)>;

struct BatchLimits {
    size_t max_batch_size = 10;
    size_t max_parallel = 5;
    std::chrono::milliseconds batch_timeout{30000};
};

// Observes per-request state changes: (index, new state).
using BatchStateListener = std::function<void(size_t, RequestState)>;

// Runs independent requests on a bounded set of workers. Results land in a
// pre-sized slot per request index, never in completion order, and one
// request's failure never touches its siblings. When the batch timeout
// elapses, unfinished requests are cancelled and reported as batch_timeout.
//
// Every run() gets its own workers, so concurrent batches never queue behind
// each other. A timed-out run leaves its workers draining; they are joined
// by a later run() once idle, or by the destructor.
class BatchCoordinator {
public:
    BatchCoordinator(RequestExecutor executor, BatchLimits limits);
    ~BatchCoordinator();

    BatchCoordinator(const BatchCoordinator&) = delete;
    BatchCoordinator& operator=(const BatchCoordinator&) = delete;

    // Throws BatchValidationError before scheduling anything.
    BatchResult run(const BatchJob& job, BatchStateListener listener = nullptr);

    void validate(const BatchJob& job) const;
    size_t worker_count_for(const BatchJob& job) const;
    const BatchLimits& limits() const { return limits_; }

    // Worker pools of timed-out runs that still have stragglers.
    size_t draining_count() const;

private:
    struct BatchState;

    void retire(std::unique_ptr<ThreadPool> workers);
    void reap_idle();

    RequestExecutor executor_;
    BatchLimits limits_;

    mutable std::mutex draining_mutex_;
    std::vector<std::unique_ptr<ThreadPool>> draining_;
};

}
