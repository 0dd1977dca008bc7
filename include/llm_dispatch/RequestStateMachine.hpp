#pragma once
#include <stdexcept>
#include <string>

#include "llm_dispatch/CallTypes.hpp"

namespace llm_dispatch {

// PENDING -> DISPATCHED -> { SUCCEEDED | RETRYING -> DISPATCHED | FAILED_EXHAUSTED | FAILED_NONRETRYABLE }
//
// Transient errors spend one retry each. An auth_error condemns the key, not
// the request, so it rotates without spending budget; `rotation_limit` caps
// those free rotations (normally the pool size) so the loop always ends.
class RequestStateMachine {
public:
    explicit RequestStateMachine(int max_retries, int rotation_limit = -1)
        : max_retries_(max_retries < 0 ? 0 : max_retries), rotation_limit_(rotation_limit) {}

    RequestState state() const { return state_; }
    bool is_terminal() const { return llm_dispatch::is_terminal(state_); }
    int dispatch_count() const { return dispatches_; }
    int retries_used() const { return retries_used_; }
    int retries_remaining() const { return max_retries_ - retries_used_; }
    int free_rotations() const { return free_rotations_; }

    void on_dispatch() {
        require(state_ == RequestState::PENDING || state_ == RequestState::RETRYING, "dispatch");
        state_ = RequestState::DISPATCHED;
        dispatches_++;
    }

    RequestState on_success() {
        require(state_ == RequestState::DISPATCHED, "success");
        state_ = RequestState::SUCCEEDED;
        return state_;
    }

    RequestState on_failure(ProviderErrorKind kind) {
        require(state_ == RequestState::DISPATCHED, "failure");

        if (kind == ProviderErrorKind::INVALID_RESPONSE) {
            state_ = RequestState::FAILED_NONRETRYABLE;
            return state_;
        }
        if (kind == ProviderErrorKind::CANCELLED) {
            state_ = RequestState::FAILED_EXHAUSTED;
            return state_;
        }
        if (kind == ProviderErrorKind::AUTH_ERROR &&
            (rotation_limit_ < 0 || free_rotations_ < rotation_limit_)) {
            free_rotations_++;
            state_ = RequestState::RETRYING;
            return state_;
        }
        if (retries_used_ < max_retries_) {
            retries_used_++;
            state_ = RequestState::RETRYING;
            return state_;
        }
        state_ = RequestState::FAILED_EXHAUSTED;
        return state_;
    }

    // No credential could be acquired; nothing was attempted for this step.
    RequestState on_pool_exhausted() {
        require(state_ == RequestState::PENDING || state_ == RequestState::RETRYING, "pool exhaustion");
        state_ = RequestState::FAILED_EXHAUSTED;
        return state_;
    }

    RequestState on_cancelled() {
        require(!is_terminal(), "cancellation");
        state_ = RequestState::FAILED_EXHAUSTED;
        return state_;
    }

private:
    void require(bool ok, const char* event) const {
        if (!ok) {
            throw std::logic_error(std::string("illegal ") + event + " transition from " +
                                   request_state_to_string(state_));
        }
    }

    int max_retries_;
    int rotation_limit_;
    RequestState state_ = RequestState::PENDING;
    int dispatches_ = 0;
    int retries_used_ = 0;
    int free_rotations_ = 0;
};

}
