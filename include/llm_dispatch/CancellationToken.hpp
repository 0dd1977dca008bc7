#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace llm_dispatch {

namespace detail {

struct CancelState {
    std::atomic<bool> cancelled{false};
    std::mutex mtx;
    std::condition_variable cv;
    std::vector<std::function<void()>> callbacks;

    void cancel() {
        std::vector<std::function<void()>> to_run;
        {
            std::lock_guard<std::mutex> lock(mtx);
            if (cancelled.exchange(true)) return;
            to_run.swap(callbacks);
        }
        cv.notify_all();
        // Callbacks run outside the lock so they may take their own locks.
        for (auto& cb : to_run) cb();
    }
};

} // namespace detail

// Read side of a cancellation context. A default-constructed token is never cancelled.
class CancellationToken {
public:
    CancellationToken() = default;

    bool is_cancelled() const { return state_ && state_->cancelled.load(); }

    // Returns true if cancellation happened before the deadline.
    template <class Clock, class Duration>
    bool wait_until(const std::chrono::time_point<Clock, Duration>& deadline) const {
        if (!state_) {
            std::this_thread::sleep_until(deadline);
            return false;
        }
        std::unique_lock<std::mutex> lock(state_->mtx);
        return state_->cv.wait_until(lock, deadline, [this] { return state_->cancelled.load(); });
    }

    template <class Rep, class Period>
    bool wait_for(const std::chrono::duration<Rep, Period>& timeout) const {
        return wait_until(std::chrono::steady_clock::now() + timeout);
    }

    // Runs `cb` on cancellation, or right away if already cancelled.
    void on_cancel(std::function<void()> cb) const {
        if (!state_) return;
        {
            std::lock_guard<std::mutex> lock(state_->mtx);
            if (!state_->cancelled.load()) {
                state_->callbacks.push_back(std::move(cb));
                return;
            }
        }
        cb();
    }

private:
    friend class CancellationSource;
    explicit CancellationToken(std::shared_ptr<detail::CancelState> state) : state_(std::move(state)) {}

    std::shared_ptr<detail::CancelState> state_;
};

class CancellationSource {
public:
    CancellationSource() : state_(std::make_shared<detail::CancelState>()) {}

    // Child source that is cancelled whenever `parent` is.
    static CancellationSource linked_to(const CancellationToken& parent) {
        CancellationSource child;
        std::weak_ptr<detail::CancelState> weak = child.state_;
        parent.on_cancel([weak]() {
            if (auto state = weak.lock()) state->cancel();
        });
        return child;
    }

    void cancel() { state_->cancel(); }
    bool is_cancelled() const { return state_->cancelled.load(); }
    CancellationToken token() const { return CancellationToken(state_); }

private:
    std::shared_ptr<detail::CancelState> state_;
};

}
