#pragma once
#include <chrono>
#include <deque>
#include <mutex>
#include <string>
#include <nlohmann/json.hpp>

#include "llm_dispatch/CallTypes.hpp"

namespace llm_dispatch {

struct CallTrace {
    long long timestamp;
    std::string request_id;
    std::string provider;
    std::string state;
    std::string failure; // empty on success
    size_t attempts;
    double duration_ms;
};

struct BatchTrace {
    long long timestamp;
    size_t size;
    size_t succeeded;
    size_t failed;
    bool timed_out;
    double duration_ms;
};

// Recent terminal outcomes for the admin telemetry endpoint. Memory only.
class CallLog {
public:
    explicit CallLog(size_t capacity = 100) : capacity_(capacity == 0 ? 1 : capacity) {}

    void add_call(const CallResult& r) {
        CallTrace t{now_epoch(), r.request_id, r.provider, request_state_to_string(r.state),
                    r.failure ? failure_kind_to_string(r.failure->kind) : "",
                    r.attempts.size(), static_cast<double>(r.elapsed.count())};
        std::lock_guard<std::mutex> lock(mtx_);
        calls_.push_back(std::move(t));
        if (calls_.size() > capacity_) calls_.pop_front();
    }

    void add_batch(const BatchResult& b) {
        BatchTrace t{now_epoch(), b.results.size(), b.succeeded_count(), b.failed_count(), b.timed_out,
                     static_cast<double>(b.elapsed.count())};
        std::lock_guard<std::mutex> lock(mtx_);
        batches_.push_back(t);
        if (batches_.size() > capacity_) batches_.pop_front();
    }

    nlohmann::json get_calls_json() const {
        std::lock_guard<std::mutex> lock(mtx_);
        nlohmann::json j = nlohmann::json::array();
        for (auto it = calls_.rbegin(); it != calls_.rend(); ++it) {
            j.push_back({
                {"timestamp", it->timestamp},
                {"request_id", it->request_id},
                {"provider", it->provider},
                {"state", it->state},
                {"failure", it->failure},
                {"attempts", it->attempts},
                {"duration_ms", it->duration_ms}
            });
        }
        return j;
    }

    nlohmann::json get_batches_json() const {
        std::lock_guard<std::mutex> lock(mtx_);
        nlohmann::json j = nlohmann::json::array();
        for (auto it = batches_.rbegin(); it != batches_.rend(); ++it) {
            j.push_back({
                {"timestamp", it->timestamp},
                {"size", it->size},
                {"succeeded", it->succeeded},
                {"failed", it->failed},
                {"timed_out", it->timed_out},
                {"duration_ms", it->duration_ms}
            });
        }
        return j;
    }

    size_t call_count() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return calls_.size();
    }

private:
    static long long now_epoch() {
        return static_cast<long long>(std::chrono::system_clock::to_time_t(std::chrono::system_clock::now()));
    }

    size_t capacity_;
    mutable std::mutex mtx_;
    std::deque<CallTrace> calls_;
    std::deque<BatchTrace> batches_;
};

}
