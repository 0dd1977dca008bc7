#include "llm_dispatch/AttemptGroup.hpp"

#include <algorithm>
#include <condition_variable>
#include <mutex>
#include <thread>
#include <spdlog/spdlog.h>

namespace llm_dispatch {

struct AttemptGroup::Shared {
    struct Slot {
        Credential credential;
        TimePoint deadline{};
        CancellationSource source;
        bool settled = false;
        CallAttempt record;
        std::optional<std::string> text;
    };

    std::shared_ptr<ProviderClient> provider;
    std::shared_ptr<CredentialPool> pool;
    CancellationToken parent;

    std::mutex mtx;
    std::condition_variable cv;
    std::vector<Slot> slots;
    std::optional<size_t> winner;
    bool parent_cancelled = false;

    // Caller holds mtx. Reports health for real outcomes only: a cancelled
    // attempt says nothing about its key, and a malformed request is the
    // request's fault.
    void settle(size_t i, ProviderReply reply, TimePoint now) {
        auto& slot = slots[i];
        slot.settled = true;
        slot.record.latency = std::chrono::duration_cast<std::chrono::milliseconds>(now - slot.record.started_at);
        slot.record.outcome = reply.error;
        slot.record.message = std::move(reply.message);

        if (reply.ok()) {
            slot.text = std::move(reply.text);
            pool->report_success(slot.credential);
            if (!winner) winner = i;
        } else if (reply.error != ProviderErrorKind::CANCELLED &&
                   reply.error != ProviderErrorKind::INVALID_RESPONSE) {
            pool->report_failure(slot.credential, reply.error);
        }

        spdlog::debug("attempt #{} on {} -> {} in {} ms", slot.record.attempt_number, slot.credential.label,
                      reply.ok() ? std::string("success") : provider_error_to_string(slot.record.outcome),
                      slot.record.latency.count());
    }

    void cancel_unsettled(TimePoint now, const char* why) {
        for (size_t i = 0; i < slots.size(); ++i) {
            if (slots[i].settled) continue;
            settle(i, ProviderReply::failure(ProviderErrorKind::CANCELLED, why), now);
            slots[i].source.cancel();
        }
    }

    bool all_settled() const {
        return std::all_of(slots.begin(), slots.end(), [](const Slot& s) { return s.settled; });
    }
};

AttemptGroup::AttemptGroup(std::shared_ptr<ProviderClient> provider,
                           std::shared_ptr<CredentialPool> pool,
                           const CancellationToken& parent)
    : shared_(std::make_shared<Shared>()) {
    shared_->provider = std::move(provider);
    shared_->pool = std::move(pool);
    shared_->parent = parent;

    std::weak_ptr<Shared> weak = shared_;
    parent.on_cancel([weak]() {
        if (auto s = weak.lock()) {
            std::lock_guard<std::mutex> lock(s->mtx);
            s->parent_cancelled = true;
            s->cv.notify_all();
        }
    });
}

AttemptGroup::~AttemptGroup() {
    std::lock_guard<std::mutex> lock(shared_->mtx);
    shared_->cancel_unsettled(SteadyClock::now(), "abandoned");
}

size_t AttemptGroup::launch(const nlohmann::json& payload,
                            const Credential& credential,
                            std::chrono::milliseconds timeout,
                            int attempt_number) {
    const TimePoint started = SteadyClock::now();
    const TimePoint deadline = started + timeout;

    size_t index;
    CancellationToken token;
    {
        std::lock_guard<std::mutex> lock(shared_->mtx);
        Shared::Slot slot;
        slot.credential = credential;
        slot.deadline = deadline;
        slot.source = CancellationSource::linked_to(shared_->parent);
        slot.record.attempt_number = attempt_number;
        slot.record.credential_index = credential.index;
        slot.record.credential_label = credential.label;
        slot.record.started_at = started;
        token = slot.source.token();
        shared_->slots.push_back(std::move(slot));
        index = shared_->slots.size() - 1;
    }

    std::thread([shared = shared_, index, payload, credential, deadline, token]() {
        ProviderReply reply;
        try {
            reply = shared->provider->call(payload, credential, deadline, token);
        } catch (const std::exception& e) {
            reply = ProviderReply::failure(ProviderErrorKind::TRANSPORT_ERROR, e.what());
        }

        const TimePoint now = SteadyClock::now();
        std::lock_guard<std::mutex> lock(shared->mtx);
        if (shared->slots[index].settled) return; // late, already accounted for

        if (now > deadline) {
            reply = ProviderReply::failure(ProviderErrorKind::TIMEOUT, "deadline exceeded");
        } else if (!reply.ok() && token.is_cancelled()) {
            reply.error = ProviderErrorKind::CANCELLED;
        }
        shared->settle(index, std::move(reply), now);
        shared->cv.notify_all();
    }).detach();

    return index;
}

AttemptOutcome AttemptGroup::await_first_success() {
    auto& s = *shared_;
    std::unique_lock<std::mutex> lock(s.mtx);

    while (!s.winner && !s.all_settled()) {
        if (s.parent_cancelled) {
            s.cancel_unsettled(SteadyClock::now(), "parent cancelled");
            break;
        }

        TimePoint next_deadline = TimePoint::max();
        for (const auto& slot : s.slots) {
            if (!slot.settled) next_deadline = std::min(next_deadline, slot.deadline);
        }
        s.cv.wait_until(lock, next_deadline);

        // The waiter never waits past a deadline: overdue attempts become timeouts.
        const TimePoint now = SteadyClock::now();
        for (size_t i = 0; i < s.slots.size(); ++i) {
            auto& slot = s.slots[i];
            if (slot.settled || now < slot.deadline) continue;
            s.settle(i, ProviderReply::failure(ProviderErrorKind::TIMEOUT, "deadline exceeded"), now);
            slot.source.cancel();
        }
    }

    if (s.winner) s.cancel_unsettled(SteadyClock::now(), "lost the race");

    AttemptOutcome out;
    out.winner = s.winner;
    out.parent_cancelled = s.parent_cancelled;
    if (s.winner) out.text = s.slots[*s.winner].text;
    for (const auto& slot : s.slots) out.attempts.push_back(slot.record);
    return out;
}

size_t AttemptGroup::size() const {
    std::lock_guard<std::mutex> lock(shared_->mtx);
    return shared_->slots.size();
}

}
