#include <gtest/gtest.h>

#include <set>

#include "FakeProvider.hpp"
#include "llm_dispatch/CallDispatcher.hpp"

using namespace llm_dispatch;
using namespace llm_dispatch::fakes;

namespace {

struct CallDispatcherTest : public ::testing::Test {
    ManualClock clock;
    std::shared_ptr<FakeProvider> provider = std::make_shared<FakeProvider>();

    std::shared_ptr<CredentialPool> make_pool(size_t n, RotationStrategy s = RotationStrategy::ROUND_ROBIN) {
        std::vector<std::string> keys;
        for (size_t i = 0; i < n; ++i) keys.push_back("test-key-" + std::to_string(1000 + i));
        return std::make_shared<CredentialPool>("fake", keys, s, QuarantinePolicy{}, clock.fn());
    }

    static DispatchPolicy policy(int retries = 2) {
        DispatchPolicy p;
        p.call_timeout = 500ms;
        p.retry_timeout = 200ms;
        p.max_retries = retries;
        return p;
    }

    static CallRequest request(const std::string& id = "req-1") {
        CallRequest r;
        r.id = id;
        r.provider = "fake";
        r.payload = {{"prompt", "hello"}};
        return r;
    }
};

}

TEST_F(CallDispatcherTest, SucceedsOnFirstKey) {
    auto pool = make_pool(3);
    CallDispatcher d(pool, provider, policy());

    auto r = d.dispatch(request());
    EXPECT_EQ(r.state, RequestState::SUCCEEDED);
    ASSERT_TRUE(r.text.has_value());
    EXPECT_EQ(*r.text, "reply from test...00");
    EXPECT_EQ(r.attempts.size(), 1u);
    EXPECT_FALSE(r.failure.has_value());
}

TEST_F(CallDispatcherTest, TransientFailureRotatesToADifferentKey) {
    auto pool = make_pool(3);
    provider->script(0, {fail_with(ProviderErrorKind::RATE_LIMITED)});
    provider->script(1, {fail_with(ProviderErrorKind::TRANSPORT_ERROR)});
    CallDispatcher d(pool, provider, policy());

    auto r = d.dispatch(request());
    EXPECT_EQ(r.state, RequestState::SUCCEEDED);
    ASSERT_EQ(r.attempts.size(), 3u);
    EXPECT_EQ(r.attempts[0].credential_index, 0u);
    EXPECT_EQ(r.attempts[1].credential_index, 1u);
    EXPECT_EQ(r.attempts[2].credential_index, 2u);
    EXPECT_EQ(r.attempts[0].outcome, ProviderErrorKind::RATE_LIMITED);
    EXPECT_EQ(r.attempts[2].attempt_number, 3);

    auto h = pool->snapshot();
    EXPECT_EQ(h[0].total_failures, 1u);
    EXPECT_EQ(h[1].total_failures, 1u);
    EXPECT_EQ(h[2].total_successes, 1u);
}

TEST_F(CallDispatcherTest, RetryBudgetBoundsTotalAttempts) {
    auto pool = make_pool(5);
    provider->set_default(fail_with(ProviderErrorKind::TIMEOUT));
    CallDispatcher d(pool, provider, policy(2));

    auto r = d.dispatch(request());
    EXPECT_EQ(r.state, RequestState::FAILED_EXHAUSTED);
    EXPECT_EQ(r.attempts.size(), 3u);
    EXPECT_EQ(provider->calls(), 3u);
    ASSERT_TRUE(r.failure.has_value());
    EXPECT_EQ(r.failure->kind, FailureKind::RETRIES_EXHAUSTED);
    EXPECT_EQ(r.failure->errors.size(), 3u);
}

TEST_F(CallDispatcherTest, NonRetryableErrorStopsImmediately) {
    auto pool = make_pool(3);
    provider->set_default(fail_with(ProviderErrorKind::INVALID_RESPONSE));
    CallDispatcher d(pool, provider, policy(5));

    auto r = d.dispatch(request());
    EXPECT_EQ(r.state, RequestState::FAILED_NONRETRYABLE);
    EXPECT_EQ(r.attempts.size(), 1u);
    EXPECT_EQ(provider->calls(), 1u);
    EXPECT_EQ(r.failure->kind, FailureKind::NON_RETRYABLE);
}

TEST_F(CallDispatcherTest, ExhaustedPoolFailsFastWithoutCallingProvider) {
    auto pool = make_pool(2);
    pool->quarantine(Credential{0, "fake", "", ""}, std::chrono::minutes(1));
    pool->quarantine(Credential{1, "fake", "", ""}, std::chrono::minutes(1));
    CallDispatcher d(pool, provider, policy());

    auto start = SteadyClock::now();
    auto r = d.dispatch(request());
    EXPECT_LT(SteadyClock::now() - start, 100ms);

    EXPECT_EQ(r.state, RequestState::FAILED_EXHAUSTED);
    EXPECT_EQ(r.failure->kind, FailureKind::POOL_EXHAUSTED);
    EXPECT_TRUE(r.attempts.empty());
    EXPECT_EQ(provider->calls(), 0u);
}

TEST_F(CallDispatcherTest, HangingProviderTimesOutAndRetriesUnderRetryTimeout) {
    auto pool = make_pool(2);
    provider->script(0, {hangs()});
    CallDispatcher d(pool, provider, policy());

    auto start = SteadyClock::now();
    auto r = d.dispatch(request());
    auto took = SteadyClock::now() - start;

    EXPECT_EQ(r.state, RequestState::SUCCEEDED);
    ASSERT_EQ(r.attempts.size(), 2u);
    EXPECT_EQ(r.attempts[0].outcome, ProviderErrorKind::TIMEOUT);
    EXPECT_GE(took, 450ms);
    EXPECT_LT(took, 2s);
}

TEST_F(CallDispatcherTest, AuthErrorRotatesWithoutSpendingRetries) {
    auto pool = make_pool(3);
    provider->script(0, {fail_with(ProviderErrorKind::AUTH_ERROR)});
    provider->script(1, {fail_with(ProviderErrorKind::AUTH_ERROR)});
    CallDispatcher d(pool, provider, policy(0));

    auto r = d.dispatch(request());
    EXPECT_EQ(r.state, RequestState::SUCCEEDED);
    EXPECT_EQ(r.attempts.size(), 3u);

    // Both bad keys are out of rotation for the auth cooldown.
    std::set<size_t> next;
    for (int i = 0; i < 4; ++i) next.insert(pool->acquire()->index);
    EXPECT_EQ(next, (std::set<size_t>{2}));
}

TEST_F(CallDispatcherTest, EveryKeyRejectedForAuthEndsExhausted) {
    auto pool = make_pool(2);
    provider->set_default(fail_with(ProviderErrorKind::AUTH_ERROR));
    CallDispatcher d(pool, provider, policy(1));

    auto r = d.dispatch(request());
    EXPECT_EQ(r.state, RequestState::FAILED_EXHAUSTED);
    EXPECT_EQ(r.failure->kind, FailureKind::POOL_EXHAUSTED);
    EXPECT_EQ(provider->calls(), 2u);
}

TEST_F(CallDispatcherTest, PerRequestRetryOverride) {
    auto pool = make_pool(4);
    provider->set_default(fail_with(ProviderErrorKind::RATE_LIMITED));
    CallDispatcher d(pool, provider, policy(3));

    auto req = request();
    req.max_retries = 0;
    auto r = d.dispatch(req);
    EXPECT_EQ(r.attempts.size(), 1u);
}

TEST_F(CallDispatcherTest, CancelledRequestIsNotDispatched) {
    auto pool = make_pool(2);
    CallDispatcher d(pool, provider, policy());
    CancellationSource src;
    src.cancel();

    auto r = d.dispatch(request(), src.token());
    EXPECT_EQ(r.state, RequestState::FAILED_EXHAUSTED);
    EXPECT_EQ(r.failure->kind, FailureKind::CANCELLED);
    EXPECT_EQ(provider->calls(), 0u);
}

TEST_F(CallDispatcherTest, FailoverStrategyRetriesOnTheNextKey) {
    auto pool = make_pool(3, RotationStrategy::FAILOVER);
    provider->script(0, {fail_with(ProviderErrorKind::RATE_LIMITED)});
    CallDispatcher d(pool, provider, policy(2));

    auto r = d.dispatch(request());
    EXPECT_EQ(r.state, RequestState::SUCCEEDED);
    ASSERT_EQ(r.attempts.size(), 2u);
    EXPECT_EQ(r.attempts[0].credential_index, 0u);
    EXPECT_EQ(r.attempts[1].credential_index, 1u);
    EXPECT_EQ(provider->calls_for(0), 1u);
}

TEST_F(CallDispatcherTest, RetriesNeverRepeatAKeyWhileOthersAreHealthy) {
    auto pool = make_pool(3, RotationStrategy::RANDOM);
    provider->set_default(fail_with(ProviderErrorKind::TRANSPORT_ERROR));
    CallDispatcher d(pool, provider, policy(2));

    auto r = d.dispatch(request());
    ASSERT_EQ(r.attempts.size(), 3u);
    std::set<size_t> used;
    for (const auto& a : r.attempts) used.insert(a.credential_index);
    EXPECT_EQ(used.size(), 3u);
}

TEST_F(CallDispatcherTest, LastHealthyKeyIsRetriedWhenNothingElseIsLeft) {
    auto pool = make_pool(2, RotationStrategy::FAILOVER);
    pool->quarantine(Credential{1, "fake", "", ""}, std::chrono::minutes(1));
    provider->script(0, {fail_with(ProviderErrorKind::TIMEOUT), ok_after(0ms, "recovered")});
    CallDispatcher d(pool, provider, policy(2));

    auto r = d.dispatch(request());
    ASSERT_TRUE(r.succeeded());
    EXPECT_EQ(*r.text, "recovered");
    ASSERT_EQ(r.attempts.size(), 2u);
    EXPECT_EQ(r.attempts[1].credential_index, 0u);
}
