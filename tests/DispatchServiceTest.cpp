#include <gtest/gtest.h>

#include "FakeProvider.hpp"
#include "llm_dispatch/DispatchService.hpp"

using namespace llm_dispatch;
using namespace llm_dispatch::fakes;
using json = nlohmann::json;

namespace {

struct DispatchServiceTest : public ::testing::Test {
    std::shared_ptr<FakeProvider> fake = std::make_shared<FakeProvider>("gemini");

    DispatchConfig config(bool fast_failover = true, size_t keys = 3) {
        DispatchConfig cfg;
        cfg.enable_fast_failover = fast_failover;
        cfg.api_call_timeout = 1000ms;
        cfg.api_retry_timeout = 500ms;
        cfg.batch_timeout = 2000ms;
        cfg.max_batch_size = 4;
        for (size_t i = 0; i < keys; ++i) cfg.credentials["gemini"].push_back("svc-key-" + std::to_string(10 + i));
        return cfg;
    }

    ProviderRegistry registry() {
        ProviderRegistry r;
        r.register_provider("gemini", fake);
        r.register_provider("openai", std::make_shared<FakeProvider>("openai"));
        return r;
    }

    static CallRequest prompt(const std::string& text) {
        CallRequest r;
        r.payload = {{"prompt", text}};
        return r;
    }
};

}

TEST_F(DispatchServiceTest, AssignsIdAndDefaultProvider) {
    DispatchService service(config(false), registry());
    auto r = service.dispatch_one(prompt("hi"));
    EXPECT_TRUE(r.succeeded());
    EXPECT_EQ(r.provider, "gemini");
    EXPECT_EQ(r.request_id.rfind("req-", 0), 0u);

    auto again = service.dispatch_one(prompt("hi"));
    EXPECT_NE(again.request_id, r.request_id);
}

TEST_F(DispatchServiceTest, UnknownProviderIsNonRetryable) {
    DispatchService service(config(), registry());
    auto req = prompt("hi");
    req.provider = "anthropic";

    auto r = service.dispatch_one(req);
    EXPECT_EQ(r.state, RequestState::FAILED_NONRETRYABLE);
    EXPECT_EQ(r.failure->kind, FailureKind::UNKNOWN_PROVIDER);
    EXPECT_EQ(fake->calls(), 0u);
}

TEST_F(DispatchServiceTest, ProviderWithoutKeysFailsWithoutCalls) {
    DispatchService service(config(), registry());
    auto req = prompt("hi");
    req.provider = "openai";

    auto r = service.dispatch_one(req);
    EXPECT_EQ(r.state, RequestState::FAILED_NONRETRYABLE);
    EXPECT_EQ(r.failure->kind, FailureKind::UNKNOWN_PROVIDER);
    EXPECT_TRUE(r.attempts.empty());
}

TEST_F(DispatchServiceTest, FastFailoverRacesAcrossKeys) {
    fake->script(0, {hangs()});
    fake->script(1, {ok_after(20ms, "raced")});
    fake->script(2, {ok_after(600ms)});
    DispatchService service(config(true), registry());

    auto start = SteadyClock::now();
    auto r = service.dispatch_one(prompt("go"));
    EXPECT_LT(SteadyClock::now() - start, 500ms);
    ASSERT_TRUE(r.succeeded());
    EXPECT_EQ(*r.text, "raced");
    EXPECT_EQ(r.attempts.size(), 3u);
}

TEST_F(DispatchServiceTest, SingleKeyPoolUsesSequentialDispatch) {
    fake->script(0, {fail_with(ProviderErrorKind::RATE_LIMITED), ok_after(0ms, "second try")});
    DispatchService service(config(true, 1), registry());

    auto r = service.dispatch_one(prompt("go"));
    ASSERT_TRUE(r.succeeded());
    EXPECT_EQ(*r.text, "second try");
    EXPECT_EQ(r.attempts.size(), 2u);
    EXPECT_EQ(r.attempts[0].credential_index, r.attempts[1].credential_index);
}

TEST_F(DispatchServiceTest, StringPayloadBecomesPrompt) {
    DispatchService service(config(false), registry());
    CallRequest req;
    req.payload = "just text";
    EXPECT_TRUE(service.dispatch_one(req).succeeded());

    CallRequest bad;
    bad.payload = 42;
    auto r = service.dispatch_one(bad);
    EXPECT_EQ(r.state, RequestState::FAILED_NONRETRYABLE);
    EXPECT_EQ(fake->calls(), 1u);
}

TEST_F(DispatchServiceTest, BatchIsIndexAlignedAndJournaled) {
    DispatchService service(config(false), registry());
    std::vector<CallRequest> batch;
    for (int i = 0; i < 4; ++i) {
        CallRequest r;
        r.id = "b-" + std::to_string(i);
        r.payload = {{"text", "answer " + std::to_string(i)}, {"delay_ms", (4 - i) * 15}};
        batch.push_back(r);
    }

    auto out = service.dispatch_batch(batch);
    ASSERT_EQ(out.results.size(), 4u);
    for (int i = 0; i < 4; ++i) {
        EXPECT_EQ(out.results[i].request_id, "b-" + std::to_string(i));
        EXPECT_EQ(*out.results[i].text, "answer " + std::to_string(i));
    }

    auto recent = service.recent_calls();
    EXPECT_EQ(recent["calls"].size(), 4u);
    ASSERT_EQ(recent["batches"].size(), 1u);
    EXPECT_EQ(recent["batches"][0]["succeeded"], 4);
}

TEST_F(DispatchServiceTest, InvalidResponseInABatchStaysWithItsRequest) {
    auto cfg = config(false);
    cfg.max_batch_size = 5;
    DispatchService service(cfg, registry());

    std::vector<CallRequest> batch;
    for (int i = 0; i < 5; ++i) {
        CallRequest r;
        r.id = "p-" + std::to_string(i);
        r.payload = {{"text", "ok " + std::to_string(i)}};
        if (i == 2) r.payload = {{"error", "invalid_response"}};
        batch.push_back(r);
    }

    auto out = service.dispatch_batch(batch);
    ASSERT_EQ(out.results.size(), 5u);
    for (int i : {0, 1, 3, 4}) {
        ASSERT_TRUE(out.results[i].succeeded()) << i;
        EXPECT_EQ(*out.results[i].text, "ok " + std::to_string(i));
    }
    EXPECT_EQ(out.results[2].state, RequestState::FAILED_NONRETRYABLE);
    ASSERT_TRUE(out.results[2].failure.has_value());
    EXPECT_EQ(out.results[2].failure->kind, FailureKind::NON_RETRYABLE);
    EXPECT_EQ(out.results[2].attempts.size(), 1u);
    EXPECT_EQ(out.succeeded_count(), 4u);
    EXPECT_FALSE(out.timed_out);
}

TEST_F(DispatchServiceTest, OversizedBatchIsRejected) {
    DispatchService service(config(), registry());
    std::vector<CallRequest> batch(5, prompt("x"));
    EXPECT_THROW(service.dispatch_batch(batch), BatchValidationError);
    EXPECT_EQ(fake->calls(), 0u);
}

TEST_F(DispatchServiceTest, PoolStatusShowsMaskedKeys) {
    DispatchService service(config(), registry());
    service.dispatch_one(prompt("hi"));

    auto status = service.pool_status();
    ASSERT_TRUE(status["pools"].contains("gemini"));
    EXPECT_FALSE(status["pools"].contains("openai"));
    EXPECT_EQ(status["pools"]["gemini"]["size"], 3);
    EXPECT_EQ(status.dump().find("svc-key-10"), std::string::npos);
    ASSERT_NE(service.pool_for("gemini"), nullptr);
    EXPECT_EQ(service.pool_for("openai"), nullptr);
}

TEST(DispatchRequestJsonTest, ParsesRequestObjects) {
    auto r = DispatchService::request_from_json(
        {{"id", "x1"}, {"provider", "openai"}, {"prompt", "hi"}, {"call_timeout", 2.5}, {"max_retries", 1}});
    EXPECT_EQ(r.id, "x1");
    EXPECT_EQ(r.provider, "openai");
    EXPECT_EQ(r.payload, (json{{"prompt", "hi"}}));
    EXPECT_EQ(r.call_timeout, std::chrono::milliseconds(2500));
    EXPECT_FALSE(r.retry_timeout.has_value());
    EXPECT_EQ(r.max_retries, 1);

    auto wrapped = DispatchService::request_from_json({{"payload", "plain prompt"}});
    EXPECT_EQ(wrapped.payload["prompt"], "plain prompt");
    EXPECT_TRUE(wrapped.provider.empty());

    EXPECT_THROW(DispatchService::request_from_json(json::array()), std::invalid_argument);
    EXPECT_THROW(DispatchService::request_from_json({{"id", "no-payload"}}), std::invalid_argument);
    EXPECT_THROW(DispatchService::request_from_json({{"prompt", "x"}, {"max_retries", -1}}), std::invalid_argument);
    EXPECT_THROW(DispatchService::request_from_json({{"prompt", "x"}, {"call_timeout", "soon"}}), std::invalid_argument);
}
