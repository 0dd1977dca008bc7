#include <gtest/gtest.h>

#include "llm_dispatch/CallLog.hpp"

using namespace llm_dispatch;

namespace {

CallResult finished(const std::string& id, bool ok) {
    CallRequest req;
    req.id = id;
    req.provider = "gemini";
    return ok ? CallResult::success(req, "done", {})
              : CallResult::failed(req, RequestState::FAILED_EXHAUSTED, FailureKind::POOL_EXHAUSTED, "no keys");
}

}

TEST(CallLogTest, KeepsNewestCallsUpToCapacity) {
    CallLog log(3);
    for (int i = 0; i < 5; ++i) log.add_call(finished("req-" + std::to_string(i), i % 2 == 0));

    EXPECT_EQ(log.call_count(), 3u);
    auto calls = log.get_calls_json();
    ASSERT_EQ(calls.size(), 3u);
    EXPECT_EQ(calls[0]["request_id"], "req-4");
    EXPECT_EQ(calls[2]["request_id"], "req-2");
    EXPECT_EQ(calls[1]["state"], "FAILED_EXHAUSTED");
    EXPECT_EQ(calls[1]["failure"], "pool_exhausted");
    EXPECT_EQ(calls[0]["failure"], "");
}

TEST(CallLogTest, RecordsBatchSummaries) {
    CallLog log;
    BatchResult b;
    b.results = {finished("a", true), finished("b", false)};
    b.timed_out = true;
    log.add_batch(b);

    EXPECT_EQ(log.call_count(), 0u);
    auto batches = log.get_batches_json();
    ASSERT_EQ(batches.size(), 1u);
    EXPECT_EQ(batches[0]["size"], 2);
    EXPECT_EQ(batches[0]["succeeded"], 1);
    EXPECT_EQ(batches[0]["failed"], 1);
    EXPECT_EQ(batches[0]["timed_out"], true);
}
