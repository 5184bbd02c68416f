#include "chunkflow/transfer/retry.hpp"
#include "chunkflow/transfer/progress.hpp"

#include <gtest/gtest.h>

#include <vector>

using chunkflow::Err;
using chunkflow::Ok;
using chunkflow::Result;
using chunkflow::transfer::AttemptContext;
using chunkflow::transfer::AttemptResult;
using chunkflow::transfer::AttemptStatus;
using chunkflow::transfer::ProgressTracker;
using chunkflow::transfer::RetryingTransport;
using chunkflow::transfer::RetryPolicy;
using chunkflow::transfer::RetryState;
using chunkflow::transfer::TransportResponse;
using chunkflow::transfer::classify_response;

namespace {

struct RecordingSleeper {
    std::vector<double> delays;

    RetryPolicy policy(int max_retries, double base = 1.0) {
        RetryPolicy policy;
        policy.max_retries = max_retries;
        policy.backoff_base = std::chrono::duration<double>(base);
        policy.sleeper = [this](std::chrono::duration<double> delay) { delays.push_back(delay.count()); };
        return policy;
    }
};

Result<TransportResponse> reply(int status, std::string body = {}) {
    TransportResponse response;
    response.status_code = status;
    response.body = std::move(body);
    return Ok(response);
}

} // namespace

TEST(ClassifyResponseTest, MapsStatusesToAttemptOutcomes) {
    EXPECT_EQ(classify_response(reply(200)).status, AttemptStatus::Success);
    EXPECT_EQ(classify_response(reply(201)).status, AttemptStatus::Success);
    EXPECT_EQ(classify_response(reply(503)).status, AttemptStatus::Retryable);
    EXPECT_EQ(classify_response(reply(500)).status, AttemptStatus::Retryable);
    EXPECT_EQ(classify_response(reply(401)).status, AttemptStatus::HardFailure);
    EXPECT_EQ(classify_response(reply(404)).status, AttemptStatus::HardFailure);
    EXPECT_EQ(classify_response(reply(204)).status, AttemptStatus::HardFailure);
}

TEST(ClassifyResponseTest, ChecksumComplaintIsItsOwnOutcome) {
    auto outcome = classify_response(reply(400, "Checksum policy violation: X-Checksum-Md5 not accepted"));
    EXPECT_EQ(outcome.status, AttemptStatus::ChecksumRejected);
    EXPECT_EQ(outcome.status_code, 400);
}

TEST(ClassifyResponseTest, ConnectionErrorIsRetryable) {
    auto outcome = classify_response(Err<TransportResponse>(std::string("connection refused")));
    EXPECT_EQ(outcome.status, AttemptStatus::Retryable);
    EXPECT_EQ(outcome.error, "connection refused");
}

TEST(RetryingTransportTest, TwoServiceUnavailableThenCreated) {
    RecordingSleeper sleeper;
    RetryingTransport retrying(sleeper.policy(3));

    const std::vector<int> statuses{503, 503, 201};
    int calls = 0;
    auto result = retrying.attempt("a.bin", [&](AttemptContext& ctx) {
        EXPECT_EQ(ctx.attempt, calls);
        return classify_response(reply(statuses[calls++]));
    });

    EXPECT_EQ(result.state, RetryState::Succeeded);
    EXPECT_EQ(result.attempts, 3);
    EXPECT_EQ(result.last_status, 201);
    ASSERT_EQ(sleeper.delays.size(), 2u);
    EXPECT_DOUBLE_EQ(sleeper.delays[0], 1.0);
    EXPECT_DOUBLE_EQ(sleeper.delays[1], 2.0);
}

TEST(RetryingTransportTest, AlwaysServerErrorExhausts) {
    RecordingSleeper sleeper;
    RetryingTransport retrying(sleeper.policy(3, 0.5));

    int calls = 0;
    auto result = retrying.attempt("a.bin", [&](AttemptContext&) {
        ++calls;
        return classify_response(reply(500, "Internal Server Error"));
    });

    EXPECT_EQ(result.state, RetryState::Exhausted);
    EXPECT_FALSE(result.succeeded());
    EXPECT_EQ(result.attempts, 3);
    EXPECT_EQ(calls, 3);
    EXPECT_EQ(result.last_status, 500);
    // No wait after the final attempt.
    ASSERT_EQ(sleeper.delays.size(), 2u);
    EXPECT_DOUBLE_EQ(sleeper.delays[0], 0.5);
    EXPECT_DOUBLE_EQ(sleeper.delays[1], 1.0);
}

TEST(RetryingTransportTest, HardFailureStopsImmediately) {
    RecordingSleeper sleeper;
    RetryingTransport retrying(sleeper.policy(5));

    int calls = 0;
    auto result = retrying.attempt("a.bin", [&](AttemptContext&) {
        ++calls;
        return classify_response(reply(403, "Forbidden"));
    });

    EXPECT_EQ(result.state, RetryState::Rejected);
    EXPECT_EQ(result.attempts, 1);
    EXPECT_EQ(calls, 1);
    EXPECT_TRUE(sleeper.delays.empty());
}

TEST(RetryingTransportTest, ChecksumRejectionSwitchesFallbackForTheRestOfTheItem) {
    RecordingSleeper sleeper;
    RetryingTransport retrying(sleeper.policy(4));

    std::vector<bool> fallback_seen;
    const std::vector<Result<TransportResponse>> replies{
        reply(400, "checksum mismatch"), reply(503), reply(201)};
    auto result = retrying.attempt("a.bin", [&](AttemptContext& ctx) {
        fallback_seen.push_back(ctx.checksum_deploy_fallback);
        return classify_response(replies[fallback_seen.size() - 1]);
    });

    EXPECT_TRUE(result.succeeded());
    EXPECT_EQ(result.attempts, 3);
    EXPECT_EQ(fallback_seen, (std::vector<bool>{false, true, true}));
}

TEST(RetryingTransportTest, ProgressIsResetBeforeEachRetry) {
    RecordingSleeper sleeper;
    RetryingTransport retrying(sleeper.policy(3));
    ProgressTracker progress("a.bin", 100);

    std::vector<std::uint64_t> at_start;
    auto result = retrying.attempt("a.bin", [&](AttemptContext& ctx) {
        at_start.push_back(progress.state().transferred_bytes);
        progress.advance(60);
        return ctx.attempt < 2 ? AttemptResult::retryable("reset") : AttemptResult::success(201);
    }, &progress);

    EXPECT_TRUE(result.succeeded());
    EXPECT_EQ(at_start, (std::vector<std::uint64_t>{0, 0, 0}));
    EXPECT_EQ(progress.state().transferred_bytes, 60u);
}

TEST(RetryingTransportTest, NonPositiveRetryCountStillAttemptsOnce) {
    RecordingSleeper sleeper;
    RetryingTransport retrying(sleeper.policy(0));

    int calls = 0;
    auto result = retrying.attempt("a.bin", [&](AttemptContext&) {
        ++calls;
        return AttemptResult::retryable("down");
    });

    EXPECT_EQ(calls, 1);
    EXPECT_EQ(result.state, RetryState::Exhausted);
    EXPECT_TRUE(sleeper.delays.empty());
}

TEST(RetryingTransportTest, BackoffDoubles) {
    RetryingTransport retrying(RetryPolicy{5, std::chrono::duration<double>(1.5), {}});
    EXPECT_DOUBLE_EQ(retrying.backoff_for(0).count(), 1.5);
    EXPECT_DOUBLE_EQ(retrying.backoff_for(1).count(), 3.0);
    EXPECT_DOUBLE_EQ(retrying.backoff_for(3).count(), 12.0);
}
