#include "usync/transfer/retry.hpp"

#include <gtest/gtest.h>

#include <vector>

using usync::Err;
using usync::ErrorCode;
using usync::Ok;
using usync::Result;
using usync::config::RetrySettings;
using usync::transfer::RetryPolicy;
using std::chrono::milliseconds;

namespace {

RetrySettings settings(std::uint32_t attempts, double jitter = 0.0) {
    RetrySettings s;
    s.max_attempts = attempts;
    s.initial_delay = milliseconds(100);
    s.max_delay = milliseconds(1000);
    s.multiplier = 2.0;
    s.jitter = jitter;
    return s;
}

} // namespace

TEST(RetryPolicyTest, BackoffDoublesUpToTheCap) {
    RetryPolicy policy(settings(10), [](milliseconds) {});
    EXPECT_EQ(policy.delay_for(1), milliseconds(100));
    EXPECT_EQ(policy.delay_for(2), milliseconds(200));
    EXPECT_EQ(policy.delay_for(3), milliseconds(400));
    EXPECT_EQ(policy.delay_for(4), milliseconds(800));
    EXPECT_EQ(policy.delay_for(5), milliseconds(1000));
    EXPECT_EQ(policy.delay_for(12), milliseconds(1000));
}

TEST(RetryPolicyTest, JitterStaysWithinBounds) {
    RetryPolicy policy(settings(10, 0.25), [](milliseconds) {}, RetryPolicy::is_retryable, 42);
    bool varied = false;
    for (int i = 0; i < 200; ++i) {
        const auto delay = policy.delay_for(2);
        EXPECT_GE(delay, milliseconds(150));
        EXPECT_LE(delay, milliseconds(250));
        varied = varied || delay != milliseconds(200);
    }
    EXPECT_TRUE(varied);
}

TEST(RetryPolicyTest, RetriesTransientErrorsUntilSuccess) {
    std::vector<milliseconds> slept;
    RetryPolicy policy(settings(5), [&](milliseconds delay) { slept.push_back(delay); });

    int calls = 0;
    auto result = policy.run<int>("posting", [&]() -> Result<int> {
        if (++calls < 3) {
            return Err<int>(ErrorCode::TransientTransport, "busy");
        }
        return Ok(7);
    });

    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value(), 7);
    EXPECT_EQ(calls, 3);
    EXPECT_EQ(slept, (std::vector<milliseconds>{milliseconds(100), milliseconds(200)}));
}

TEST(RetryPolicyTest, GivesUpAfterMaxAttempts) {
    std::vector<milliseconds> slept;
    RetryPolicy policy(settings(3), [&](milliseconds delay) { slept.push_back(delay); });

    int calls = 0;
    auto result = policy.run<int>("posting", [&]() -> Result<int> {
        ++calls;
        return Err<int>(ErrorCode::StorageBusy, "locked");
    });

    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code, ErrorCode::StorageBusy);
    EXPECT_EQ(calls, 3);
    EXPECT_EQ(slept.size(), 2u);
}

TEST(RetryPolicyTest, TerminalErrorsAreNotRetried) {
    int sleeps = 0;
    RetryPolicy policy(settings(5), [&](milliseconds) { ++sleeps; });

    int calls = 0;
    auto result = policy.run<int>("fetching", [&]() -> Result<int> {
        ++calls;
        return Err<int>(ErrorCode::TerminalTransport, "430 no such article");
    });

    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code, ErrorCode::TerminalTransport);
    EXPECT_EQ(calls, 1);
    EXPECT_EQ(sleeps, 0);
}

TEST(RetryPolicyTest, CustomPredicateDecides) {
    RetryPolicy policy(settings(4), [](milliseconds) {},
                       [](const usync::Error& error) { return error.code == ErrorCode::Integrity; });

    int calls = 0;
    auto result = policy.run<int>("verifying", [&]() -> Result<int> {
        ++calls;
        return Err<int>(ErrorCode::Integrity, "mismatch");
    });
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(calls, 4);

    EXPECT_TRUE(RetryPolicy::is_retryable(usync::Error{ErrorCode::TransientTransport, ""}));
    EXPECT_TRUE(RetryPolicy::is_retryable(usync::Error{ErrorCode::StorageBusy, ""}));
    EXPECT_FALSE(RetryPolicy::is_retryable(usync::Error{ErrorCode::Validation, ""}));
}
