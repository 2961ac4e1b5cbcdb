#include <gtest/gtest.h>
#include <ssh/retry.hpp>

TEST(Retry, SuccessOnFirstAttempt) {
    int calls = 0;
    auto result = retry(3, ErrorKind::TransientIO, [&](int) {
        calls++;
        return Result<int>::Ok(42);
    });
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value, 42);
    EXPECT_EQ(calls, 1);
}

TEST(Retry, RetriesMatchingKindUntilSuccess) {
    std::vector<int> attempts;
    auto result = retry(3, ErrorKind::TransientIO, [&](int attempt) {
        attempts.push_back(attempt);
        if (attempt < 3) return Result<std::string>::Err(ErrorKind::TransientIO, "eof");
        return Result<std::string>::Ok("done");
    });
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value, "done");
    EXPECT_EQ(attempts, (std::vector<int>{1, 2, 3}));
}

TEST(Retry, StopsAfterMaxAttempts) {
    int calls = 0;
    auto result = retry(3, ErrorKind::TransientIO, [&](int attempt) {
        calls++;
        return Result<int>::Err(ErrorKind::TransientIO, "eof on attempt " + std::to_string(attempt));
    });
    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(calls, 3);
    EXPECT_EQ(result.kind, ErrorKind::TransientIO);
    EXPECT_EQ(result.error, "eof on attempt 3");  // last error, unchanged
}

TEST(Retry, OtherKindsPropagateImmediately) {
    int calls = 0;
    auto result = retry(3, ErrorKind::TransientIO, [&](int) {
        calls++;
        return Result<void>::Err(ErrorKind::Connection, "auth failed", "publickey");
    });
    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(calls, 1);
    EXPECT_EQ(result.kind, ErrorKind::Connection);
    EXPECT_EQ(result.cause, "publickey");
}

TEST(Retry, SingleAttemptNeverRetries) {
    int calls = 0;
    auto result = retry(1, ErrorKind::TransientIO, [&](int) {
        calls++;
        return Result<int>::Err(ErrorKind::TransientIO, "eof");
    });
    EXPECT_TRUE(result.is_err());
    EXPECT_EQ(calls, 1);
}

TEST(Retry, RetryableKindIsAParameter) {
    int calls = 0;
    auto result = retry(2, ErrorKind::Transfer, [&](int) {
        calls++;
        return Result<int>::Err(ErrorKind::Transfer, "busy");
    });
    EXPECT_TRUE(result.is_err());
    EXPECT_EQ(calls, 2);
}
