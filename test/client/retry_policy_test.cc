#include <gtest/gtest.h>
#include "../../src/client/retry_policy.h"

using namespace Tributary;

namespace {

grpc::Status Internal(const std::string& message) {
    return grpc::Status(grpc::StatusCode::INTERNAL, message);
}

} // namespace

TEST(RetryPolicyTest, UnavailableIsRetryable) {
    EXPECT_TRUE(IsRetryable(grpc::Status(grpc::StatusCode::UNAVAILABLE, "")));
    EXPECT_EQ(ClassifyFailure(grpc::Status(grpc::StatusCode::UNAVAILABLE, "socket closed")),
              FailureKind::kRetryable);
}

TEST(RetryPolicyTest, KnownInternalTransportFaultsAreRetryable) {
    EXPECT_TRUE(IsRetryable(Internal("Received Rst Stream")));
    EXPECT_TRUE(IsRetryable(Internal("stream terminated by RST_STREAM with error code: INTERNAL_ERROR")));
    EXPECT_TRUE(IsRetryable(Internal("HTTP/2 error code: INTERNAL_ERROR")));
    EXPECT_TRUE(IsRetryable(Internal("Connection closed with unknown cause")));
    EXPECT_TRUE(IsRetryable(Internal("Received unexpected EOS on DATA frame from server")));
}

TEST(RetryPolicyTest, OtherInternalErrorsAreFatal) {
    EXPECT_FALSE(IsRetryable(Internal("assertion failed in the query engine")));
    EXPECT_EQ(ClassifyFailure(Internal("assertion failed")), FailureKind::kFatal);
}

TEST(RetryPolicyTest, SessionExpiry) {
    grpc::Status expired(grpc::StatusCode::FAILED_PRECONDITION,
                         "request failed: session expired at 2023-06-01T00:00:00Z");
    EXPECT_TRUE(IsReadSessionExpired(expired));
    EXPECT_FALSE(IsRetryable(expired));
    EXPECT_EQ(ClassifyFailure(expired), FailureKind::kSessionExpired);

    // Same code, different cause
    EXPECT_FALSE(IsReadSessionExpired(grpc::Status(grpc::StatusCode::FAILED_PRECONDITION, "table deleted")));
    // Right text, wrong code
    EXPECT_FALSE(IsReadSessionExpired(grpc::Status(grpc::StatusCode::INTERNAL, "session expired at noon")));
}

TEST(RetryPolicyTest, ClientErrorsAreFatal) {
    for (auto code : {grpc::StatusCode::INVALID_ARGUMENT, grpc::StatusCode::PERMISSION_DENIED,
                      grpc::StatusCode::NOT_FOUND, grpc::StatusCode::UNAUTHENTICATED,
                      grpc::StatusCode::DEADLINE_EXCEEDED}) {
        EXPECT_EQ(ClassifyFailure(grpc::Status(code, "")), FailureKind::kFatal) << static_cast<int>(code);
    }
}

TEST(RetryPolicyTest, FailureKindNames) {
    EXPECT_STREQ(FailureKindName(FailureKind::kRetryable), "retryable");
    EXPECT_STREQ(FailureKindName(FailureKind::kSessionExpired), "session-expired");
    EXPECT_STREQ(FailureKindName(FailureKind::kFatal), "fatal");
}
