#include <gtest/gtest.h>
#include "../../src/common/errors.h"

using namespace Tributary;

TEST(ErrorsTest, AsynchronousCopyKeepsCauseAndMarksMessage) {
    grpc::Status status(grpc::StatusCode::INVALID_ARGUMENT, "bad offset");
    StreamFailedException failure(ErrorCode::kStreamFailed, "s/streams/0", "ReadRows failed", status);
    EXPECT_FALSE(failure.asynchronous());

    StreamFailedException rethrown = failure.AsAsynchronous();
    EXPECT_TRUE(rethrown.asynchronous());
    EXPECT_EQ(rethrown.code(), ErrorCode::kStreamFailed);
    EXPECT_EQ(rethrown.stream(), "s/streams/0");
    EXPECT_EQ(rethrown.status().error_message(), "bad offset");
    EXPECT_STREQ(rethrown.what(), "ReadRows failed (asynchronous task failed)");

    // Marking twice does not stack the suffix
    EXPECT_STREQ(rethrown.AsAsynchronous().what(), rethrown.what());
}

TEST(ErrorsTest, SessionExpiredCarriesGuidanceAndCause) {
    grpc::Status status(grpc::StatusCode::FAILED_PRECONDITION, "session expired at 10:00");
    SessionExpiredException expired("s/streams/1", status);
    std::string message = expired.what();

    EXPECT_EQ(expired.code(), ErrorCode::kSessionExpired);
    EXPECT_NE(message.find("6 hours"), std::string::npos);
    EXPECT_NE(message.find("newly created read session"), std::string::npos);
    EXPECT_NE(message.find("Cause: session expired at 10:00"), std::string::npos);
}

TEST(ErrorsTest, RpcExceptionFormatsStatus) {
    RpcException error("GetTable t", grpc::Status(grpc::StatusCode::NOT_FOUND, "gone"));
    EXPECT_EQ(error.code(), ErrorCode::kRpcFailed);
    EXPECT_STREQ(error.what(), "GetTable t: (5) gone");
}

TEST(ErrorsTest, CodeNames) {
    EXPECT_STREQ(ErrorCodeName(ErrorCode::kUnsupported), "UNSUPPORTED");
    EXPECT_STREQ(ErrorCodeName(ErrorCode::kRetriesExhausted), "RETRIES_EXHAUSTED");
    UnsupportedException unsupported("views");
    EXPECT_EQ(unsupported.code(), ErrorCode::kUnsupported);
}

TEST(ErrorsTest, AsynchronousCopyKeepsSessionExpiredType) {
    SessionExpiredException expired("s/streams/2", grpc::Status(grpc::StatusCode::FAILED_PRECONDITION, "expired"));
    const StreamFailedException& as_base = expired;
    std::exception_ptr copy = as_base.AsynchronousCopy();

    try {
        std::rethrow_exception(copy);
    } catch (const SessionExpiredException& e) {
        EXPECT_TRUE(e.asynchronous());
        EXPECT_EQ(e.stream(), "s/streams/2");
        EXPECT_NE(std::string(e.what()).find("(asynchronous task failed)"), std::string::npos);
    }
    EXPECT_FALSE(expired.asynchronous());

    StreamFailedException plain(ErrorCode::kStreamFailed, "s/streams/3", "broken", grpc::Status::OK);
    EXPECT_THROW(std::rethrow_exception(plain.AsynchronousCopy()), StreamFailedException);
}
