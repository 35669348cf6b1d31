#include "retry_policy.h"

#include <array>

namespace Tributary {

namespace {
	// INTERNAL is only transient when the transport tore the stream down
	constexpr std::array<const char*, 5> kRetryableInternalMessages = {
		"HTTP/2 error code: INTERNAL_ERROR",
		"Connection closed with unknown cause",
		"Received unexpected EOS on DATA frame from server",
		"RST_STREAM",
		"Rst Stream",
	};

	constexpr char kReadSessionExpiredMessage[] = "session expired at";
}

bool IsRetryable(const grpc::Status& status) {
	switch (status.error_code()) {
		case grpc::StatusCode::UNAVAILABLE:
			return true;
		case grpc::StatusCode::INTERNAL:
			for (const char* message : kRetryableInternalMessages) {
				if (status.error_message().find(message) != std::string::npos) {
					return true;
				}
			}
			return false;
		default:
			return false;
	}
}

bool IsReadSessionExpired(const grpc::Status& status) {
	return status.error_code() == grpc::StatusCode::FAILED_PRECONDITION &&
		status.error_message().find(kReadSessionExpiredMessage) != std::string::npos;
}

FailureKind ClassifyFailure(const grpc::Status& status) {
	if (IsReadSessionExpired(status)) {
		return FailureKind::kSessionExpired;
	}
	if (IsRetryable(status)) {
		return FailureKind::kRetryable;
	}
	return FailureKind::kFatal;
}

const char* FailureKindName(FailureKind kind) {
	switch (kind) {
		case FailureKind::kRetryable: return "retryable";
		case FailureKind::kSessionExpired: return "session-expired";
		case FailureKind::kFatal: return "fatal";
	}
	return "unknown";
}

} // namespace Tributary
