#include "errors.h"

namespace Tributary {

namespace {
	constexpr char kAsynchronousMarker[] = " (asynchronous task failed)";

	constexpr char kSessionExpiredMessage[] =
		"Read session expired after 6 hours. Data read through a session cannot be "
		"consumed beyond this time-limit. Your options: "
		"(1) try finishing within 6 hours, "
		"(2) cache the data after reading it once, "
		"(3) read again through a newly created read session.";
}

const char* ErrorCodeName(ErrorCode code) {
	switch (code) {
		case ErrorCode::kUnsupported: return "UNSUPPORTED";
		case ErrorCode::kSessionExpired: return "SESSION_EXPIRED";
		case ErrorCode::kStreamFailed: return "STREAM_FAILED";
		case ErrorCode::kRetriesExhausted: return "RETRIES_EXHAUSTED";
		case ErrorCode::kInvalidConfig: return "INVALID_CONFIG";
		case ErrorCode::kRpcFailed: return "RPC_FAILED";
	}
	return "UNKNOWN";
}

std::string StreamFailedException::AsynchronousMessage() const {
	if (asynchronous_) {
		return what();
	}
	return std::string(what()) + kAsynchronousMarker;
}

StreamFailedException StreamFailedException::AsAsynchronous() const {
	return StreamFailedException(*this, true);
}

std::exception_ptr StreamFailedException::AsynchronousCopy() const {
	return std::make_exception_ptr(AsAsynchronous());
}

SessionExpiredException::SessionExpiredException(const std::string& stream, const grpc::Status& status)
	: StreamFailedException(ErrorCode::kSessionExpired, stream,
			std::string(kSessionExpiredMessage) + " Cause: " + status.error_message(), status) {}

std::exception_ptr SessionExpiredException::AsynchronousCopy() const {
	return std::make_exception_ptr(SessionExpiredException(*this, true));
}

} // namespace Tributary
