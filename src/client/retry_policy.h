#pragma once

#include <string>
#include <grpcpp/grpcpp.h>

namespace Tributary {

/**
 * Classification of a failed ReadRows call.
 */
enum class FailureKind {
	kRetryable,       // reconnect from the last received offset
	kSessionExpired,  // the session's validity window elapsed
	kFatal,
};

// Transient transport faults worth reconnecting for
bool IsRetryable(const grpc::Status& status);

bool IsReadSessionExpired(const grpc::Status& status);

FailureKind ClassifyFailure(const grpc::Status& status);

const char* FailureKindName(FailureKind kind);

} // namespace Tributary
