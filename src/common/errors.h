#pragma once

#include <exception>
#include <stdexcept>
#include <string>
#include <grpcpp/grpcpp.h>

namespace Tributary {

enum class ErrorCode {
	kUnsupported,
	kSessionExpired,
	kStreamFailed,
	kRetriesExhausted,
	kInvalidConfig,
	kRpcFailed,
};

const char* ErrorCodeName(ErrorCode code);

/**
 * Base of every fault raised by the library itself. Usage faults (bad
 * arguments, Next() without a pending batch) use the standard exceptions.
 */
class TributaryException : public std::runtime_error {
	public:
		TributaryException(ErrorCode code, const std::string& message,
				grpc::Status status = grpc::Status::OK)
			: std::runtime_error(message), code_(code), status_(std::move(status)) {}

		ErrorCode code() const { return code_; }
		const grpc::Status& status() const { return status_; }

	private:
		ErrorCode code_;
		grpc::Status status_;
};

// Raised synchronously while planning a session (views disabled, unknown table type)
class UnsupportedException : public TributaryException {
	public:
		explicit UnsupportedException(const std::string& message)
			: TributaryException(ErrorCode::kUnsupported, message) {}
};

// Raised when a unary RPC to the service fails
class RpcException : public TributaryException {
	public:
		RpcException(const std::string& what, const grpc::Status& status)
			: TributaryException(ErrorCode::kRpcFailed,
					what + ": (" + std::to_string(status.error_code()) + ") " + status.error_message(),
					status) {}
};

/**
 * Terminal failure of one stream, surfaced by the combiner. When rethrown
 * from the consumer side, asynchronous() is true and the message carries a
 * marker so it can be told apart from a fault thrown directly to the caller.
 */
class StreamFailedException : public TributaryException {
	public:
		StreamFailedException(ErrorCode code, const std::string& stream,
				const std::string& message, const grpc::Status& status)
			: TributaryException(code, message, status), stream_(stream), asynchronous_(false) {}

		const std::string& stream() const { return stream_; }
		bool asynchronous() const { return asynchronous_; }

		virtual ~StreamFailedException() = default;

		// Copy of this failure marked as observed across the combiner boundary
		StreamFailedException AsAsynchronous() const;

		// Same as AsAsynchronous() but keeps the most-derived type
		virtual std::exception_ptr AsynchronousCopy() const;

	protected:
		// Asynchronous copy of cause
		explicit StreamFailedException(const StreamFailedException& cause, bool)
			: TributaryException(cause.code(), cause.AsynchronousMessage(), cause.status()),
			stream_(cause.stream_), asynchronous_(true) {}

		std::string AsynchronousMessage() const;

	private:
		std::string stream_;
		bool asynchronous_;
};

// A session outlived its validity window; never retried
class SessionExpiredException : public StreamFailedException {
	public:
		SessionExpiredException(const std::string& stream, const grpc::Status& status);

		std::exception_ptr AsynchronousCopy() const override;

	private:
		SessionExpiredException(const SessionExpiredException& cause, bool asynchronous)
			: StreamFailedException(cause, asynchronous) {}
};

} // namespace Tributary
