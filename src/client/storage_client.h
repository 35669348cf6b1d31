#pragma once

#include <atomic>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <grpcpp/grpcpp.h>
#include <storage.grpc.pb.h>

namespace Tributary {

using tributary::storage::v1::CreateReadSessionRequest;
using tributary::storage::v1::ReadSession;
using tributary::storage::v1::ReadRowsRequest;
using tributary::storage::v1::ReadRowsResponse;

// Extra request headers attached to a call
using CallMetadata = std::vector<std::pair<std::string, std::string>>;

// Header carrying the side-channel authorization token of a read session
constexpr char kApiTokenHeader[] = "x-tributary-api-token";

/**
 * One server-streaming ReadRows call.
 *
 * Read() blocks until the next response arrives and returns false once the
 * stream ended (cleanly, with an error, or after Cancel()); Finish() then
 * reports why. Cancel() may be called from any thread at any time.
 */
class ReadRowsStream {
	public:
		virtual ~ReadRowsStream() = default;

		virtual bool Read(ReadRowsResponse* response) = 0;
		virtual grpc::Status Finish() = 0;
		virtual void Cancel() = 0;
};

/**
 * Read handle to the storage service. Shared by every combiner built on it
 * and never closed by them.
 */
class StorageReadClient {
	public:
		virtual ~StorageReadClient() = default;

		virtual grpc::Status CreateReadSession(const CreateReadSessionRequest& request,
				ReadSession* session) = 0;

		virtual std::unique_ptr<ReadRowsStream> ReadRows(const ReadRowsRequest& request,
				const CallMetadata& metadata) = 0;

		// token is left empty when the session does not need one
		virtual grpc::Status ExchangeIdentityToken(const std::string& read_session,
				std::string* token) = 0;
};

/**
 * Write handle to the storage service.
 */
class StorageWriteClient {
	public:
		virtual ~StorageWriteClient() = default;

		virtual grpc::Status CreateWriteStream(const std::string& table,
				tributary::storage::v1::WriteStream* stream) = 0;
		virtual grpc::Status AppendRows(const tributary::storage::v1::AppendRowsRequest& request,
				tributary::storage::v1::AppendRowsResponse* response) = 0;
		virtual grpc::Status FinalizeWriteStream(const std::string& stream, int64_t* row_count) = 0;
};

// ReadRows over a grpc::ClientReader; the context outlives the reader
class GrpcReadRowsStream : public ReadRowsStream {
	public:
		GrpcReadRowsStream(tributary::storage::v1::StorageRead::StubInterface* stub,
				const ReadRowsRequest& request, const CallMetadata& metadata);
		~GrpcReadRowsStream() override;

		bool Read(ReadRowsResponse* response) override;
		grpc::Status Finish() override;
		void Cancel() override;

	private:
		grpc::ClientContext context_;
		std::unique_ptr<grpc::ClientReaderInterface<ReadRowsResponse>> reader_;
		bool finished_ = false;
};

/**
 * gRPC implementation over a fixed pool of channels. Calls are spread over
 * the pool round-robin.
 */
class GrpcStorageReadClient : public StorageReadClient {
	public:
		explicit GrpcStorageReadClient(const std::vector<std::shared_ptr<grpc::Channel>>& channels);

		grpc::Status CreateReadSession(const CreateReadSessionRequest& request,
				ReadSession* session) override;
		std::unique_ptr<ReadRowsStream> ReadRows(const ReadRowsRequest& request,
				const CallMetadata& metadata) override;
		grpc::Status ExchangeIdentityToken(const std::string& read_session,
				std::string* token) override;

		size_t pool_size() const { return stubs_.size(); }

	private:
		tributary::storage::v1::StorageRead::Stub* NextStub();

		std::vector<std::unique_ptr<tributary::storage::v1::StorageRead::Stub>> stubs_;
		std::atomic<size_t> next_stub_{0};
};

class GrpcStorageWriteClient : public StorageWriteClient {
	public:
		explicit GrpcStorageWriteClient(const std::vector<std::shared_ptr<grpc::Channel>>& channels);

		grpc::Status CreateWriteStream(const std::string& table,
				tributary::storage::v1::WriteStream* stream) override;
		grpc::Status AppendRows(const tributary::storage::v1::AppendRowsRequest& request,
				tributary::storage::v1::AppendRowsResponse* response) override;
		grpc::Status FinalizeWriteStream(const std::string& stream, int64_t* row_count) override;

	private:
		tributary::storage::v1::StorageWrite::Stub* NextStub();

		std::vector<std::unique_ptr<tributary::storage::v1::StorageWrite::Stub>> stubs_;
		std::atomic<size_t> next_stub_{0};
};

} // namespace Tributary
