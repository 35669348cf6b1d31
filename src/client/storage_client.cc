#include "storage_client.h"

#include <stdexcept>
#include <glog/logging.h>

namespace Tributary {

using tributary::storage::v1::AppendRowsRequest;
using tributary::storage::v1::AppendRowsResponse;
using tributary::storage::v1::CreateWriteStreamRequest;
using tributary::storage::v1::FinalizeWriteStreamRequest;
using tributary::storage::v1::FinalizeWriteStreamResponse;
using tributary::storage::v1::IdentityTokenRequest;
using tributary::storage::v1::IdentityTokenResponse;
using tributary::storage::v1::StorageRead;
using tributary::storage::v1::StorageWrite;
using tributary::storage::v1::WriteStream;

GrpcReadRowsStream::GrpcReadRowsStream(StorageRead::StubInterface* stub,
		const ReadRowsRequest& request, const CallMetadata& metadata) {
	for (const auto& [key, value] : metadata) {
		context_.AddMetadata(key, value);
	}
	reader_ = stub->ReadRows(&context_, request);
}

GrpcReadRowsStream::~GrpcReadRowsStream() {
	if (!finished_ && reader_) {
		// Drain a cancelled call so Finish() can release it
		context_.TryCancel();
		ReadRowsResponse discard;
		while (reader_->Read(&discard)) {
		}
		grpc::Status status = reader_->Finish();
		VLOG(5) << "Abandoned ReadRows call finished with (" << status.error_code() << ")";
	}
}

bool GrpcReadRowsStream::Read(ReadRowsResponse* response) {
	return reader_->Read(response);
}

grpc::Status GrpcReadRowsStream::Finish() {
	finished_ = true;
	return reader_->Finish();
}

void GrpcReadRowsStream::Cancel() {
	context_.TryCancel();
}

GrpcStorageReadClient::GrpcStorageReadClient(const std::vector<std::shared_ptr<grpc::Channel>>& channels) {
	if (channels.empty()) {
		throw std::invalid_argument("GrpcStorageReadClient needs at least one channel");
	}
	stubs_.reserve(channels.size());
	for (const auto& channel : channels) {
		stubs_.push_back(StorageRead::NewStub(channel));
	}
}

StorageRead::Stub* GrpcStorageReadClient::NextStub() {
	size_t idx = next_stub_.fetch_add(1, std::memory_order_relaxed);
	return stubs_[idx % stubs_.size()].get();
}

grpc::Status GrpcStorageReadClient::CreateReadSession(const CreateReadSessionRequest& request,
		ReadSession* session) {
	grpc::ClientContext context;
	return NextStub()->CreateReadSession(&context, request, session);
}

std::unique_ptr<ReadRowsStream> GrpcStorageReadClient::ReadRows(const ReadRowsRequest& request,
		const CallMetadata& metadata) {
	return std::make_unique<GrpcReadRowsStream>(NextStub(), request, metadata);
}

grpc::Status GrpcStorageReadClient::ExchangeIdentityToken(const std::string& read_session,
		std::string* token) {
	grpc::ClientContext context;
	IdentityTokenRequest request;
	request.set_read_session(read_session);
	IdentityTokenResponse response;
	grpc::Status status = NextStub()->ExchangeIdentityToken(&context, request, &response);
	if (status.ok()) {
		*token = response.token();
	}
	return status;
}

GrpcStorageWriteClient::GrpcStorageWriteClient(const std::vector<std::shared_ptr<grpc::Channel>>& channels) {
	if (channels.empty()) {
		throw std::invalid_argument("GrpcStorageWriteClient needs at least one channel");
	}
	stubs_.reserve(channels.size());
	for (const auto& channel : channels) {
		stubs_.push_back(StorageWrite::NewStub(channel));
	}
}

StorageWrite::Stub* GrpcStorageWriteClient::NextStub() {
	size_t idx = next_stub_.fetch_add(1, std::memory_order_relaxed);
	return stubs_[idx % stubs_.size()].get();
}

grpc::Status GrpcStorageWriteClient::CreateWriteStream(const std::string& table, WriteStream* stream) {
	grpc::ClientContext context;
	CreateWriteStreamRequest request;
	request.set_parent(table);
	request.mutable_write_stream()->set_table(table);
	return NextStub()->CreateWriteStream(&context, request, stream);
}

grpc::Status GrpcStorageWriteClient::AppendRows(const AppendRowsRequest& request,
		AppendRowsResponse* response) {
	grpc::ClientContext context;
	return NextStub()->AppendRows(&context, request, response);
}

grpc::Status GrpcStorageWriteClient::FinalizeWriteStream(const std::string& stream, int64_t* row_count) {
	grpc::ClientContext context;
	FinalizeWriteStreamRequest request;
	request.set_name(stream);
	FinalizeWriteStreamResponse response;
	grpc::Status status = NextStub()->FinalizeWriteStream(&context, request, &response);
	if (status.ok()) {
		*row_count = response.row_count();
	}
	return status;
}

} // namespace Tributary
