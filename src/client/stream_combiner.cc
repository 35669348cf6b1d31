#include "stream_combiner.h"

#include <algorithm>
#include <stdexcept>
#include <glog/logging.h>

#include "identity_token_cache.h"
#include "retry_policy.h"

namespace Tributary {

namespace {
	int CheckedBufferEntries(int buffer_entries_per_stream) {
		if (buffer_entries_per_stream <= 0) {
			throw std::invalid_argument("bufferEntriesPerStream must be positive. Received: " +
					std::to_string(buffer_entries_per_stream));
		}
		return buffer_entries_per_stream;
	}

	int CheckedRetries(int max_retries) {
		if (max_retries < 0) {
			throw std::invalid_argument("maxRetries must not be negative. Received: " +
					std::to_string(max_retries));
		}
		return max_retries;
	}
}

const char* WorkerStateName(WorkerState state) {
	switch (state) {
		case WorkerState::kConnecting: return "Connecting";
		case WorkerState::kStreaming: return "Streaming";
		case WorkerState::kRetrying: return "Retrying";
		case WorkerState::kCompleted: return "Completed";
		case WorkerState::kFailed: return "Failed";
		case WorkerState::kCancelled: return "Cancelled";
	}
	return "Unknown";
}

// ---------------------------------------------------------------------------
// StreamWorker
// ---------------------------------------------------------------------------

StreamWorker::StreamWorker(StreamCombiner* combiner, const ReadRowsRequest& request,
		int buffer_entries, int max_retries)
	: combiner_(combiner),
	stream_name_(request.read_stream()),
	buffer_entries_(buffer_entries),
	max_retries_(max_retries),
	request_(request),
	outstanding_(buffer_entries),
	network_credit_(buffer_entries) {}

StreamWorker::~StreamWorker() {
	Join();
}

void StreamWorker::Start() {
	thread_ = std::thread(&StreamWorker::Run, this);
}

void StreamWorker::Join() {
	if (thread_.joinable()) {
		thread_.join();
	}
}

WorkerState StreamWorker::state() const {
	absl::MutexLock lock(&mutex_);
	return state_;
}

int StreamWorker::retries() const {
	absl::MutexLock lock(&mutex_);
	return retries_;
}

int64_t StreamWorker::offset() const {
	absl::MutexLock lock(&mutex_);
	return request_.offset();
}

bool StreamWorker::IsCancelled() const {
	absl::MutexLock lock(&mutex_);
	return cancelled_;
}

void StreamWorker::SetState(WorkerState state) {
	absl::MutexLock lock(&mutex_);
	if (cancelled_ && state != WorkerState::kFailed) {
		state = WorkerState::kCancelled;
	}
	VLOG(3) << "Stream " << stream_name_ << ": " << WorkerStateName(state_) << " -> " << WorkerStateName(state);
	state_ = state;
}

void StreamWorker::Request() {
	absl::MutexLock lock(&mutex_);
	if (cancelled_) {
		return;
	}
	int count = --outstanding_;
	// Wait for the buffer to run down before asking for more so a slow
	// consumer throttles the network instead of piling up responses.
	if (count > buffer_entries_ / 4) {
		return;
	}
	int add_back = buffer_entries_ - count;
	outstanding_ += add_back;
	network_credit_ += add_back;
	VLOG(4) << "Stream " << stream_name_ << ": granted " << add_back << " credit (network credit "
		<< network_credit_ << ")";
	credit_cv_.Signal();
}

void StreamWorker::Cancel() {
	absl::MutexLock lock(&mutex_);
	if (cancelled_) {
		return;
	}
	cancelled_ = true;
	credit_cv_.SignalAll();
	if (stream_) {
		try {
			stream_->Cancel();
		} catch (const std::exception& e) {
			// The call may already be finished or torn down
			VLOG(3) << "Stream " << stream_name_ << ": ignoring cancel failure: " << e.what();
		}
	}
}

void StreamWorker::AttachStream(std::unique_ptr<ReadRowsStream> stream) {
	absl::MutexLock lock(&mutex_);
	stream_ = std::move(stream);
	if (cancelled_) {
		stream_->Cancel();
	}
}

bool StreamWorker::WaitForCredit() {
	absl::MutexLock lock(&mutex_);
	while (!cancelled_ && network_credit_ <= 0) {
		credit_cv_.Wait(&mutex_);
	}
	return !cancelled_;
}

bool StreamWorker::Connect() {
	ReadRowsRequest request;
	{
		absl::MutexLock lock(&mutex_);
		if (cancelled_) {
			return false;
		}
		request = request_;
	}
	SetState(WorkerState::kConnecting);
	VLOG(2) << "Stream " << stream_name_ << ": connecting at offset " << request.offset();
	CallMetadata metadata = combiner_->ResolveCallMetadata(stream_name_);
	return combiner_->OpenStream(this, request, metadata);
}

void StreamWorker::Fail(const grpc::Status& status) {
	SetState(WorkerState::kFailed);
	FailureKind kind = ClassifyFailure(status);
	if (kind == FailureKind::kSessionExpired) {
		LOG(ERROR) << "Stream " << stream_name_ << ": read session expired: " << status.error_message();
		combiner_->StopWithError(SessionExpiredException(stream_name_, status));
		return;
	}

	int retries;
	{
		absl::MutexLock lock(&mutex_);
		retries = retries_;
	}
	ErrorCode code = kind == FailureKind::kRetryable ? ErrorCode::kRetriesExhausted : ErrorCode::kStreamFailed;
	std::string message = "ReadRows on " + stream_name_ + " failed after " + std::to_string(retries) +
		" retries: (" + std::to_string(status.error_code()) + ") " + status.error_message();
	LOG(ERROR) << message << " [" << FailureKindName(kind) << "]";
	combiner_->StopWithError(StreamFailedException(code, stream_name_, message, status));
}

void StreamWorker::Run() {
	while (true) {
		if (!Connect()) {
			SetState(WorkerState::kCancelled);
			return;
		}

		ReadRowsStream* stream;
		{
			absl::MutexLock lock(&mutex_);
			stream = stream_.get();
		}
		SetState(WorkerState::kStreaming);

		bool stopped = false;
		ReadRowsResponse response;
		while (true) {
			if (!WaitForCredit()) {
				stopped = true;
				break;
			}
			if (!stream->Read(&response)) {
				break;
			}
			{
				absl::MutexLock lock(&mutex_);
				--network_credit_;
				request_.set_offset(request_.offset() + response.row_count());
			}
			if (!combiner_->EnqueueBatch(this, std::move(response))) {
				stopped = true;
				break;
			}
			response.Clear();
		}

		if (stopped) {
			stream->Cancel();
			ReadRowsResponse discard;
			while (stream->Read(&discard)) {
			}
		}
		grpc::Status status = stream->Finish();
		{
			absl::MutexLock lock(&mutex_);
			stream_.reset();
		}

		if (stopped || IsCancelled()) {
			SetState(WorkerState::kCancelled);
			return;
		}

		if (status.ok()) {
			SetState(WorkerState::kCompleted);
			VLOG(2) << "Stream " << stream_name_ << " completed at offset " << offset();
			combiner_->OnWorkerCompleted(this);
			return;
		}

		bool retry = false;
		if (IsRetryable(status)) {
			absl::MutexLock lock(&mutex_);
			if (retries_ < max_retries_) {
				++retries_;
				retry = true;
				LOG(WARNING) << "Stream " << stream_name_ << ": retrying (" << retries_ << "/" << max_retries_
					<< ") from offset " << request_.offset() << " after (" << status.error_code() << ") "
					<< status.error_message();
			}
		}
		if (!retry) {
			Fail(status);
			return;
		}
		SetState(WorkerState::kRetrying);
	}
}

// ---------------------------------------------------------------------------
// StreamCombiner
// ---------------------------------------------------------------------------

StreamCombiner::StreamCombiner(std::shared_ptr<StorageReadClient> client,
		const std::vector<ReadRowsRequest>& requests,
		int buffer_entries_per_stream, int max_retries,
		IdentityTokenCache* token_cache)
	: client_(std::move(client)),
	token_cache_(token_cache),
	buffer_entries_per_stream_(CheckedBufferEntries(buffer_entries_per_stream)),
	max_retries_(CheckedRetries(max_retries)),
	// + 1 to leave space for the terminal entry
	capacity_(requests.size() * buffer_entries_per_stream_ + 1),
	responses_(capacity_),
	ready_workers_(std::max<size_t>(1, requests.size() * buffer_entries_per_stream_)) {
	LOG(INFO) << "New combining stream with " << requests.size() << " streams and "
		<< buffer_entries_per_stream_ << " buffered entries";

	workers_.reserve(requests.size());
	for (const auto& request : requests) {
		workers_.push_back(std::make_unique<StreamWorker>(this, request, buffer_entries_per_stream_, max_retries_));
	}

	{
		absl::MutexLock lock(&mutex_);
		for (auto& worker : workers_) {
			active_workers_.insert(worker.get());
		}
		if (workers_.empty()) {
			CompleteLocked(/*add_eos=*/true);
			return;
		}
	}

	for (auto& worker : workers_) {
		worker->Start();
	}
}

StreamCombiner::~StreamCombiner() {
	{
		absl::MutexLock lock(&mutex_);
		if (!terminated_) {
			CompleteLocked(/*add_eos=*/true);
		}
	}
	for (auto& worker : workers_) {
		worker->Join();
	}
}

bool StreamCombiner::HasNext() {
	if (caller_cancelled_.load(std::memory_order_acquire)) {
		return false;
	}
	if (!last_.has_value()) {
		Entry entry;
		responses_.blockingRead(entry);
		last_ = std::move(entry);
	}
	if (caller_cancelled_.load(std::memory_order_acquire)) {
		return false;
	}

	switch (last_->kind) {
		case Entry::Kind::kError:
			// Same failure every time, marked as coming from a stream thread
			std::rethrow_exception(last_->error);
		case Entry::Kind::kEndOfStream:
			return false;
		case Entry::Kind::kBatch:
			return true;
	}
	return false;
}

ReadRowsResponse StreamCombiner::Next() {
	if (!last_.has_value()) {
		throw std::out_of_range("Next() called without a pending batch");
	}
	if (last_->kind == Entry::Kind::kError) {
		std::rethrow_exception(last_->error);
	}
	if (last_->kind == Entry::Kind::kEndOfStream) {
		throw std::out_of_range("No more batches: all streams are exhausted");
	}

	StreamWorker* worker = nullptr;
	CHECK(ready_workers_.read(worker)) << "Batch without a producing stream";
	worker->Request();

	ReadRowsResponse batch = std::move(last_->batch);
	last_.reset();
	return batch;
}

void StreamCombiner::Cancel() {
	caller_cancelled_.store(true, std::memory_order_release);
	absl::MutexLock lock(&mutex_);
	if (terminated_) {
		return;
	}
	LOG(INFO) << "Cancelling combining stream over " << workers_.size() << " streams";
	CompleteLocked(/*add_eos=*/true);
}

bool StreamCombiner::EnqueueBatch(StreamWorker* worker, ReadRowsResponse&& batch) {
	absl::MutexLock lock(&mutex_);
	if (terminated_) {
		return false;
	}
	// Producer first so Next() always finds the owner of the batch it returns
	CHECK(ready_workers_.writeIfNotFull(worker)) << "Ready queue overflow from " << worker->stream_name();
	Entry entry;
	entry.kind = Entry::Kind::kBatch;
	entry.batch = std::move(batch);
	CHECK(responses_.writeIfNotFull(std::move(entry))) << "Expected capacity in responses";
	return true;
}

void StreamCombiner::OnWorkerCompleted(StreamWorker* worker) {
	absl::MutexLock lock(&mutex_);
	active_workers_.erase(worker);
	if (terminated_ || !active_workers_.empty()) {
		return;
	}
	VLOG(1) << "All " << workers_.size() << " streams completed";
	CompleteLocked(/*add_eos=*/true);
}

void StreamCombiner::StopWithError(const StreamFailedException& error) {
	absl::MutexLock lock(&mutex_);
	if (terminated_) {
		VLOG(2) << "Dropping failure of " << error.stream() << " after termination: " << error.what();
		return;
	}
	CompleteLocked(/*add_eos=*/false);
	Entry entry;
	entry.kind = Entry::Kind::kError;
	entry.error = error.AsynchronousCopy();
	CHECK(responses_.writeIfNotFull(std::move(entry))) << "Responses should always have capacity to add element";
}

void StreamCombiner::CompleteLocked(bool add_eos) {
	terminated_ = true;
	active_workers_.clear();
	for (auto& worker : workers_) {
		worker->Cancel();
	}
	if (add_eos) {
		CHECK(responses_.writeIfNotFull(Entry())) << "Responses should always have capacity to add element";
	}
}

CallMetadata StreamCombiner::ResolveCallMetadata(const std::string& stream_name) {
	CallMetadata metadata;
	if (token_cache_ == nullptr) {
		return metadata;
	}
	try {
		std::optional<std::string> token = token_cache_->Get(ParseReadSessionId(stream_name));
		if (token.has_value()) {
			metadata.emplace_back(kApiTokenHeader, *token);
		}
	} catch (const std::exception& e) {
		LOG(ERROR) << "Unable to obtain identity token for " << stream_name << ": " << e.what();
	}
	return metadata;
}

bool StreamCombiner::OpenStream(StreamWorker* worker, const ReadRowsRequest& request,
		const CallMetadata& metadata) {
	std::unique_ptr<ReadRowsStream> stream = client_->ReadRows(request, metadata);
	{
		absl::MutexLock lock(&mutex_);
		if (!terminated_) {
			// Attached under the lock so a concurrent Cancel() either sees the stream or stops us
			worker->AttachStream(std::move(stream));
			return true;
		}
	}

	stream->Cancel();
	ReadRowsResponse discard;
	while (stream->Read(&discard)) {
	}
	grpc::Status status = stream->Finish();
	VLOG(3) << "Discarded stream " << worker->stream_name() << " opened after termination ("
		<< status.error_code() << ")";
	return false;
}

} // namespace Tributary
