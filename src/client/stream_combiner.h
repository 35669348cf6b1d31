#pragma once

#include <atomic>
#include <exception>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "absl/container/flat_hash_set.h"
#include "absl/synchronization/mutex.h"
#include "folly/MPMCQueue.h"

#include "storage_client.h"
#include "../common/errors.h"

namespace Tributary {

class IdentityTokenCache;
class StreamCombiner;

enum class WorkerState {
	kConnecting,
	kStreaming,
	kRetrying,
	kCompleted,
	kFailed,
	kCancelled,
};

const char* WorkerStateName(WorkerState state);

/**
 * Reads one stream of a session on its own thread.
 *
 * Credit is explicit: the worker only pulls a response off the network while
 * it holds credit, and credit is only handed back as the consumer drains
 * batches (Request()). Once the unconsumed credit falls to a quarter of the
 * buffer size it is topped back up in one step. On a transient failure the
 * stream is reopened at the offset after the last received row.
 */
class StreamWorker {
	public:
		StreamWorker(StreamCombiner* combiner, const ReadRowsRequest& request,
				int buffer_entries, int max_retries);
		~StreamWorker();

		StreamWorker(const StreamWorker&) = delete;
		StreamWorker& operator=(const StreamWorker&) = delete;

		void Start();
		void Join();

		// Consumer side: one of this worker's batches was handed to the caller
		void Request();

		// Best effort, never throws. Safe from any thread and any state.
		void Cancel();

		WorkerState state() const;
		int retries() const;
		int64_t offset() const;
		const std::string& stream_name() const { return stream_name_; }

	private:
		friend class StreamCombiner;

		void Run();
		// Returns false when the combiner already reached its terminal state
		bool Connect();
		// Called by the combiner with its lock held
		void AttachStream(std::unique_ptr<ReadRowsStream> stream);
		bool WaitForCredit();
		bool IsCancelled() const;
		void SetState(WorkerState state);
		void Fail(const grpc::Status& status);

		StreamCombiner* const combiner_;
		const std::string stream_name_;
		const int buffer_entries_;
		const int max_retries_;

		mutable absl::Mutex mutex_;
		absl::CondVar credit_cv_;
		ReadRowsRequest request_ ABSL_GUARDED_BY(mutex_);  // offset is the resume point
		std::unique_ptr<ReadRowsStream> stream_ ABSL_GUARDED_BY(mutex_);
		// Requested from the combiner but not yet consumed by the caller
		int outstanding_ ABSL_GUARDED_BY(mutex_);
		// Responses the worker may still pull off the network
		int network_credit_ ABSL_GUARDED_BY(mutex_);
		int retries_ ABSL_GUARDED_BY(mutex_) = 0;
		bool cancelled_ ABSL_GUARDED_BY(mutex_) = false;
		WorkerState state_ ABSL_GUARDED_BY(mutex_) = WorkerState::kConnecting;

		std::thread thread_;
};

/**
 * Combines the ReadRows streams of one session into a single pull-based
 * sequence of batches. Batches of one stream keep their order; batches of
 * different streams interleave arbitrarily.
 *
 * Exactly one terminal outcome is produced: end of data once every stream
 * completed, the first unrecoverable stream failure, or a clean end after
 * Cancel(). Memory is bounded by buffer_entries_per_stream batches per
 * stream.
 *
 * HasNext()/Next() must be called from a single consumer thread. Cancel()
 * may be called from any thread.
 */
class StreamCombiner {
	public:
		/**
		 * @param client Shared read handle; not closed by the combiner
		 * @param requests One request per stream, offset is the starting row
		 * @param buffer_entries_per_stream Must be positive
		 * @param max_retries Reconnects allowed per stream, must not be negative
		 * @param token_cache Side-channel tokens, may be null
		 */
		StreamCombiner(std::shared_ptr<StorageReadClient> client,
				const std::vector<ReadRowsRequest>& requests,
				int buffer_entries_per_stream, int max_retries,
				IdentityTokenCache* token_cache = nullptr);
		~StreamCombiner();

		StreamCombiner(const StreamCombiner&) = delete;
		StreamCombiner& operator=(const StreamCombiner&) = delete;

		/**
		 * Blocks until a batch is available or the sequence ended. Repeated
		 * calls return the same answer until Next() consumes the batch. After
		 * a stream failure every call throws that failure (asynchronous()).
		 */
		bool HasNext();

		/**
		 * Returns the batch found by the preceding HasNext() and grants its
		 * stream more credit. A Cancel() after that HasNext() does not take
		 * the batch away.
		 * @throws std::out_of_range when no batch is pending
		 */
		ReadRowsResponse Next();

		// Stops every stream. The consumer then observes a clean end.
		void Cancel();

		size_t num_streams() const { return workers_.size(); }
		const StreamWorker& worker(size_t index) const { return *workers_.at(index); }
		size_t capacity() const { return capacity_; }

	private:
		friend class StreamWorker;

		struct Entry {
			enum class Kind { kBatch, kEndOfStream, kError };

			Kind kind = Kind::kEndOfStream;
			ReadRowsResponse batch;
			// Already marked asynchronous, rethrown as is
			std::exception_ptr error;
		};

		// Worker callbacks. None of them blocks.
		bool EnqueueBatch(StreamWorker* worker, ReadRowsResponse&& batch);
		void OnWorkerCompleted(StreamWorker* worker);
		void StopWithError(const StreamFailedException& error);

		CallMetadata ResolveCallMetadata(const std::string& stream_name);
		bool OpenStream(StreamWorker* worker, const ReadRowsRequest& request,
				const CallMetadata& metadata);

		void CompleteLocked(bool add_eos) ABSL_EXCLUSIVE_LOCKS_REQUIRED(mutex_);

		const std::shared_ptr<StorageReadClient> client_;
		IdentityTokenCache* const token_cache_;
		const int buffer_entries_per_stream_;
		const int max_retries_;
		const size_t capacity_;

		// Batches plus room for the single terminal entry
		folly::MPMCQueue<Entry> responses_;
		// Producer of each batch still in responses_, same order
		folly::MPMCQueue<StreamWorker*> ready_workers_;

		absl::Mutex mutex_;
		bool terminated_ ABSL_GUARDED_BY(mutex_) = false;
		absl::flat_hash_set<StreamWorker*> active_workers_ ABSL_GUARDED_BY(mutex_);
		std::atomic<bool> caller_cancelled_{false};

		std::vector<std::unique_ptr<StreamWorker>> workers_;

		// Consumer thread only
		std::optional<Entry> last_;
};

} // namespace Tributary
