#pragma once

#include <chrono>
#include <functional>
#include <list>
#include <optional>
#include <string>

#include "absl/container/flat_hash_map.h"
#include "absl/synchronization/mutex.h"

#include "storage_client.h"

namespace Tributary {

/**
 * CreateReadSessionRequest -> ReadSession, so identical requests made within
 * the expiry window share one session. Keys are the deterministic
 * serialization of the request: two requests hit the same entry only when
 * they are equal field for field.
 *
 * Entries expire a fixed time after they were written. Beyond max_entries the
 * least recently used entry is evicted.
 */
class ReadSessionCache {
	public:
		using Clock = std::function<std::chrono::steady_clock::time_point()>;

		static constexpr size_t kMaxEntries = 1000;

		explicit ReadSessionCache(std::chrono::steady_clock::duration ttl,
				size_t max_entries = kMaxEntries,
				Clock clock = [] { return std::chrono::steady_clock::now(); });

		/**
		 * Process-wide instance, created by the first call with its ttl. Later
		 * calls return that instance whatever ttl they pass.
		 */
		static ReadSessionCache& Initialize(std::chrono::steady_clock::duration ttl);

		std::optional<ReadSession> Get(const CreateReadSessionRequest& request);
		void Put(const CreateReadSessionRequest& request, const ReadSession& session);
		void Clear();

		size_t size() const;
		std::chrono::steady_clock::duration ttl() const { return ttl_; }

	private:
		struct Entry {
			ReadSession session;
			std::chrono::steady_clock::time_point written_at;
			std::list<std::string>::iterator lru_position;
		};

		static std::string KeyOf(const CreateReadSessionRequest& request);

		const std::chrono::steady_clock::duration ttl_;
		const size_t max_entries_;
		const Clock clock_;

		mutable absl::Mutex mutex_;
		// Most recently used first
		std::list<std::string> lru_ ABSL_GUARDED_BY(mutex_);
		absl::flat_hash_map<std::string, Entry> entries_ ABSL_GUARDED_BY(mutex_);
};

} // namespace Tributary
