#pragma once

#include <chrono>
#include <functional>
#include <optional>
#include <string>

#include "absl/container/flat_hash_map.h"
#include "absl/synchronization/mutex.h"

namespace Tributary {

class StorageReadClient;

/**
 * Read session name -> side-channel authorization token, expiring a fixed
 * time after each entry was loaded. A session without a token caches
 * std::nullopt so it is not asked again before expiry.
 */
class IdentityTokenCache {
	public:
		using Loader = std::function<std::optional<std::string>(const std::string& session_id)>;
		using Clock = std::function<std::chrono::steady_clock::time_point()>;

		static constexpr std::chrono::minutes kDefaultTtl{50};

		IdentityTokenCache(Loader loader, std::chrono::steady_clock::duration ttl = kDefaultTtl,
				Clock clock = [] { return std::chrono::steady_clock::now(); });

		/**
		 * Process-wide instance, created by the first call. Later calls return
		 * that instance and ignore their arguments.
		 */
		static IdentityTokenCache& Initialize(Loader loader,
				std::chrono::steady_clock::duration ttl = kDefaultTtl);

		// Loader that exchanges tokens through client, which must outlive the cache
		static Loader ExchangeThrough(StorageReadClient* client);

		/**
		 * Cached token for session_id, loading it when absent or expired.
		 * Propagates loader exceptions; nothing is cached in that case.
		 */
		std::optional<std::string> Get(const std::string& session_id);

		void Invalidate(const std::string& session_id);
		size_t size() const;

	private:
		struct Entry {
			std::optional<std::string> token;
			std::chrono::steady_clock::time_point loaded_at;
		};

		const Loader loader_;
		const std::chrono::steady_clock::duration ttl_;
		const Clock clock_;

		mutable absl::Mutex mutex_;
		absl::flat_hash_map<std::string, Entry> entries_ ABSL_GUARDED_BY(mutex_);
};

/**
 * Session part of a stream name: everything before "/streams". Names
 * without that component are returned unchanged.
 */
std::string ParseReadSessionId(const std::string& stream_name);

} // namespace Tributary
