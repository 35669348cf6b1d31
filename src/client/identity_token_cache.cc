#include "identity_token_cache.h"

#include <glog/logging.h>
#include "storage_client.h"
#include "../common/errors.h"

namespace Tributary {

IdentityTokenCache::IdentityTokenCache(Loader loader, std::chrono::steady_clock::duration ttl, Clock clock)
	: loader_(std::move(loader)), ttl_(ttl), clock_(std::move(clock)) {}

IdentityTokenCache& IdentityTokenCache::Initialize(Loader loader, std::chrono::steady_clock::duration ttl) {
	static IdentityTokenCache instance(std::move(loader), ttl);
	return instance;
}

IdentityTokenCache::Loader IdentityTokenCache::ExchangeThrough(StorageReadClient* client) {
	return [client](const std::string& session_id) -> std::optional<std::string> {
		std::string token;
		grpc::Status status = client->ExchangeIdentityToken(session_id, &token);
		if (!status.ok()) {
			throw RpcException("ExchangeIdentityToken for " + session_id, status);
		}
		if (token.empty()) {
			return std::nullopt;
		}
		return token;
	};
}

std::optional<std::string> IdentityTokenCache::Get(const std::string& session_id) {
	{
		absl::MutexLock lock(&mutex_);
		auto it = entries_.find(session_id);
		if (it != entries_.end()) {
			if (clock_() - it->second.loaded_at < ttl_) {
				return it->second.token;
			}
			entries_.erase(it);
		}
	}

	// Loaded without the lock so one slow exchange does not stall other sessions
	std::optional<std::string> token = loader_(session_id);
	VLOG(3) << "Loaded identity token for " << session_id << " (present=" << token.has_value() << ")";

	absl::MutexLock lock(&mutex_);
	auto [it, inserted] = entries_.try_emplace(session_id, Entry{token, clock_()});
	return it->second.token;
}

void IdentityTokenCache::Invalidate(const std::string& session_id) {
	absl::MutexLock lock(&mutex_);
	entries_.erase(session_id);
}

size_t IdentityTokenCache::size() const {
	absl::MutexLock lock(&mutex_);
	return entries_.size();
}

std::string ParseReadSessionId(const std::string& stream_name) {
	size_t streams_index = stream_name.find("/streams");
	if (streams_index != std::string::npos) {
		return stream_name.substr(0, streams_index);
	}
	LOG(WARNING) << "Stream name " << stream_name << " in invalid format";
	return stream_name;
}

} // namespace Tributary
