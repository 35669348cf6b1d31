#include "read_session_cache.h"

#include <stdexcept>
#include <glog/logging.h>
#include <google/protobuf/io/coded_stream.h>
#include <google/protobuf/io/zero_copy_stream_impl_lite.h>

namespace Tributary {

ReadSessionCache::ReadSessionCache(std::chrono::steady_clock::duration ttl, size_t max_entries, Clock clock)
	: ttl_(ttl), max_entries_(max_entries), clock_(std::move(clock)) {
	if (max_entries_ == 0) {
		throw std::invalid_argument("ReadSessionCache needs room for at least one entry");
	}
}

ReadSessionCache& ReadSessionCache::Initialize(std::chrono::steady_clock::duration ttl) {
	static ReadSessionCache instance(ttl);
	if (instance.ttl() != ttl) {
		VLOG(1) << "Read session cache already initialized, keeping its expiry";
	}
	return instance;
}

std::string ReadSessionCache::KeyOf(const CreateReadSessionRequest& request) {
	// Map fields have no stable order unless serialized deterministically
	std::string key;
	{
		google::protobuf::io::StringOutputStream output(&key);
		google::protobuf::io::CodedOutputStream coded(&output);
		coded.SetSerializationDeterministic(true);
		request.SerializeToCodedStream(&coded);
	}
	return key;
}

std::optional<ReadSession> ReadSessionCache::Get(const CreateReadSessionRequest& request) {
	std::string key = KeyOf(request);
	absl::MutexLock lock(&mutex_);
	auto it = entries_.find(key);
	if (it == entries_.end()) {
		return std::nullopt;
	}
	if (clock_() - it->second.written_at >= ttl_) {
		lru_.erase(it->second.lru_position);
		entries_.erase(it);
		return std::nullopt;
	}
	lru_.splice(lru_.begin(), lru_, it->second.lru_position);
	return it->second.session;
}

void ReadSessionCache::Put(const CreateReadSessionRequest& request, const ReadSession& session) {
	std::string key = KeyOf(request);
	absl::MutexLock lock(&mutex_);
	auto it = entries_.find(key);
	if (it != entries_.end()) {
		it->second.session = session;
		it->second.written_at = clock_();
		lru_.splice(lru_.begin(), lru_, it->second.lru_position);
		return;
	}

	while (entries_.size() >= max_entries_) {
		VLOG(2) << "Evicting least recently used read session";
		entries_.erase(lru_.back());
		lru_.pop_back();
	}
	lru_.push_front(key);
	entries_.emplace(std::move(key), Entry{session, clock_(), lru_.begin()});
}

void ReadSessionCache::Clear() {
	absl::MutexLock lock(&mutex_);
	entries_.clear();
	lru_.clear();
}

size_t ReadSessionCache::size() const {
	absl::MutexLock lock(&mutex_);
	return entries_.size();
}

} // namespace Tributary
