#pragma once

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <grpcpp/grpcpp.h>
#include "absl/container/flat_hash_map.h"
#include "absl/synchronization/mutex.h"

#include "storage_client.h"

namespace Tributary {

class Configuration;

/**
 * How a client authenticates. Two Credentials with the same fields share a
 * fingerprint, wherever they were built.
 */
struct Credentials {
	enum class Kind {
		kInsecure,
		kAccessToken,
		kServiceAccountFile,
		kDefault,
	};

	Kind kind = Kind::kDefault;
	std::string access_token;
	// Contents of the key file, not its path
	std::string service_account_json;
	std::string impersonate_service_account;

	std::string Fingerprint() const;

	static Credentials Insecure();
	static Credentials AccessToken(std::string token);
	static Credentials ServiceAccount(std::string json_key);
};

struct ClientConfig {
	std::string endpoint = "localhost:8443";
	std::string user_agent;
	int channel_pool_size = 1;
	std::string proxy_uri;
	std::string proxy_username;
	std::string proxy_password;
	Credentials credentials;

	/**
	 * Reads the client section. A credentials file is loaded here.
	 * @throws TributaryException (kInvalidConfig) when it cannot be read
	 */
	static ClientConfig FromConfiguration(const Configuration& configuration);
};

/**
 * Identity of a client handle: everything that changes how its channels
 * connect or authenticate.
 */
struct ClientCacheKey {
	std::string credentials_fingerprint;
	std::string user_agent;
	int channel_pool_size = 1;
	std::string proxy_uri;
	std::string proxy_username;
	std::string proxy_password;
	std::string endpoint;

	static ClientCacheKey Of(const ClientConfig& config);

	bool operator==(const ClientCacheKey& other) const {
		return credentials_fingerprint == other.credentials_fingerprint &&
			user_agent == other.user_agent &&
			channel_pool_size == other.channel_pool_size &&
			proxy_uri == other.proxy_uri &&
			proxy_username == other.proxy_username &&
			proxy_password == other.proxy_password &&
			endpoint == other.endpoint;
	}
	bool operator!=(const ClientCacheKey& other) const { return !(*this == other); }

	template <typename H>
	friend H AbslHashValue(H h, const ClientCacheKey& key) {
		return H::combine(std::move(h), key.credentials_fingerprint, key.user_agent, key.channel_pool_size,
				key.proxy_uri, key.proxy_username, key.proxy_password, key.endpoint);
	}
};

/**
 * Builds the channel pool for a configuration: one channel per pool entry,
 * each with its own subchannels so calls really spread over connections.
 */
std::vector<std::shared_ptr<grpc::Channel>> CreateChannels(const ClientConfig& config);

/**
 * Process-wide pool of client handles. Equal configurations get the same
 * handle; handles live until Clear() or process exit.
 */
class ClientHandleCache {
	public:
		static ClientHandleCache& getInstance();

		std::shared_ptr<StorageReadClient> GetReadClient(const ClientConfig& config);
		std::shared_ptr<StorageWriteClient> GetWriteClient(const ClientConfig& config);

		size_t read_clients() const;
		size_t write_clients() const;
		void Clear();

	private:
		ClientHandleCache() = default;
		ClientHandleCache(const ClientHandleCache&) = delete;
		ClientHandleCache& operator=(const ClientHandleCache&) = delete;

		mutable absl::Mutex mutex_;
		absl::flat_hash_map<ClientCacheKey, std::shared_ptr<StorageReadClient>> read_clients_ ABSL_GUARDED_BY(mutex_);
		absl::flat_hash_map<ClientCacheKey, std::shared_ptr<StorageWriteClient>> write_clients_ ABSL_GUARDED_BY(mutex_);
};

} // namespace Tributary
