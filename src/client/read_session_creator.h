#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "read_session_cache.h"
#include "storage_client.h"
#include "table_metadata_client.h"

namespace Tributary {

class Configuration;

struct ReadSessionCreatorConfig {
	static constexpr int kMinimalParallelism = 1;
	static constexpr int kDefaultMinParallelismFactor = 3;
	static constexpr int kDefaultMaxParallelism = 20000;
	static constexpr char kViewsEnabledParamName[] = "session.views_enabled";

	int default_parallelism = 1;
	std::optional<int> preferred_min_parallelism;
	std::optional<int> max_parallelism;
	bool views_enabled = false;
	bool read_session_caching_enabled = true;
	int read_session_cache_duration_mins = 5;
	std::optional<int64_t> snapshot_time_millis;
	tributary::storage::v1::DataFormat data_format = tributary::storage::v1::ARROW;
	tributary::storage::v1::CompressionCodec arrow_compression = tributary::storage::v1::NONE;
	tributary::storage::v1::CompressionCodec response_compression = tributary::storage::v1::NONE;
	std::optional<std::string> trace_id;
	// Base64 CreateReadSessionRequest that requests are built on top of
	std::optional<std::string> request_encoded_base;

	/**
	 * Reads the session section; zero/negative/empty values mean unset.
	 * @throws TributaryException (kInvalidConfig) on unknown format or codec names
	 */
	static ReadSessionCreatorConfig FromConfiguration(const Configuration& configuration);
};

struct ReadSessionResponse {
	ReadSession read_session;
	// The table actually read: the materialized table when reading a view
	TableInfo read_table_info;
};

/**
 * Plans read sessions: resolves the table to read, applies the parallelism
 * policy and creates the session, or reuses a cached one for an identical
 * request.
 */
class ReadSessionCreator {
	public:
		/**
		 * @param cache Session cache, the process-wide one when null
		 */
		ReadSessionCreator(ReadSessionCreatorConfig config, TableMetadataClient* metadata_client,
				std::shared_ptr<StorageReadClient> read_client, ReadSessionCache* cache = nullptr);

		/**
		 * @throws UnsupportedException for views when disabled and for
		 *         unsupported table types
		 * @throws RpcException when the service rejects a call
		 */
		ReadSessionResponse Create(const TableReference& table,
				const std::vector<std::string>& selected_fields,
				const std::optional<std::string>& filter);

		// The table to create the session on; views are materialized first
		TableInfo GetActualTable(const TableInfo& table,
				const std::vector<std::string>& required_columns,
				const std::optional<std::string>& filter);

		// @throws UnsupportedException when table is a view and views are disabled
		bool IsInputTableAView(const TableInfo& table) const;

		// {preferred min, max} stream counts
		std::pair<int, int> StreamCounts() const;

		ReadSessionCache* cache() const { return cache_; }

	private:
		CreateReadSessionRequest BaseRequest() const;

		const ReadSessionCreatorConfig config_;
		TableMetadataClient* const metadata_client_;
		const std::shared_ptr<StorageReadClient> read_client_;
		ReadSessionCache* const cache_;
};

} // namespace Tributary
