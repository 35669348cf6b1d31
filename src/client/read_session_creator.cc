#include "read_session_creator.h"

#include <algorithm>
#include <chrono>
#include <glog/logging.h>
#include "absl/strings/escaping.h"
#include "absl/strings/str_join.h"

#include "../common/configuration.h"
#include "../common/errors.h"

namespace Tributary {

using tributary::storage::v1::CompressionCodec;
using tributary::storage::v1::DataFormat;

namespace {
	CompressionCodec ParseCodec(const std::string& key, const std::string& name) {
		CompressionCodec codec;
		if (!tributary::storage::v1::CompressionCodec_Parse(name, &codec)) {
			throw TributaryException(ErrorCode::kInvalidConfig, "Unknown compression codec '" + name + "' for " + key);
		}
		return codec;
	}

	int64_t MillisBetween(std::chrono::steady_clock::time_point from, std::chrono::steady_clock::time_point to) {
		return std::chrono::duration_cast<std::chrono::milliseconds>(to - from).count();
	}
}

ReadSessionCreatorConfig ReadSessionCreatorConfig::FromConfiguration(const Configuration& configuration) {
	const auto& session = configuration.config().session;
	ReadSessionCreatorConfig config;
	config.default_parallelism = session.default_parallelism.get();
	if (session.preferred_min_parallelism.get() > 0) {
		config.preferred_min_parallelism = session.preferred_min_parallelism.get();
	}
	if (session.max_parallelism.get() > 0) {
		config.max_parallelism = session.max_parallelism.get();
	}
	config.views_enabled = session.views_enabled.get();
	config.read_session_caching_enabled = session.cache_enabled.get();
	config.read_session_cache_duration_mins = session.cache_duration_mins.get();
	if (session.snapshot_time_millis.get() >= 0) {
		config.snapshot_time_millis = session.snapshot_time_millis.get();
	}

	DataFormat format;
	if (!tributary::storage::v1::DataFormat_Parse(session.data_format.get(), &format)) {
		throw TributaryException(ErrorCode::kInvalidConfig, "Unknown data format '" + session.data_format.get() + "'");
	}
	config.data_format = format;
	config.arrow_compression = ParseCodec("session.arrow_compression", session.arrow_compression.get());
	config.response_compression = ParseCodec("session.response_compression", session.response_compression.get());

	if (!session.trace_id.get().empty()) {
		config.trace_id = session.trace_id.get();
	}
	if (!session.request_encoded_base.get().empty()) {
		config.request_encoded_base = session.request_encoded_base.get();
	}
	return config;
}

ReadSessionCreator::ReadSessionCreator(ReadSessionCreatorConfig config, TableMetadataClient* metadata_client,
		std::shared_ptr<StorageReadClient> read_client, ReadSessionCache* cache)
	: config_(std::move(config)),
	metadata_client_(metadata_client),
	read_client_(std::move(read_client)),
	cache_(cache != nullptr ? cache
			: &ReadSessionCache::Initialize(std::chrono::minutes(config_.read_session_cache_duration_mins))) {
	if (metadata_client_ == nullptr || read_client_ == nullptr) {
		throw std::invalid_argument("ReadSessionCreator needs a metadata client and a read client");
	}
}

std::pair<int, int> ReadSessionCreator::StreamCounts() const {
	int preferred_min = config_.preferred_min_parallelism.value_or(
			std::max(ReadSessionCreatorConfig::kMinimalParallelism,
				ReadSessionCreatorConfig::kDefaultMinParallelismFactor * config_.default_parallelism));
	int max_streams = config_.max_parallelism.value_or(
			std::max(ReadSessionCreatorConfig::kDefaultMaxParallelism, preferred_min));
	if (preferred_min > max_streams) {
		LOG(WARNING) << "Preferred min parallelism " << preferred_min << " is larger than the max parallelism, "
			<< "setting it to max parallelism " << max_streams;
		preferred_min = max_streams;
	}
	return {preferred_min, max_streams};
}

CreateReadSessionRequest ReadSessionCreator::BaseRequest() const {
	CreateReadSessionRequest request;
	if (!config_.request_encoded_base.has_value()) {
		return request;
	}
	std::string decoded;
	if (!absl::Base64Unescape(*config_.request_encoded_base, &decoded) || !request.ParseFromString(decoded)) {
		LOG(ERROR) << "Couldn't decode base request: " << *config_.request_encoded_base;
		throw TributaryException(ErrorCode::kInvalidConfig,
				"Couldn't decode: " + *config_.request_encoded_base);
	}
	return request;
}

bool ReadSessionCreator::IsInputTableAView(const TableInfo& table) const {
	if (table.type() != tributary::storage::v1::VIEW && table.type() != tributary::storage::v1::MATERIALIZED_VIEW) {
		return false;
	}
	if (!config_.views_enabled) {
		throw UnsupportedException(std::string("Views are not enabled. You can enable views by setting '") +
				ReadSessionCreatorConfig::kViewsEnabledParamName + "' to true. Notice additional cost may occur.");
	}
	return true;
}

TableInfo ReadSessionCreator::GetActualTable(const TableInfo& table,
		const std::vector<std::string>& required_columns,
		const std::optional<std::string>& filter) {
	switch (table.type()) {
		case tributary::storage::v1::TABLE:
		case tributary::storage::v1::EXTERNAL:
		case tributary::storage::v1::SNAPSHOT:
			return table;
		default:
			break;
	}
	if (!IsInputTableAView(table)) {
		throw UnsupportedException("Table type '" + TableTypeName(table.type()) + "' of table '" +
				table.table_ref().dataset() + "." + table.table_ref().table() + "' is not supported");
	}

	std::vector<std::string> filters;
	if (filter.has_value()) {
		filters.push_back(*filter);
	}
	std::string sql = TableMetadataClient::CreateSql(table.table_ref(), required_columns, filters,
			config_.snapshot_time_millis);
	VLOG(1) << "Query for view " << table.table_ref().table() << ": " << sql;
	return metadata_client_->MaterializeViewToTable(sql, table.table_ref());
}

ReadSessionResponse ReadSessionCreator::Create(const TableReference& table,
		const std::vector<std::string>& selected_fields,
		const std::optional<std::string>& filter) {
	auto prep_start = std::chrono::steady_clock::now();
	TableInfo table_details = metadata_client_->GetTable(table);
	TableInfo actual_table = GetActualTable(table_details, selected_fields, filter);
	bool is_view = IsInputTableAView(table_details);

	LOG(INFO) << "Creating a read session for table " << actual_table.friendly_name()
		<< ", selectedFields=[" << absl::StrJoin(selected_fields, ",") << "]"
		<< ", filter=[" << filter.value_or("None") << "]"
		<< ", snapshotTimeMillis=["
		<< (config_.snapshot_time_millis.has_value() ? std::to_string(*config_.snapshot_time_millis) : "None") << "]";

	CreateReadSessionRequest request = BaseRequest();
	ReadSession* requested = request.mutable_read_session();
	if (config_.trace_id.has_value()) {
		requested->set_trace_id(*config_.trace_id);
	}

	auto* read_options = requested->mutable_read_options();
	if (!is_view && filter.has_value()) {
		read_options->set_row_restriction(*filter);
	}
	for (const auto& field : selected_fields) {
		read_options->add_selected_fields(field);
	}
	read_options->set_arrow_compression(config_.arrow_compression);
	read_options->set_response_compression(config_.response_compression);

	auto [min_streams, max_streams] = StreamCounts();

	requested->clear_table_modifiers();
	if (!is_view && config_.snapshot_time_millis.has_value()) {
		requested->mutable_table_modifiers()->set_snapshot_time_millis(*config_.snapshot_time_millis);
	}
	requested->set_data_format(config_.data_format);
	requested->set_table(ToTablePath(actual_table.table_ref()));

	request.set_parent("projects/" + metadata_client_->project_id());
	request.set_max_stream_count(max_streams);
	request.set_preferred_min_stream_count(min_streams);
	auto prep_end = std::chrono::steady_clock::now();

	if (config_.read_session_caching_enabled) {
		std::optional<ReadSession> cached = cache_->Get(request);
		if (cached.has_value()) {
			LOG(INFO) << "Reusing read session: " << cached->name() << ", for table: " << ToTablePath(table);
			return ReadSessionResponse{*std::move(cached), actual_table};
		}
	}

	ReadSession session;
	grpc::Status status = read_client_->CreateReadSession(request, &session);
	if (!status.ok()) {
		LOG(ERROR) << "CreateReadSession failed for " << requested->table() << ": " << status.error_message();
		throw RpcException("CreateReadSession for " + requested->table(), status);
	}
	auto creation_end = std::chrono::steady_clock::now();
	if (config_.read_session_caching_enabled) {
		cache_->Put(request, session);
	}

	LOG(INFO) << "Read session: name=" << session.name()
		<< " prep_ms=" << MillisBetween(prep_start, prep_end)
		<< " creation_ms=" << MillisBetween(prep_end, creation_end)
		<< " total_ms=" << MillisBetween(prep_start, creation_end);
	LOG(INFO) << "Received " << session.streams_size() << " streams for session " << session.name()
		<< " (requested between " << min_streams << " and " << max_streams << ")";
	return ReadSessionResponse{std::move(session), std::move(actual_table)};
}

} // namespace Tributary
