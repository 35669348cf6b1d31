#include "table_metadata_client.h"

#include <glog/logging.h>
#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"

#include "../common/errors.h"

namespace Tributary {

using tributary::storage::v1::GetTableRequest;
using tributary::storage::v1::MaterializeQueryRequest;
using tributary::storage::v1::TableService;

std::string TableMetadataClient::CreateSql(const TableReference& table,
		const std::vector<std::string>& columns,
		const std::vector<std::string>& filters,
		std::optional<int64_t> snapshot_time_millis) {
	std::string sql = absl::StrCat("SELECT ", columns.empty() ? "*" : absl::StrJoin(columns, ","),
			" FROM `", table.project(), ".", table.dataset(), ".", table.table(), "`");
	if (snapshot_time_millis.has_value()) {
		absl::StrAppend(&sql, " FOR SYSTEM_TIME AS OF TIMESTAMP_MILLIS(", *snapshot_time_millis, ")");
	}
	if (!filters.empty()) {
		absl::StrAppend(&sql, " WHERE ", absl::StrJoin(filters, " AND ",
				[](std::string* out, const std::string& filter) { absl::StrAppend(out, "(", filter, ")"); }));
	}
	return sql;
}

GrpcTableMetadataClient::GrpcTableMetadataClient(std::shared_ptr<grpc::Channel> channel,
		std::string project_id, std::string materialization_project,
		std::string materialization_dataset, int expiration_minutes)
	: stub_(TableService::NewStub(channel)),
	project_id_(std::move(project_id)),
	materialization_project_(std::move(materialization_project)),
	materialization_dataset_(std::move(materialization_dataset)),
	expiration_minutes_(expiration_minutes) {}

TableInfo GrpcTableMetadataClient::GetTable(const TableReference& table) {
	grpc::ClientContext context;
	GetTableRequest request;
	*request.mutable_table_ref() = table;
	TableInfo info;
	grpc::Status status = stub_->GetTable(&context, request, &info);
	if (!status.ok()) {
		LOG(ERROR) << "GetTable failed for " << ToTablePath(table) << ": " << status.error_message();
		throw RpcException("GetTable " + ToTablePath(table), status);
	}
	return info;
}

TableInfo GrpcTableMetadataClient::MaterializeViewToTable(const std::string& sql, const TableReference& view) {
	grpc::ClientContext context;
	MaterializeQueryRequest request;
	request.set_sql(sql);
	request.set_destination_project(materialization_project_.empty() ? view.project() : materialization_project_);
	request.set_destination_dataset(materialization_dataset_.empty() ? view.dataset() : materialization_dataset_);
	request.set_expiration_minutes(expiration_minutes_);

	VLOG(1) << "Materializing " << ToTablePath(view) << " into " << request.destination_project()
		<< "." << request.destination_dataset();
	TableInfo info;
	grpc::Status status = stub_->MaterializeQuery(&context, request, &info);
	if (!status.ok()) {
		LOG(ERROR) << "Materializing view " << ToTablePath(view) << " failed: " << status.error_message();
		throw RpcException("MaterializeQuery for " + ToTablePath(view), status);
	}
	return info;
}

std::string TableTypeName(TableType type) {
	return tributary::storage::v1::TableType_Name(type);
}

std::string ToTablePath(const TableReference& table) {
	return absl::StrCat("projects/", table.project(), "/datasets/", table.dataset(), "/tables/", table.table());
}

} // namespace Tributary
