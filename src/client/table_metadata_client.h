#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <grpcpp/grpcpp.h>
#include <storage.grpc.pb.h>

namespace Tributary {

using tributary::storage::v1::TableInfo;
using tributary::storage::v1::TableReference;
using tributary::storage::v1::TableType;

/**
 * Table metadata and view materialization. Failures are raised as
 * RpcException.
 */
class TableMetadataClient {
	public:
		virtual ~TableMetadataClient() = default;

		virtual TableInfo GetTable(const TableReference& table) = 0;

		// Runs sql into a temporary table and returns that table
		virtual TableInfo MaterializeViewToTable(const std::string& sql, const TableReference& view) = 0;

		// Project sessions are billed to
		virtual const std::string& project_id() const = 0;

		/**
		 * SELECT statement reading columns (all when empty) of table, filtered
		 * by the conjunction of filters, optionally at a snapshot time.
		 */
		static std::string CreateSql(const TableReference& table,
				const std::vector<std::string>& columns,
				const std::vector<std::string>& filters,
				std::optional<int64_t> snapshot_time_millis);
};

class GrpcTableMetadataClient : public TableMetadataClient {
	public:
		/**
		 * @param materialization_project Destination of materialized views,
		 *        the view's own project when empty
		 * @param materialization_dataset As above for the dataset
		 */
		GrpcTableMetadataClient(std::shared_ptr<grpc::Channel> channel, std::string project_id,
				std::string materialization_project = "", std::string materialization_dataset = "",
				int expiration_minutes = 1440);

		TableInfo GetTable(const TableReference& table) override;
		TableInfo MaterializeViewToTable(const std::string& sql, const TableReference& view) override;
		const std::string& project_id() const override { return project_id_; }

	private:
		std::unique_ptr<tributary::storage::v1::TableService::Stub> stub_;
		const std::string project_id_;
		const std::string materialization_project_;
		const std::string materialization_dataset_;
		const int expiration_minutes_;
};

std::string TableTypeName(TableType type);

// projects/<project>/datasets/<dataset>/tables/<table>
std::string ToTablePath(const TableReference& table);

} // namespace Tributary
