#include <chrono>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include <cxxopts.hpp>
#include <glog/logging.h>
#include "absl/strings/str_split.h"

#include "client_factory.h"
#include "identity_token_cache.h"
#include "read_session_creator.h"
#include "stream_combiner.h"
#include "table_metadata_client.h"
#include "../common/configuration.h"
#include "../common/errors.h"

using namespace Tributary;

int main(int argc, char* argv[]) {
    // Initialize logging
    google::InitGoogleLogging(argv[0]);
    google::InstallFailureSignalHandler();
    FLAGS_logtostderr = 1; // log only to console, no files.

    // Setup command line options
    cxxopts::Options options("tributary_read", "Reads a table through parallel read streams");

    options.add_options()
        ("l,log_level", "Log level", cxxopts::value<int>()->default_value("1"))
        ("config", "YAML configuration file", cxxopts::value<std::string>()->default_value(""))
        ("p,project", "Project of the table", cxxopts::value<std::string>())
        ("d,dataset", "Dataset of the table", cxxopts::value<std::string>())
        ("t,table", "Table to read", cxxopts::value<std::string>())
        ("c,columns", "Comma separated columns to read, all when empty",
            cxxopts::value<std::string>()->default_value(""))
        ("f,filter", "Row restriction", cxxopts::value<std::string>()->default_value(""))
        ("b,buffer", "Buffered batches per stream, overrides the configuration",
            cxxopts::value<int>())
        ("r,retries", "Reconnects per stream, overrides the configuration", cxxopts::value<int>())
        ("h,help", "Print usage");

    auto result = options.parse(argc, argv);
    if (result.count("help")) {
        std::cout << options.help() << std::endl;
        return 0;
    }
    FLAGS_v = result["log_level"].as<int>();

    if (!result.count("project") || !result.count("dataset") || !result.count("table")) {
        LOG(ERROR) << "--project, --dataset and --table are required";
        return 1;
    }

    Configuration& configuration = Configuration::getInstance();
    const std::string config_file = result["config"].as<std::string>();
    if (!config_file.empty() && !configuration.loadFromFile(config_file)) {
        LOG(ERROR) << "Failed to load configuration from " << config_file;
        return 1;
    }
    if (result.count("buffer")) {
        configuration.config().read.buffer_entries_per_stream.set(result["buffer"].as<int>());
    }
    if (result.count("retries")) {
        configuration.config().read.max_read_rows_retries.set(result["retries"].as<int>());
    }
    if (!configuration.validate()) {
        for (const auto& error : configuration.getValidationErrors()) {
            LOG(ERROR) << "Invalid configuration: " << error;
        }
        return 1;
    }

    TableReference table;
    table.set_project(result["project"].as<std::string>());
    table.set_dataset(result["dataset"].as<std::string>());
    table.set_table(result["table"].as<std::string>());

    std::vector<std::string> columns;
    const std::string column_list = result["columns"].as<std::string>();
    if (!column_list.empty()) {
        columns = absl::StrSplit(column_list, ',', absl::SkipWhitespace());
    }
    std::optional<std::string> filter;
    if (!result["filter"].as<std::string>().empty()) {
        filter = result["filter"].as<std::string>();
    }

    try {
        ClientConfig client_config = ClientConfig::FromConfiguration(configuration);
        std::shared_ptr<StorageReadClient> read_client = ClientHandleCache::getInstance().GetReadClient(client_config);

        const auto& settings = configuration.config();
        std::string billing_project = settings.client.parent_project.get();
        if (billing_project.empty()) {
            billing_project = table.project();
        }
        GrpcTableMetadataClient metadata_client(CreateChannels(client_config).front(), billing_project,
                settings.session.materialization_project.get(),
                settings.session.materialization_dataset.get(),
                settings.session.materialization_expiration_minutes.get());

        ReadSessionCreator creator(ReadSessionCreatorConfig::FromConfiguration(configuration),
                &metadata_client, read_client);
        ReadSessionResponse response = creator.Create(table, columns, filter);

        std::vector<ReadRowsRequest> requests;
        for (const auto& stream : response.read_session.streams()) {
            ReadRowsRequest request;
            request.set_read_stream(stream.name());
            requests.push_back(request);
        }

        // The read client is held by the handle cache for the whole run
        IdentityTokenCache& token_cache = IdentityTokenCache::Initialize(
                IdentityTokenCache::ExchangeThrough(read_client.get()),
                std::chrono::minutes(settings.token.identity_token_ttl_mins.get()));

        auto start = std::chrono::steady_clock::now();
        StreamCombiner combiner(read_client, requests, configuration.getBufferEntriesPerStream(),
                configuration.getMaxReadRowsRetries(), &token_cache);

        size_t batches = 0;
        int64_t rows = 0;
        size_t bytes = 0;
        while (combiner.HasNext()) {
            ReadRowsResponse batch = combiner.Next();
            batches++;
            rows += batch.row_count();
            bytes += batch.serialized_rows().size();
        }
        double seconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
        for (size_t i = 0; i < combiner.num_streams(); i++) {
            const StreamWorker& worker = combiner.worker(i);
            VLOG(1) << worker.stream_name() << ": " << WorkerStateName(worker.state()) << " at offset "
                    << worker.offset() << " after " << worker.retries() << " retries";
        }

        std::cout << "Read " << rows << " rows in " << batches << " batches from "
                  << requests.size() << " streams of " << response.read_session.name() << std::endl;
        if (seconds > 0) {
            std::cout << "Throughput: " << (bytes / (1024.0 * 1024.0)) / seconds << " MB/s, "
                      << rows / seconds << " rows/s" << std::endl;
        }
    } catch (const SessionExpiredException& e) {
        LOG(ERROR) << "Read session expired while reading " << e.stream() << ": " << e.what();
        return 3;
    } catch (const StreamFailedException& e) {
        LOG(ERROR) << "Reading failed on stream " << e.stream() << " [" << ErrorCodeName(e.code()) << "]: " << e.what();
        return 2;
    } catch (const TributaryException& e) {
        LOG(ERROR) << "[" << ErrorCodeName(e.code()) << "] " << e.what();
        return 1;
    } catch (const std::exception& e) {
        LOG(ERROR) << "Error: " << e.what();
        return 1;
    }
    return 0;
}
