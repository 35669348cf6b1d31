#include "configuration.h"
#include <algorithm>
#include <cstdlib>
#include <glog/logging.h>
#include <yaml-cpp/yaml.h>

namespace Tributary {

// Global function to get configuration instance
const Configuration& GetConfig() {
    return Configuration::getInstance();
}

// Template specializations for environment variable parsing
template<>
std::optional<int> ConfigValue<int>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        try {
            return std::stoi(env_val);
        } catch (const std::exception& e) {
            LOG(WARNING) << "Failed to parse env var " << env_var_ << ": " << e.what();
        }
    }
    return std::nullopt;
}

template<>
std::optional<int64_t> ConfigValue<int64_t>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        try {
            return static_cast<int64_t>(std::stoll(env_val));
        } catch (const std::exception& e) {
            LOG(WARNING) << "Failed to parse env var " << env_var_ << ": " << e.what();
        }
    }
    return std::nullopt;
}

template<>
std::optional<std::string> ConfigValue<std::string>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        return std::string(env_val);
    }
    return std::nullopt;
}

template<>
std::optional<bool> ConfigValue<bool>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        std::string val(env_val);
        std::transform(val.begin(), val.end(), val.begin(), ::tolower);
        if (val == "true" || val == "1" || val == "yes" || val == "on") {
            return true;
        } else if (val == "false" || val == "0" || val == "no" || val == "off") {
            return false;
        }
        LOG(WARNING) << "Invalid boolean value for env var " << env_var_ << ": " << env_val;
    }
    return std::nullopt;
}

Configuration& Configuration::getInstance() {
    static Configuration instance;
    return instance;
}

bool Configuration::loadFromFile(const std::string& filename) {
    try {
        YAML::Node yaml = YAML::LoadFile(filename);
        parseYAMLNode(yaml);
        return validateConfig();
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "Failed to parse configuration file: " << e.what();
        return false;
    }
}

bool Configuration::loadFromString(const std::string& yaml_content) {
    try {
        YAML::Node yaml = YAML::Load(yaml_content);
        parseYAMLNode(yaml);
        return validateConfig();
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "Failed to parse configuration string: " << e.what();
        return false;
    }
}

void Configuration::parseYAMLNode(const YAML::Node& yaml) {
    if (!yaml["tributary"]) {
        LOG(WARNING) << "Configuration has no 'tributary' root, keeping defaults";
        return;
    }
    auto root = yaml["tributary"];

    // Read
    if (root["read"]) {
        auto read = root["read"];
        if (read["buffer_entries_per_stream"]) config_.read.buffer_entries_per_stream.set(read["buffer_entries_per_stream"].as<int>());
        if (read["max_read_rows_retries"]) config_.read.max_read_rows_retries.set(read["max_read_rows_retries"].as<int>());
    }

    // Session
    if (root["session"]) {
        auto session = root["session"];
        if (session["default_parallelism"]) config_.session.default_parallelism.set(session["default_parallelism"].as<int>());
        if (session["preferred_min_parallelism"]) config_.session.preferred_min_parallelism.set(session["preferred_min_parallelism"].as<int>());
        if (session["max_parallelism"]) config_.session.max_parallelism.set(session["max_parallelism"].as<int>());
        if (session["cache_enabled"]) config_.session.cache_enabled.set(session["cache_enabled"].as<bool>());
        if (session["cache_duration_mins"]) config_.session.cache_duration_mins.set(session["cache_duration_mins"].as<int>());
        if (session["views_enabled"]) config_.session.views_enabled.set(session["views_enabled"].as<bool>());
        if (session["materialization_project"]) config_.session.materialization_project.set(session["materialization_project"].as<std::string>());
        if (session["materialization_dataset"]) config_.session.materialization_dataset.set(session["materialization_dataset"].as<std::string>());
        if (session["materialization_expiration_minutes"]) config_.session.materialization_expiration_minutes.set(session["materialization_expiration_minutes"].as<int>());
        if (session["snapshot_time_millis"]) config_.session.snapshot_time_millis.set(session["snapshot_time_millis"].as<int64_t>());
        if (session["data_format"]) config_.session.data_format.set(session["data_format"].as<std::string>());
        if (session["arrow_compression"]) config_.session.arrow_compression.set(session["arrow_compression"].as<std::string>());
        if (session["response_compression"]) config_.session.response_compression.set(session["response_compression"].as<std::string>());
        if (session["trace_id"]) config_.session.trace_id.set(session["trace_id"].as<std::string>());
        if (session["request_encoded_base"]) config_.session.request_encoded_base.set(session["request_encoded_base"].as<std::string>());
    }

    // Client
    if (root["client"]) {
        auto client = root["client"];
        if (client["endpoint"]) config_.client.endpoint.set(client["endpoint"].as<std::string>());
        if (client["parent_project"]) config_.client.parent_project.set(client["parent_project"].as<std::string>());
        if (client["channel_pool_size"]) config_.client.channel_pool_size.set(client["channel_pool_size"].as<int>());
        if (client["user_agent"]) config_.client.user_agent.set(client["user_agent"].as<std::string>());
        if (client["use_insecure"]) config_.client.use_insecure.set(client["use_insecure"].as<bool>());

        if (client["proxy"]) {
            auto proxy = client["proxy"];
            if (proxy["uri"]) config_.client.proxy.uri.set(proxy["uri"].as<std::string>());
            if (proxy["username"]) config_.client.proxy.username.set(proxy["username"].as<std::string>());
            if (proxy["password"]) config_.client.proxy.password.set(proxy["password"].as<std::string>());
        }

        if (client["credentials"]) {
            auto credentials = client["credentials"];
            if (credentials["credentials_file"]) config_.client.credentials.credentials_file.set(credentials["credentials_file"].as<std::string>());
            if (credentials["access_token"]) config_.client.credentials.access_token.set(credentials["access_token"].as<std::string>());
            if (credentials["impersonate_service_account"]) config_.client.credentials.impersonate_service_account.set(credentials["impersonate_service_account"].as<std::string>());
        }
    }

    // Token
    if (root["token"]) {
        auto token = root["token"];
        if (token["identity_token_ttl_mins"]) config_.token.identity_token_ttl_mins.set(token["identity_token_ttl_mins"].as<int>());
    }
}

bool Configuration::validate() const {
    validation_errors_.clear();

    if (config_.read.buffer_entries_per_stream.get() <= 0) {
        validation_errors_.push_back("Buffer entries per stream must be positive");
    }

    if (config_.read.max_read_rows_retries.get() < 0) {
        validation_errors_.push_back("Max read rows retries cannot be negative");
    }

    if (config_.session.default_parallelism.get() < 1) {
        validation_errors_.push_back("Default parallelism must be at least 1");
    }

    if (config_.session.preferred_min_parallelism.get() < 0 || config_.session.max_parallelism.get() < 0) {
        validation_errors_.push_back("Parallelism bounds cannot be negative");
    }

    if (config_.session.cache_duration_mins.get() < 0) {
        validation_errors_.push_back("Read session cache duration cannot be negative");
    }

    if (config_.client.channel_pool_size.get() < 1) {
        validation_errors_.push_back("Channel pool size must be at least 1");
    }

    if (config_.client.endpoint.get().empty()) {
        validation_errors_.push_back("Client endpoint must be set");
    }

    if (config_.token.identity_token_ttl_mins.get() < 1) {
        validation_errors_.push_back("Identity token TTL must be at least 1 minute");
    }

    return validation_errors_.empty();
}

std::vector<std::string> Configuration::getValidationErrors() const {
    return validation_errors_;
}

bool Configuration::validateConfig() {
    bool valid = validate();
    for (const auto& err : validation_errors_) {
        LOG(ERROR) << "Invalid configuration: " << err;
    }
    return valid;
}

} // namespace Tributary
