#ifndef TRIBUTARY_CONFIGURATION_H_
#define TRIBUTARY_CONFIGURATION_H_

#include <string>
#include <memory>
#include <optional>
#include <vector>
#include <cstdint>

namespace YAML {
class Node;
}

namespace Tributary {

/**
 * Configuration value that can be overridden by environment variables
 */
template<typename T>
class ConfigValue {
public:
    ConfigValue() = default;
    ConfigValue(T default_value, const std::string& env_var = "")
        : value_(default_value), env_var_(env_var) {}

    T get() const {
        if (!env_var_.empty()) {
            auto env_value = getEnvValue();
            if (env_value.has_value()) {
                return env_value.value();
            }
        }
        return value_;
    }

    void set(T value) { value_ = value; }
    const std::string& env_var() const { return env_var_; }

private:
    T value_;
    std::string env_var_;

    std::optional<T> getEnvValue() const;
};

/**
 * Main configuration structure
 */
struct TributaryConfig {
    // Stream combiner
    struct Read {
        ConfigValue<int> buffer_entries_per_stream{3, "TRIBUTARY_READ_BUFFER_ENTRIES_PER_STREAM"};
        ConfigValue<int> max_read_rows_retries{3, "TRIBUTARY_READ_MAX_RETRIES"};
    } read;

    // Read session planning
    struct Session {
        ConfigValue<int> default_parallelism{1, "TRIBUTARY_SESSION_DEFAULT_PARALLELISM"};
        // 0 means "derive from default_parallelism"
        ConfigValue<int> preferred_min_parallelism{0, "TRIBUTARY_SESSION_PREFERRED_MIN_PARALLELISM"};
        // 0 means "use the service maximum"
        ConfigValue<int> max_parallelism{0, "TRIBUTARY_SESSION_MAX_PARALLELISM"};
        ConfigValue<bool> cache_enabled{true, "TRIBUTARY_SESSION_CACHE_ENABLED"};
        ConfigValue<int> cache_duration_mins{5, "TRIBUTARY_SESSION_CACHE_DURATION_MINS"};
        ConfigValue<bool> views_enabled{false, "TRIBUTARY_SESSION_VIEWS_ENABLED"};
        ConfigValue<std::string> materialization_project{"", "TRIBUTARY_SESSION_MATERIALIZATION_PROJECT"};
        ConfigValue<std::string> materialization_dataset{"", "TRIBUTARY_SESSION_MATERIALIZATION_DATASET"};
        ConfigValue<int> materialization_expiration_minutes{1440, "TRIBUTARY_SESSION_MATERIALIZATION_EXPIRATION"};
        // -1 means "read latest"
        ConfigValue<int64_t> snapshot_time_millis{-1, "TRIBUTARY_SESSION_SNAPSHOT_TIME_MILLIS"};
        ConfigValue<std::string> data_format{"ARROW", "TRIBUTARY_SESSION_DATA_FORMAT"};
        ConfigValue<std::string> arrow_compression{"NONE", "TRIBUTARY_SESSION_ARROW_COMPRESSION"};
        ConfigValue<std::string> response_compression{"NONE", "TRIBUTARY_SESSION_RESPONSE_COMPRESSION"};
        ConfigValue<std::string> trace_id{"", "TRIBUTARY_SESSION_TRACE_ID"};
        // Base64 encoded CreateReadSessionRequest used as a template
        ConfigValue<std::string> request_encoded_base{"", "TRIBUTARY_SESSION_REQUEST_ENCODED_BASE"};
    } session;

    // Client handles
    struct Client {
        ConfigValue<std::string> endpoint{"localhost:8443", "TRIBUTARY_CLIENT_ENDPOINT"};
        ConfigValue<std::string> parent_project{"", "TRIBUTARY_CLIENT_PARENT_PROJECT"};
        ConfigValue<int> channel_pool_size{1, "TRIBUTARY_CLIENT_CHANNEL_POOL_SIZE"};
        ConfigValue<std::string> user_agent{"tributary/1.0", "TRIBUTARY_CLIENT_USER_AGENT"};
        ConfigValue<bool> use_insecure{false, "TRIBUTARY_CLIENT_USE_INSECURE"};

        struct Proxy {
            ConfigValue<std::string> uri{"", "TRIBUTARY_CLIENT_PROXY_URI"};
            ConfigValue<std::string> username{"", "TRIBUTARY_CLIENT_PROXY_USERNAME"};
            ConfigValue<std::string> password{"", "TRIBUTARY_CLIENT_PROXY_PASSWORD"};
        } proxy;

        struct Credentials {
            ConfigValue<std::string> credentials_file{"", "TRIBUTARY_CLIENT_CREDENTIALS_FILE"};
            ConfigValue<std::string> access_token{"", "TRIBUTARY_CLIENT_ACCESS_TOKEN"};
            ConfigValue<std::string> impersonate_service_account{"", "TRIBUTARY_CLIENT_IMPERSONATE"};
        } credentials;
    } client;

    struct Token {
        ConfigValue<int> identity_token_ttl_mins{50, "TRIBUTARY_IDENTITY_TOKEN_TTL_MINS"};
    } token;
};

/**
 * Configuration manager singleton
 */
class Configuration {
public:
    static Configuration& getInstance();

    // Load configuration from file
    bool loadFromFile(const std::string& filename);

    // Load configuration from YAML string
    bool loadFromString(const std::string& yaml_content);

    // Get the configuration
    const TributaryConfig& config() const { return config_; }
    TributaryConfig& config() { return config_; }

    // Helper methods for common access patterns
    int getBufferEntriesPerStream() const { return config_.read.buffer_entries_per_stream.get(); }
    int getMaxReadRowsRetries() const { return config_.read.max_read_rows_retries.get(); }
    int getChannelPoolSize() const { return config_.client.channel_pool_size.get(); }

    // Validation
    bool validate() const;
    std::vector<std::string> getValidationErrors() const;

    // Restores compiled-in defaults (tests load several documents in one process)
    void reset() { config_ = TributaryConfig(); }

private:
    Configuration() = default;
    Configuration(const Configuration&) = delete;
    Configuration& operator=(const Configuration&) = delete;

    TributaryConfig config_;
    mutable std::vector<std::string> validation_errors_;

    void parseYAMLNode(const YAML::Node& root);
    bool validateConfig();
};

// Global accessor
const Configuration& GetConfig();

// Template specializations for getEnvValue
template<>
std::optional<int> ConfigValue<int>::getEnvValue() const;

template<>
std::optional<int64_t> ConfigValue<int64_t>::getEnvValue() const;

template<>
std::optional<std::string> ConfigValue<std::string>::getEnvValue() const;

template<>
std::optional<bool> ConfigValue<bool>::getEnvValue() const;

} // namespace Tributary

#endif // TRIBUTARY_CONFIGURATION_H_
