#include <gtest/gtest.h>
#include "../../src/common/configuration.h"

#include <cstdio>
#include <cstdlib>
#include <fstream>

using namespace Tributary;

class ConfigurationTest : public ::testing::Test {
protected:
    void SetUp() override {
        Configuration::getInstance().reset();
    }

    void TearDown() override {
        unsetenv("TRIBUTARY_READ_BUFFER_ENTRIES_PER_STREAM");
        unsetenv("TRIBUTARY_SESSION_CACHE_ENABLED");
        unsetenv("TRIBUTARY_SESSION_SNAPSHOT_TIME_MILLIS");
        Configuration::getInstance().reset();
    }

    Configuration& config() { return Configuration::getInstance(); }
};

TEST_F(ConfigurationTest, Defaults) {
    const TributaryConfig& c = config().config();
    EXPECT_EQ(c.read.buffer_entries_per_stream.get(), 3);
    EXPECT_EQ(c.read.max_read_rows_retries.get(), 3);
    EXPECT_EQ(c.session.default_parallelism.get(), 1);
    EXPECT_TRUE(c.session.cache_enabled.get());
    EXPECT_EQ(c.session.cache_duration_mins.get(), 5);
    EXPECT_FALSE(c.session.views_enabled.get());
    EXPECT_EQ(c.session.snapshot_time_millis.get(), -1);
    EXPECT_EQ(c.client.channel_pool_size.get(), 1);
    EXPECT_EQ(c.token.identity_token_ttl_mins.get(), 50);
    EXPECT_TRUE(config().validate());
}

TEST_F(ConfigurationTest, LoadsYaml) {
    ASSERT_TRUE(config().loadFromString(R"(
tributary:
  read:
    buffer_entries_per_stream: 8
    max_read_rows_retries: 5
  session:
    cache_enabled: false
    cache_duration_mins: 30
  client:
    endpoint: storage.example.com:443
    channel_pool_size: 4
  token:
    identity_token_ttl_mins: 20
)"));
    EXPECT_EQ(config().getBufferEntriesPerStream(), 8);
    EXPECT_EQ(config().getMaxReadRowsRetries(), 5);
    EXPECT_EQ(config().getChannelPoolSize(), 4);
    EXPECT_FALSE(config().config().session.cache_enabled.get());
    EXPECT_EQ(config().config().session.cache_duration_mins.get(), 30);
    EXPECT_EQ(config().config().client.endpoint.get(), "storage.example.com:443");
    EXPECT_EQ(config().config().token.identity_token_ttl_mins.get(), 20);
    // Untouched keys keep their defaults
    EXPECT_EQ(config().config().session.default_parallelism.get(), 1);
}

TEST_F(ConfigurationTest, LoadsFile) {
    std::string path = ::testing::TempDir() + "tributary_config_test.yaml";
    {
        std::ofstream file(path);
        file << "tributary:\n  read:\n    max_read_rows_retries: 0\n";
    }
    EXPECT_TRUE(config().loadFromFile(path));
    EXPECT_EQ(config().getMaxReadRowsRetries(), 0);
    std::remove(path.c_str());

    EXPECT_FALSE(config().loadFromFile("/nonexistent/tributary.yaml"));
}

TEST_F(ConfigurationTest, MissingRootKeepsDefaults) {
    EXPECT_TRUE(config().loadFromString("other:\n  read:\n    buffer_entries_per_stream: 9\n"));
    EXPECT_EQ(config().getBufferEntriesPerStream(), 3);
}

TEST_F(ConfigurationTest, MalformedYaml) {
    EXPECT_FALSE(config().loadFromString("tributary: [unclosed"));
}

TEST_F(ConfigurationTest, ValidationRejectsOutOfRangeValues) {
    EXPECT_FALSE(config().loadFromString(R"(
tributary:
  read:
    buffer_entries_per_stream: 0
    max_read_rows_retries: -1
  client:
    channel_pool_size: 0
)"));
    auto errors = config().getValidationErrors();
    EXPECT_EQ(errors.size(), 3u);
}

TEST_F(ConfigurationTest, EnvironmentOverridesFile) {
    ASSERT_TRUE(config().loadFromString("tributary:\n  read:\n    buffer_entries_per_stream: 8\n"));
    setenv("TRIBUTARY_READ_BUFFER_ENTRIES_PER_STREAM", "16", 1);
    setenv("TRIBUTARY_SESSION_CACHE_ENABLED", "false", 1);
    setenv("TRIBUTARY_SESSION_SNAPSHOT_TIME_MILLIS", "1700000000000", 1);

    EXPECT_EQ(config().getBufferEntriesPerStream(), 16);
    EXPECT_FALSE(config().config().session.cache_enabled.get());
    EXPECT_EQ(config().config().session.snapshot_time_millis.get(), 1700000000000);
}

TEST_F(ConfigurationTest, InvalidEnvironmentValueFallsBack) {
    setenv("TRIBUTARY_READ_BUFFER_ENTRIES_PER_STREAM", "many", 1);
    setenv("TRIBUTARY_SESSION_CACHE_ENABLED", "perhaps", 1);
    EXPECT_EQ(config().getBufferEntriesPerStream(), 3);
    EXPECT_TRUE(config().config().session.cache_enabled.get());
}
