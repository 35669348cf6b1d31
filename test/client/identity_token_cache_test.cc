#include <gtest/gtest.h>
#include "../../src/client/identity_token_cache.h"
#include "fake_storage_client.h"

#include <map>

using namespace Tributary;
using namespace std::chrono_literals;

class IdentityTokenCacheTest : public ::testing::Test {
protected:
    IdentityTokenCache MakeCache(std::chrono::steady_clock::duration ttl = 50min) {
        return IdentityTokenCache(
            [this](const std::string& session) -> std::optional<std::string> {
                loads_[session]++;
                if (session == "no-token") {
                    return std::nullopt;
                }
                return "token-for-" + session;
            },
            ttl,
            [this] { return now_; });
    }

    std::map<std::string, int> loads_;
    std::chrono::steady_clock::time_point now_{};
};

TEST_F(IdentityTokenCacheTest, LoadsOncePerSession) {
    auto cache = MakeCache();
    EXPECT_EQ(cache.Get("a"), std::optional<std::string>("token-for-a"));
    EXPECT_EQ(cache.Get("a"), std::optional<std::string>("token-for-a"));
    EXPECT_EQ(cache.Get("b"), std::optional<std::string>("token-for-b"));
    EXPECT_EQ(loads_["a"], 1);
    EXPECT_EQ(loads_["b"], 1);
    EXPECT_EQ(cache.size(), 2u);
}

TEST_F(IdentityTokenCacheTest, CachesAbsentTokens) {
    auto cache = MakeCache();
    EXPECT_FALSE(cache.Get("no-token").has_value());
    EXPECT_FALSE(cache.Get("no-token").has_value());
    EXPECT_EQ(loads_["no-token"], 1);
}

TEST_F(IdentityTokenCacheTest, ReloadsAfterExpiry) {
    auto cache = MakeCache(10min);
    cache.Get("a");
    now_ += 9min;
    cache.Get("a");
    EXPECT_EQ(loads_["a"], 1);
    now_ += 1min;
    cache.Get("a");
    EXPECT_EQ(loads_["a"], 2);
}

TEST_F(IdentityTokenCacheTest, InvalidateForcesReload) {
    auto cache = MakeCache();
    cache.Get("a");
    cache.Invalidate("a");
    cache.Get("a");
    EXPECT_EQ(loads_["a"], 2);
}

TEST_F(IdentityTokenCacheTest, LoaderFailureIsNotCached) {
    int calls = 0;
    IdentityTokenCache cache([&calls](const std::string&) -> std::optional<std::string> {
        if (calls++ == 0) {
            throw std::runtime_error("unavailable");
        }
        return "ok";
    });
    EXPECT_THROW(cache.Get("a"), std::runtime_error);
    EXPECT_EQ(cache.size(), 0u);
    EXPECT_EQ(cache.Get("a"), std::optional<std::string>("ok"));
}

TEST_F(IdentityTokenCacheTest, ExchangesThroughClient) {
    fakes::FakeStorageReadClient client;
    client.SetToken("projects/p/sessions/s", "abc");
    IdentityTokenCache cache(IdentityTokenCache::ExchangeThrough(&client));

    EXPECT_EQ(cache.Get("projects/p/sessions/s"), std::optional<std::string>("abc"));
    EXPECT_FALSE(cache.Get("projects/p/sessions/other").has_value());
    EXPECT_EQ(client.exchanges(), 2);
}

TEST_F(IdentityTokenCacheTest, InitializeKeepsFirstInstance) {
    IdentityTokenCache& first = IdentityTokenCache::Initialize(
        [](const std::string&) -> std::optional<std::string> { return "first"; });
    IdentityTokenCache& second = IdentityTokenCache::Initialize(
        [](const std::string&) -> std::optional<std::string> { return "second"; });
    EXPECT_EQ(&first, &second);
    EXPECT_EQ(second.Get("x"), std::optional<std::string>("first"));
}

TEST(ParseReadSessionIdTest, StripsStreamSuffix) {
    EXPECT_EQ(ParseReadSessionId("projects/p/locations/l/sessions/s/streams/0"),
              "projects/p/locations/l/sessions/s");
    EXPECT_EQ(ParseReadSessionId("not-a-stream-name"), "not-a-stream-name");
}
