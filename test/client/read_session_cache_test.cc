#include <gtest/gtest.h>
#include "../../src/client/read_session_cache.h"

using namespace Tributary;
using namespace std::chrono_literals;

namespace {

CreateReadSessionRequest RequestFor(const std::string& table, const std::string& filter = "") {
    CreateReadSessionRequest request;
    request.set_parent("projects/p");
    request.mutable_read_session()->set_table(table);
    if (!filter.empty()) {
        request.mutable_read_session()->mutable_read_options()->set_row_restriction(filter);
    }
    request.set_max_stream_count(20000);
    request.set_preferred_min_stream_count(3);
    return request;
}

ReadSession SessionNamed(const std::string& name) {
    ReadSession session;
    session.set_name(name);
    return session;
}

} // namespace

class ReadSessionCacheTest : public ::testing::Test {
protected:
    ReadSessionCache MakeCache(size_t max_entries = ReadSessionCache::kMaxEntries) {
        return ReadSessionCache(5min, max_entries, [this] { return now_; });
    }

    std::chrono::steady_clock::time_point now_{};
};

TEST_F(ReadSessionCacheTest, IdenticalRequestsShareASession) {
    auto cache = MakeCache();
    cache.Put(RequestFor("t"), SessionNamed("s1"));

    auto hit = cache.Get(RequestFor("t"));
    ASSERT_TRUE(hit.has_value());
    EXPECT_EQ(hit->name(), "s1");
}

TEST_F(ReadSessionCacheTest, AnyDifferingFieldMisses) {
    auto cache = MakeCache();
    cache.Put(RequestFor("t", "a > 1"), SessionNamed("s1"));

    EXPECT_FALSE(cache.Get(RequestFor("t", "a > 2")).has_value());
    EXPECT_FALSE(cache.Get(RequestFor("t")).has_value());
    EXPECT_FALSE(cache.Get(RequestFor("u", "a > 1")).has_value());
    EXPECT_TRUE(cache.Get(RequestFor("t", "a > 1")).has_value());
}

TEST_F(ReadSessionCacheTest, EntriesExpireAfterWrite) {
    auto cache = MakeCache();
    cache.Put(RequestFor("t"), SessionNamed("s1"));
    now_ += 4min;
    // Reading does not extend the lifetime
    EXPECT_TRUE(cache.Get(RequestFor("t")).has_value());
    now_ += 1min;
    EXPECT_FALSE(cache.Get(RequestFor("t")).has_value());
    EXPECT_EQ(cache.size(), 0u);
}

TEST_F(ReadSessionCacheTest, EvictsLeastRecentlyUsed) {
    auto cache = MakeCache(2);
    cache.Put(RequestFor("a"), SessionNamed("sa"));
    cache.Put(RequestFor("b"), SessionNamed("sb"));
    ASSERT_TRUE(cache.Get(RequestFor("a")).has_value());

    cache.Put(RequestFor("c"), SessionNamed("sc"));
    EXPECT_EQ(cache.size(), 2u);
    EXPECT_TRUE(cache.Get(RequestFor("a")).has_value());
    EXPECT_FALSE(cache.Get(RequestFor("b")).has_value());
    EXPECT_TRUE(cache.Get(RequestFor("c")).has_value());
}

TEST_F(ReadSessionCacheTest, PutReplacesExistingEntry) {
    auto cache = MakeCache();
    cache.Put(RequestFor("t"), SessionNamed("s1"));
    cache.Put(RequestFor("t"), SessionNamed("s2"));
    EXPECT_EQ(cache.size(), 1u);
    EXPECT_EQ(cache.Get(RequestFor("t"))->name(), "s2");
}

TEST_F(ReadSessionCacheTest, InitializeOnce) {
    ReadSessionCache& first = ReadSessionCache::Initialize(5min);
    ReadSessionCache& second = ReadSessionCache::Initialize(60min);
    EXPECT_EQ(&first, &second);
    EXPECT_EQ(second.ttl(), std::chrono::steady_clock::duration(5min));
}

TEST_F(ReadSessionCacheTest, RejectsZeroCapacity) {
    EXPECT_THROW(ReadSessionCache(5min, 0), std::invalid_argument);
}
