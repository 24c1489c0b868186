#include <atomic>
#include <chrono>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>
#include <gtest/gtest.h>
#include "mission_cache.hpp"

namespace {

using spychat::CacheOptions;
using spychat::MissionContextCache;
using spychat::ToolResult;
using spychat::ToolStatus;

TEST(MissionCacheTest, HitDoesNotFetchAgain) {
    MissionContextCache cache;
    int fetches = 0;
    auto fetch = [&fetches](const std::string& key) {
        fetches++;
        return ToolResult{"", "payload for " + key, ToolStatus::success};
    };

    auto first = cache.get("k", fetch);
    auto second = cache.get("k", fetch);
    EXPECT_EQ(fetches, 1);
    EXPECT_EQ(first.payload, "payload for k");
    EXPECT_EQ(second.payload, first.payload);
    EXPECT_EQ(cache.size(), 1u);
}

TEST(MissionCacheTest, ConcurrentMissesShareOneFetch) {
    MissionContextCache cache;
    std::atomic<int> fetches{0};
    auto fetch = [&fetches](const std::string&) {
        fetches++;
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        return ToolResult{"", "slow answer", ToolStatus::success};
    };

    const int kCallers = 8;
    std::vector<std::string> payloads(kCallers);
    std::vector<std::thread> threads;
    for (int i = 0; i < kCallers; i++) {
        threads.emplace_back([&cache, &fetch, &payloads, i] {
            payloads[i] = cache.get("get_mission_context:{\"mission_id\":\"m1\"}", fetch).payload;
        });
    }
    for (auto& t : threads) t.join();

    EXPECT_EQ(fetches.load(), 1);
    for (auto& p : payloads) EXPECT_EQ(p, "slow answer");
}

TEST(MissionCacheTest, ErrorResultIsCachedByDefault) {
    MissionContextCache cache;
    int fetches = 0;
    auto fetch = [&fetches](const std::string&) {
        fetches++;
        return ToolResult{"", "No mission found with ID: atlas-9", ToolStatus::error};
    };

    auto first = cache.get("atlas-9", fetch);
    auto second = cache.get("atlas-9", fetch);
    EXPECT_EQ(fetches, 1);
    EXPECT_EQ(first.status, ToolStatus::error);
    EXPECT_EQ(second.payload, first.payload);
}

TEST(MissionCacheTest, ErrorTtlExpiresOnlyErrors) {
    CacheOptions opts;
    opts.error_ttl = std::chrono::seconds(1);
    MissionContextCache cache(opts);
    int error_fetches = 0;
    int ok_fetches = 0;

    auto failing = [&error_fetches](const std::string&) {
        error_fetches++;
        return ToolResult{"", "not there", ToolStatus::error};
    };
    auto working = [&ok_fetches](const std::string&) {
        ok_fetches++;
        return ToolResult{"", "there", ToolStatus::success};
    };

    cache.get("bad", failing);
    cache.get("good", working);
    std::this_thread::sleep_for(std::chrono::milliseconds(1100));
    cache.get("bad", failing);
    cache.get("good", working);

    EXPECT_EQ(error_fetches, 2);
    EXPECT_EQ(ok_fetches, 1);
}

TEST(MissionCacheTest, ThrowingFetchIsReportedButNotCached) {
    MissionContextCache cache;
    int calls = 0;
    auto flaky = [&calls](const std::string&) -> ToolResult {
        calls++;
        if (calls == 1) throw std::runtime_error("disk unavailable");
        return ToolResult{"", "recovered", ToolStatus::success};
    };

    auto first = cache.get("m", flaky);
    EXPECT_EQ(first.status, ToolStatus::error);
    EXPECT_NE(first.payload.find("disk unavailable"), std::string::npos);
    EXPECT_EQ(cache.size(), 0u);

    auto second = cache.get("m", flaky);
    EXPECT_TRUE(second.ok());
    EXPECT_EQ(second.payload, "recovered");
}

TEST(MissionCacheTest, NonStandardThrowDoesNotWedgeKey) {
    MissionContextCache cache;
    int calls = 0;
    auto odd = [&calls](const std::string&) -> ToolResult {
        calls++;
        if (calls == 1) throw 42;
        return ToolResult{"", "second try", ToolStatus::success};
    };

    auto first = cache.get("m", odd);
    EXPECT_EQ(first.status, ToolStatus::error);
    EXPECT_EQ(cache.size(), 0u);

    auto second = cache.get("m", odd);
    EXPECT_TRUE(second.ok());
    EXPECT_EQ(second.payload, "second try");
    EXPECT_EQ(calls, 2);
}

TEST(MissionCacheTest, WaiterTimesOutWithErrorResult) {
    CacheOptions opts;
    opts.wait_timeout = std::chrono::seconds(1);
    MissionContextCache cache(opts);

    std::atomic<bool> started{false};
    std::thread leader([&] {
        cache.get("slow", [&started](const std::string&) {
            started = true;
            std::this_thread::sleep_for(std::chrono::milliseconds(2500));
            return ToolResult{"", "late", ToolStatus::success};
        });
    });
    while (!started) std::this_thread::sleep_for(std::chrono::milliseconds(5));

    int waiter_fetches = 0;
    auto result = cache.get("slow", [&waiter_fetches](const std::string&) {
        waiter_fetches++;
        return ToolResult{"", "should not run", ToolStatus::success};
    });
    leader.join();

    EXPECT_EQ(result.status, ToolStatus::error);
    EXPECT_EQ(waiter_fetches, 0);
}

TEST(MissionCacheTest, InvalidateAndClearForceRefetch) {
    MissionContextCache cache;
    int fetches = 0;
    auto fetch = [&fetches](const std::string&) {
        fetches++;
        return ToolResult{"", "v", ToolStatus::success};
    };

    cache.get("a", fetch);
    cache.get("b", fetch);
    cache.invalidate("a");
    cache.get("a", fetch);
    EXPECT_EQ(fetches, 3);

    cache.clear();
    EXPECT_EQ(cache.size(), 0u);
    cache.get("b", fetch);
    EXPECT_EQ(fetches, 4);
}

}  // namespace
