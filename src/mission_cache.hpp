#pragma once
#include <string>
#include <map>
#include <mutex>
#include <future>
#include <chrono>
#include <functional>

namespace spychat {

enum class ToolStatus { success, error };

struct ToolResult {
    std::string invocation_id;
    std::string payload;
    ToolStatus status = ToolStatus::success;

    bool ok() const { return status == ToolStatus::success; }
};

struct CacheOptions {
    // 0 keeps error results until invalidated.
    std::chrono::seconds error_ttl{0};
    std::chrono::seconds wait_timeout{30};
};

// Memoizes tool lookups by key with at most one fetch in flight per key.
// Concurrent callers for a missing key wait on the leader's result.
class MissionContextCache {
public:
    using Fetch = std::function<ToolResult(const std::string& key)>;

    explicit MissionContextCache(CacheOptions options = {}) : options_(options) {}

    ToolResult get(const std::string& key, const Fetch& fetch);

    void invalidate(const std::string& key);
    void clear();
    size_t size() const;

private:
    struct Entry {
        ToolResult value;
        std::chrono::steady_clock::time_point inserted_at;
    };

    CacheOptions options_;
    mutable std::mutex mutex_;
    std::map<std::string, Entry> entries_;
    std::map<std::string, std::shared_future<ToolResult>> in_flight_;

    bool expired(const Entry& e, std::chrono::steady_clock::time_point now) const;
};

} // namespace spychat
