#include "mission_cache.hpp"
#include <iostream>

namespace spychat {

bool MissionContextCache::expired(const Entry& e, std::chrono::steady_clock::time_point now) const {
    if (e.value.ok() || options_.error_ttl.count() <= 0) return false;
    return now - e.inserted_at >= options_.error_ttl;
}

ToolResult MissionContextCache::get(const std::string& key, const Fetch& fetch) {
    std::promise<ToolResult> promise;
    std::shared_future<ToolResult> waiting;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto now = std::chrono::steady_clock::now();
        auto it = entries_.find(key);
        if (it != entries_.end()) {
            if (!expired(it->second, now)) return it->second.value;
            entries_.erase(it);
        }
        auto flight = in_flight_.find(key);
        if (flight != in_flight_.end()) {
            waiting = flight->second;
        } else {
            in_flight_[key] = promise.get_future().share();
        }
    }

    if (waiting.valid()) {
        if (waiting.wait_for(options_.wait_timeout) != std::future_status::ready) {
            std::cerr << "[cache] Timed out waiting for " << key << "\n";
            return ToolResult{"", "Lookup timed out for " + key, ToolStatus::error};
        }
        return waiting.get();
    }

    // Leader: run the fetch without holding the lock.
    ToolResult result;
    bool cacheable = true;
    try {
        std::cerr << "[cache] Fetching " << key << "\n";
        result = fetch(key);
    } catch (const std::exception& e) {
        std::cerr << "[cache] Fetch for " << key << " failed: " << e.what() << "\n";
        result = ToolResult{"", std::string("Lookup failed: ") + e.what(), ToolStatus::error};
        cacheable = false;
    } catch (...) {
        // Waiters still need a settled result and the key must leave in_flight_.
        std::cerr << "[cache] Fetch for " << key << " failed with a non-standard exception\n";
        result = ToolResult{"", "Lookup failed: unknown error", ToolStatus::error};
        cacheable = false;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (cacheable) entries_[key] = Entry{result, std::chrono::steady_clock::now()};
        in_flight_.erase(key);
    }
    promise.set_value(result);
    return result;
}

void MissionContextCache::invalidate(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.erase(key);
}

void MissionContextCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
}

size_t MissionContextCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

} // namespace spychat
