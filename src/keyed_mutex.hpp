#pragma once
#include <string>
#include <mutex>
#include <memory>
#include <unordered_map>

namespace spychat {

// One mutex per string key, created on first use and dropped once the last
// holder or waiter releases it, so idle keys cost nothing.
class KeyedMutex {
    struct Entry {
        std::mutex mutex;
        int users = 0;
    };

public:
    class Guard {
    public:
        Guard(KeyedMutex* owner, std::string key, std::shared_ptr<Entry> entry)
            : owner_(owner), key_(std::move(key)), entry_(std::move(entry)) {}

        Guard(Guard&& o) noexcept
            : owner_(o.owner_), key_(std::move(o.key_)), entry_(std::move(o.entry_)) {
            o.owner_ = nullptr;
        }

        Guard(const Guard&) = delete;
        Guard& operator=(const Guard&) = delete;
        Guard& operator=(Guard&&) = delete;

        ~Guard() {
            if (!owner_ || !entry_) return;
            entry_->mutex.unlock();
            owner_->release(key_, entry_);
        }

    private:
        KeyedMutex* owner_;
        std::string key_;
        std::shared_ptr<Entry> entry_;
    };

    Guard lock(const std::string& key) {
        std::shared_ptr<Entry> entry;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto& slot = entries_[key];
            if (!slot) slot = std::make_shared<Entry>();
            slot->users++;
            entry = slot;
        }
        entry->mutex.lock();
        return Guard(this, key, std::move(entry));
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_.size();
    }

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<Entry>> entries_;

    void release(const std::string& key, const std::shared_ptr<Entry>& entry) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (--entry->users == 0) {
            auto it = entries_.find(key);
            if (it != entries_.end() && it->second == entry) entries_.erase(it);
        }
    }
};

} // namespace spychat
