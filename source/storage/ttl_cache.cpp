#include "storage/ttl_cache.hpp"
#include "utils/debug_log.hpp"

#include <utility>

namespace storage {

TtlCache::TtlCache(CacheClock::duration sweep_interval)
    : sweep_interval_(sweep_interval) {
    worker_ = std::thread(&TtlCache::worker_loop, this);
}

TtlCache::~TtlCache() {
    shutdown();
}

void TtlCache::set(const std::string &key, json value, CacheClock::duration ttl) {
    std::unique_lock<std::shared_mutex> lock(entries_mutex_);
    CacheEntry &entry = entries_[key];
    entry.value = std::move(value);
    entry.expires_at = CacheClock::now() + ttl;
}

bool TtlCache::get(const std::string &key, json &value) {
    return lookup(key, value, nullptr);
}

bool TtlCache::get_with_ttl(const std::string &key, json &value, CacheClock::duration &remaining_ttl) {
    return lookup(key, value, &remaining_ttl);
}

bool TtlCache::lookup(const std::string &key, json &value, CacheClock::duration *remaining_ttl) {
    bool expired = false;
    {
        std::shared_lock<std::shared_mutex> lock(entries_mutex_);
        auto iterator = entries_.find(key);
        if (iterator == entries_.end()) {
            return false;
        }

        CacheClock::time_point now = CacheClock::now();
        if (now > iterator->second.expires_at) {
            expired = true;
        } else {
            value = iterator->second.value;
            if (remaining_ttl != nullptr) {
                *remaining_ttl = iterator->second.expires_at - now;
            }
        }
    }

    if (expired) {
        schedule_deletion(key);
        return false;
    }
    return true;
}

void TtlCache::remove(const std::string &key) {
    std::unique_lock<std::shared_mutex> lock(entries_mutex_);
    entries_.erase(key);
}

void TtlCache::clear() {
    std::unique_lock<std::shared_mutex> lock(entries_mutex_);
    entries_.clear();
}

std::size_t TtlCache::size() const {
    std::shared_lock<std::shared_mutex> lock(entries_mutex_);
    return entries_.size();
}

std::vector<std::string> TtlCache::keys() const {
    std::shared_lock<std::shared_mutex> lock(entries_mutex_);
    std::vector<std::string> result;
    result.reserve(entries_.size());
    for (const auto &entry : entries_) {
        result.push_back(entry.first);
    }
    return result;
}

std::size_t TtlCache::sweep_expired() {
    std::unique_lock<std::shared_mutex> lock(entries_mutex_);
    CacheClock::time_point now = CacheClock::now();
    std::size_t removed_count = 0;
    for (auto iterator = entries_.begin(); iterator != entries_.end();) {
        if (now > iterator->second.expires_at) {
            iterator = entries_.erase(iterator);
            removed_count++;
        } else {
            ++iterator;
        }
    }
    return removed_count;
}

void TtlCache::shutdown() {
    {
        std::lock_guard<std::mutex> lock(worker_mutex_);
        if (stopping_) {
            return;
        }
        stopping_ = true;
    }
    worker_condition_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
}

void TtlCache::schedule_deletion(const std::string &key) {
    {
        std::lock_guard<std::mutex> lock(worker_mutex_);
        if (stopping_) {
            return;
        }
        pending_deletions_.insert(key);
    }
    worker_condition_.notify_one();
}

void TtlCache::apply_deletions(const std::unordered_set<std::string> &pending_keys) {
    std::unique_lock<std::shared_mutex> lock(entries_mutex_);
    CacheClock::time_point now = CacheClock::now();
    for (const auto &key : pending_keys) {
        auto iterator = entries_.find(key);
        // A set() after the expired read replaced the entry; keep the new one.
        if (iterator != entries_.end() && now > iterator->second.expires_at) {
            entries_.erase(iterator);
        }
    }
}

void TtlCache::worker_loop() {
    std::unique_lock<std::mutex> lock(worker_mutex_);
    CacheClock::time_point next_sweep = CacheClock::now() + sweep_interval_;

    while (true) {
        worker_condition_.wait_until(lock, next_sweep, [this] {
            return stopping_ || !pending_deletions_.empty();
        });

        std::unordered_set<std::string> pending_keys;
        pending_keys.swap(pending_deletions_);
        bool stop_now = stopping_;
        bool sweep_due = CacheClock::now() >= next_sweep;
        lock.unlock();

        if (!pending_keys.empty()) {
            apply_deletions(pending_keys);
        }
        if (sweep_due && !stop_now) {
            std::size_t removed_count = sweep_expired();
            if (removed_count > 0) {
                debug_log::log("Cache sweep removed " + std::to_string(removed_count) + " expired entr" +
                               (removed_count == 1 ? "y" : "ies"));
            }
        }

        lock.lock();
        if (stop_now) {
            break;
        }
        if (sweep_due) {
            next_sweep = CacheClock::now() + sweep_interval_;
        }
    }
}

} // namespace storage
