#ifndef SYSMCPS_TTL_CACHE_HPP
#define SYSMCPS_TTL_CACHE_HPP

// In-memory key/value cache with per-entry expiry.
//
// Expired entries are never returned. They are removed lazily (a read that
// finds an expired entry hands the key to the background worker) and by a
// periodic sweep on the same worker thread. The worker is started by the
// constructor and joined by shutdown() or the destructor.

#include <nlohmann/json.hpp>

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace storage {

using json = nlohmann::json;
using CacheClock = std::chrono::steady_clock;

constexpr std::chrono::minutes DEFAULT_SWEEP_INTERVAL{5};

struct CacheEntry {
    json value;
    CacheClock::time_point expires_at;
};

class TtlCache {
public:
    explicit TtlCache(CacheClock::duration sweep_interval = DEFAULT_SWEEP_INTERVAL);
    ~TtlCache();

    TtlCache(const TtlCache &) = delete;
    TtlCache &operator=(const TtlCache &) = delete;

    // Store value until now + ttl, replacing any entry under key.
    void set(const std::string &key, json value, CacheClock::duration ttl);

    // Returns false when key is absent or expired.
    bool get(const std::string &key, json &value);

    // As get(), also reporting the time left before expiry.
    bool get_with_ttl(const std::string &key, json &value, CacheClock::duration &remaining_ttl);

    void remove(const std::string &key);
    void clear();

    std::size_t size() const;
    std::vector<std::string> keys() const;

    // Remove every expired entry now. Returns the number removed.
    std::size_t sweep_expired();

    // Stop the background worker. Pending lazy deletions are applied first.
    // Safe to call more than once.
    void shutdown();

private:
    bool lookup(const std::string &key, json &value, CacheClock::duration *remaining_ttl);
    void schedule_deletion(const std::string &key);
    void apply_deletions(const std::unordered_set<std::string> &pending_keys);
    void worker_loop();

    std::unordered_map<std::string, CacheEntry> entries_;
    mutable std::shared_mutex entries_mutex_;

    CacheClock::duration sweep_interval_;
    std::unordered_set<std::string> pending_deletions_;
    bool stopping_ = false;
    std::mutex worker_mutex_;
    std::condition_variable worker_condition_;
    std::thread worker_;
};

} // namespace storage

#endif // SYSMCPS_TTL_CACHE_HPP
