// Tests for the TTL cache: expiry, lazy deletion and the periodic sweep.

#include "storage/ttl_cache.hpp"
#include "test_support.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <chrono>
#include <string>
#include <thread>

using json = nlohmann::json;
using test_support::expect;

namespace test_ttl_cache {

// Poll cache.size() until it reaches expected_size or timeout elapses.
static bool wait_for_size(const storage::TtlCache &cache, std::size_t expected_size,
                          std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (cache.size() == expected_size) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return cache.size() == expected_size;
}

static bool test_set_then_get() {
    storage::TtlCache cache;
    cache.set("memory_info", json{{"total", 1024}}, std::chrono::seconds(10));

    json value;
    bool success = expect(cache.get("memory_info", value) && value["total"] == 1024, "fresh entry is returned");
    success &= expect(!cache.get("missing", value), "absent key misses");

    cache.set("memory_info", json{{"total", 2048}}, std::chrono::seconds(10));
    success &= expect(cache.get("memory_info", value) && value["total"] == 2048, "set replaces an existing entry");
    success &= expect(cache.size() == 1, "replacement keeps a single entry");
    return success;
}

static bool test_expired_entry_is_never_returned() {
    storage::TtlCache cache;
    cache.set("short", json("value"), std::chrono::milliseconds(30));
    std::this_thread::sleep_for(std::chrono::milliseconds(80));

    json value = "untouched";
    bool success = expect(!cache.get("short", value), "expired entry misses");
    success &= expect(value == "untouched", "output is left unchanged on a miss");
    success &= expect(wait_for_size(cache, 0, std::chrono::milliseconds(2000)),
                      "expired entry is removed after an expired read");
    return success;
}

static bool test_set_after_expiry_survives_lazy_deletion() {
    storage::TtlCache cache;
    cache.set("key", json(1), std::chrono::milliseconds(20));
    std::this_thread::sleep_for(std::chrono::milliseconds(60));

    json value;
    cache.get("key", value); // schedules deletion of the stale entry
    cache.set("key", json(2), std::chrono::seconds(30));
    std::this_thread::sleep_for(std::chrono::milliseconds(100));

    return expect(cache.get("key", value) && value == 2, "newer entry is not removed by pending deletion");
}

static bool test_get_with_ttl() {
    storage::TtlCache cache;
    cache.set("cpu_info_1s", json::array({1, 2}), std::chrono::seconds(30));

    json value;
    storage::CacheClock::duration remaining{};
    bool found = cache.get_with_ttl("cpu_info_1s", value, remaining);
    bool success = expect(found && value.size() == 2, "get_with_ttl returns the value");
    success &= expect(remaining > std::chrono::seconds(25) && remaining <= std::chrono::seconds(30),
                      "remaining ttl is close to the configured ttl");
    return success;
}

static bool test_periodic_sweep() {
    storage::TtlCache cache(std::chrono::milliseconds(50));
    cache.set("a", json(1), std::chrono::milliseconds(10));
    cache.set("b", json(2), std::chrono::milliseconds(10));
    cache.set("c", json(3), std::chrono::seconds(30));

    bool success = expect(wait_for_size(cache, 1, std::chrono::milliseconds(2000)),
                          "sweep removes expired entries without reads");
    std::vector<std::string> keys = cache.keys();
    success &= expect(keys.size() == 1 && keys[0] == "c", "unexpired entry survives the sweep");
    return success;
}

static bool test_sweep_expired_now() {
    storage::TtlCache cache;
    cache.set("old", json(1), std::chrono::milliseconds(1));
    cache.set("new", json(2), std::chrono::seconds(30));
    std::this_thread::sleep_for(std::chrono::milliseconds(20));

    bool success = expect(cache.sweep_expired() == 1, "sweep_expired reports one removal");
    success &= expect(cache.size() == 1, "only the live entry is left");
    return success;
}

static bool test_remove_clear_and_keys() {
    storage::TtlCache cache;
    cache.set("x", json(1), std::chrono::seconds(30));
    cache.set("y", json(2), std::chrono::seconds(30));
    cache.set("z", json(3), std::chrono::seconds(30));

    std::vector<std::string> keys = cache.keys();
    std::sort(keys.begin(), keys.end());
    bool success = expect(keys == std::vector<std::string>({"x", "y", "z"}), "keys lists every entry");

    cache.remove("y");
    cache.remove("not-there");
    json value;
    success &= expect(!cache.get("y", value) && cache.size() == 2, "remove deletes one entry");

    cache.clear();
    success &= expect(cache.size() == 0 && cache.keys().empty(), "clear empties the cache");
    return success;
}

static bool test_shutdown_is_idempotent() {
    storage::TtlCache cache;
    cache.set("k", json(1), std::chrono::seconds(30));
    cache.shutdown();
    cache.shutdown();

    json value;
    return expect(cache.get("k", value) && value == 1, "cache stays readable after shutdown");
}

bool run_all_tests() {
    bool all_passed = true;
    all_passed &= test_set_then_get();
    all_passed &= test_expired_entry_is_never_returned();
    all_passed &= test_set_after_expiry_survives_lazy_deletion();
    all_passed &= test_get_with_ttl();
    all_passed &= test_periodic_sweep();
    all_passed &= test_sweep_expired_now();
    all_passed &= test_remove_clear_and_keys();
    all_passed &= test_shutdown_is_idempotent();
    return all_passed;
}

} // namespace test_ttl_cache
