#ifndef SYSMCPS_TOOL_COMMON_HPP
#define SYSMCPS_TOOL_COMMON_HPP

// Shared plumbing for the metric tools: argument access and the
// read-through cache wrapper around a collector.

#include "mcp/mcp_tools.hpp"
#include "monitor/collectors.hpp"
#include "storage/ttl_cache.hpp"
#include "utils/debug_log.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <string>

namespace tool_common {

using json = nlohmann::json;

// State shared by every metric tool. The cache outlives the registry.
struct ToolEnvironment {
    storage::TtlCache &cache;
    bool cache_enabled = true;
};

// String argument by name. Absent or non-string values yield default_value.
std::string string_argument(const json &arguments, const std::string &name, const std::string &default_value);

// "true" -> true, anything else -> false.
bool is_true(const std::string &value);

// "500ms", "1s", "2m" -> milliseconds. Returns false on anything else,
// including zero, signed or space-prefixed values and amounts that overflow.
bool parse_duration_milliseconds(const std::string &text, int64_t &milliseconds);

// Serve Data from the cache under key when allowed, otherwise run collect and
// store the result for ttl. A cached payload that does not decode into Data
// counts as a miss.
template <typename Data, typename Collect>
collectors::Collected<Data> cached_collect(ToolEnvironment &environment, const std::string &key,
                                           bool use_cache, std::chrono::seconds ttl, Collect collect) {
    if (use_cache && environment.cache_enabled) {
        json cached;
        if (environment.cache.get(key, cached)) {
            try {
                collectors::Collected<Data> hit;
                hit.data = cached.get<Data>();
                hit.success = true;
                debug_log::log("Cache hit: " + key);
                return hit;
            } catch (const json::exception &error) {
                debug_log::log("Discarding undecodable cache entry " + key + ": " + error.what());
            }
        }
    }

    collectors::Collected<Data> fresh = collect();
    if (fresh.success && environment.cache_enabled) {
        environment.cache.set(key, json(fresh.data), ttl);
    }
    return fresh;
}

} // namespace tool_common

#endif // SYSMCPS_TOOL_COMMON_HPP
