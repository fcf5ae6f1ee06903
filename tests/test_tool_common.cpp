// Tests for argument helpers and the read-through cache used by the metric tools.

#include "storage/ttl_cache.hpp"
#include "test_support.hpp"
#include "tool_handlers/tool_common.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <string>

using json = nlohmann::json;
using test_support::expect;

namespace test_tool_common {

static collectors::Collected<monitor::MemoryInfo> fake_memory(uint64_t total_bytes) {
    collectors::Collected<monitor::MemoryInfo> collected;
    collected.success = true;
    collected.data.total_bytes = total_bytes;
    return collected;
}

static bool test_string_argument() {
    json arguments = {{"sort_by", "cpu"}, {"limit", 5}};
    bool success = expect(tool_common::string_argument(arguments, "sort_by", "memory") == "cpu",
                          "string argument is returned");
    success &= expect(tool_common::string_argument(arguments, "limit", "10") == "10",
                      "non-string argument falls back to the default");
    success &= expect(tool_common::string_argument(arguments, "missing", "x") == "x",
                      "absent argument falls back to the default");
    success &= expect(tool_common::string_argument(json(), "sort_by", "d") == "d", "null arguments use defaults");
    return success;
}

static bool test_parse_duration() {
    int64_t milliseconds = 0;
    bool success = expect(tool_common::parse_duration_milliseconds("5s", milliseconds) && milliseconds == 5000,
                          "seconds are parsed");
    success &= expect(tool_common::parse_duration_milliseconds("250ms", milliseconds) && milliseconds == 250,
                      "milliseconds are parsed");
    success &= expect(tool_common::parse_duration_milliseconds("1m", milliseconds) && milliseconds == 60000,
                      "minutes are parsed");
    success &= expect(!tool_common::parse_duration_milliseconds("fast", milliseconds) &&
                          !tool_common::parse_duration_milliseconds("10", milliseconds) &&
                          !tool_common::parse_duration_milliseconds("0s", milliseconds) &&
                          !tool_common::parse_duration_milliseconds("", milliseconds),
                      "unparsable durations are rejected");
    success &= expect(!tool_common::parse_duration_milliseconds("9223372036854775807m", milliseconds) &&
                          !tool_common::parse_duration_milliseconds("9223372036854775807s", milliseconds) &&
                          !tool_common::parse_duration_milliseconds("99999999999999999999ms", milliseconds),
                      "amounts that overflow milliseconds are rejected");
    success &= expect(tool_common::parse_duration_milliseconds("9223372036854775807ms", milliseconds) &&
                          milliseconds == 9223372036854775807LL,
                      "largest millisecond amount is accepted unscaled");
    success &= expect(!tool_common::parse_duration_milliseconds(" 5s", milliseconds) &&
                          !tool_common::parse_duration_milliseconds("+5s", milliseconds) &&
                          !tool_common::parse_duration_milliseconds("-5s", milliseconds),
                      "signed or space-prefixed durations are rejected");
    return success;
}

static bool test_cached_collect() {
    storage::TtlCache cache;
    tool_common::ToolEnvironment environment{cache, true};
    int collect_count = 0;
    auto collect = [&collect_count]() {
        collect_count++;
        return fake_memory(4096);
    };

    auto first = tool_common::cached_collect<monitor::MemoryInfo>(environment, "memory_info", true,
                                                                 std::chrono::seconds(15), collect);
    auto second = tool_common::cached_collect<monitor::MemoryInfo>(environment, "memory_info", true,
                                                                  std::chrono::seconds(15), collect);
    bool success = expect(first.success && second.success && second.data.total_bytes == 4096,
                          "cached result matches the collected one");
    success &= expect(collect_count == 1, "second request is served from the cache");

    tool_common::cached_collect<monitor::MemoryInfo>(environment, "memory_info", false, std::chrono::seconds(15),
                                                     collect);
    success &= expect(collect_count == 2, "use_cache=false always collects");

    cache.set("memory_info", json("not a memory record"), std::chrono::seconds(15));
    auto recovered = tool_common::cached_collect<monitor::MemoryInfo>(environment, "memory_info", true,
                                                                     std::chrono::seconds(15), collect);
    success &= expect(recovered.success && collect_count == 3, "undecodable cached payload is a miss");
    return success;
}

static bool test_cache_disabled() {
    storage::TtlCache cache;
    tool_common::ToolEnvironment environment{cache, false};
    int collect_count = 0;
    auto collect = [&collect_count]() {
        collect_count++;
        return fake_memory(1);
    };

    tool_common::cached_collect<monitor::MemoryInfo>(environment, "memory_info", true, std::chrono::seconds(15),
                                                     collect);
    tool_common::cached_collect<monitor::MemoryInfo>(environment, "memory_info", true, std::chrono::seconds(15),
                                                     collect);
    bool success = expect(collect_count == 2, "disabled cache never serves results");
    success &= expect(cache.size() == 0, "disabled cache never stores results");
    return success;
}

static bool test_failed_collection_not_cached() {
    storage::TtlCache cache;
    tool_common::ToolEnvironment environment{cache, true};
    auto failing = []() {
        collectors::Collected<monitor::MemoryInfo> collected;
        collected.error_detail = "no /proc";
        return collected;
    };

    auto result = tool_common::cached_collect<monitor::MemoryInfo>(environment, "memory_info", true,
                                                                  std::chrono::seconds(15), failing);
    bool success = expect(!result.success && result.error_detail == "no /proc", "failure is passed through");
    success &= expect(cache.size() == 0, "failed collection is not cached");
    return success;
}

bool run_all_tests() {
    bool all_passed = true;
    all_passed &= test_string_argument();
    all_passed &= test_parse_duration();
    all_passed &= test_cached_collect();
    all_passed &= test_cache_disabled();
    all_passed &= test_failed_collection_not_cached();
    return all_passed;
}

} // namespace test_tool_common
