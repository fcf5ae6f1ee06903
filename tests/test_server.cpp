// Tests for the assembled server: registered tools, single requests,
// administrative operations and the running state.

#include "config/server_config.hpp"
#include "server/server.hpp"
#include "storage/json_store.hpp"
#include "storage/ttl_cache.hpp"
#include "test_support.hpp"

#include <nlohmann/json.hpp>
#include <unistd.h>

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <istream>
#include <mutex>
#include <sstream>
#include <streambuf>
#include <string>
#include <thread>

using json = nlohmann::json;
using test_support::expect;

namespace test_server {

namespace fs = std::filesystem;

static std::string scratch_directory() {
    fs::path directory = fs::temp_directory_path() /
                         ("sysmcps_server_" + std::to_string(static_cast<long>(getpid())));
    std::error_code error;
    fs::remove_all(directory, error);
    return directory.string();
}

// Blocks the first read until release() is called, then reports end of input.
class BlockingStreamBuffer : public std::streambuf {
public:
    void release() {
        std::lock_guard<std::mutex> lock(mutex_);
        released_ = true;
        condition_.notify_all();
    }

protected:
    int_type underflow() override {
        std::unique_lock<std::mutex> lock(mutex_);
        condition_.wait(lock, [this] { return released_; });
        return traits_type::eof();
    }

private:
    std::mutex mutex_;
    std::condition_variable condition_;
    bool released_ = false;
};

static bool test_registered_tools() {
    storage::TtlCache cache;
    storage::JsonStore store(scratch_directory());
    server::Server server(server_config::ServerConfig(), cache, store);

    std::string response = server.process_single_request(R"({"jsonrpc":"2.0","id":1,"method":"tools/list"})");
    json parsed = json::parse(response);

    std::vector<std::string> names;
    for (const auto &tool : parsed["result"]["tools"]) {
        names.push_back(tool["name"].get<std::string>());
    }
    std::sort(names.begin(), names.end());

    return expect(names == std::vector<std::string>({"cpu_info", "disk_info", "memory_info", "network_stats",
                                                     "system_overview", "top_processes"}),
                  "all six monitoring tools are listed");
}

static bool test_single_requests() {
    storage::TtlCache cache;
    storage::JsonStore store(scratch_directory());
    server_config::ServerConfig config;
    config.server_name = "hostwatch";
    server::Server server(config, cache, store);

    json initialize = json::parse(server.process_single_request(
        R"({"jsonrpc":"2.0","id":"init","method":"initialize","params":{}})"));
    bool success = expect(initialize["result"]["serverInfo"]["name"] == "hostwatch", "initialize reports configured name");

    success &= expect(server.process_single_request(R"({"jsonrpc":"2.0","method":"notifications/initialized"})")
                          .empty(),
                      "notification yields an empty response");
    success &= expect(server.process_single_request("not json").empty(), "invalid JSON yields an empty response");

    json call = json::parse(server.process_single_request(
        R"({"jsonrpc":"2.0","id":2,"method":"tools/call","params":{"name":"memory_info","arguments":{"use_cache":"true"}}})"));
    bool call_ok = !call.contains("error") && call["result"]["content"][0]["type"] == "text";
    success &= expect(call_ok, "memory_info call returns a text result");
    if (call_ok && !call["result"].contains("isError")) {
        std::string text = call["result"]["content"][0]["text"].get<std::string>();
        success &= expect(text.find("Updated: ") != std::string::npos, "report carries the update time");

        json stats = server.cache_stats();
        success &= expect(stats["size"] == 1 && stats["keys"][0] == "memory_info", "result is cached under its key");
    }
    return success;
}

static bool test_admin_operations() {
    std::string directory = scratch_directory();
    storage::TtlCache cache;
    storage::JsonStore store(directory);
    store.open();
    server::Server server(server_config::ServerConfig(), cache, store);

    json snapshot = {{"hostname", "box"}, {"uptime_seconds", 42}};
    bool success = expect(server.save_monitor_data("system_snapshot", snapshot).success, "monitor data is saved");

    storage::StoreLoadResult loaded = server.load_monitor_data("system_snapshot");
    success &= expect(loaded.success && loaded.data == snapshot, "monitor data is loaded back");
    success &= expect(!server.load_monitor_data("unknown").success, "loading an unknown key fails");

    json storage_stats = server.storage_stats();
    success &= expect(storage_stats["data_dir"] == directory && storage_stats["count"] == 1 &&
                          storage_stats["keys"][0] == "system_snapshot",
                      "storage stats list the saved key");

    json cache_stats = server.cache_stats();
    success &= expect(cache_stats["size"] == 0 && cache_stats["keys"].empty(), "cache stats start empty");

    std::error_code error;
    fs::remove_all(directory, error);
    return success;
}

static bool test_start_and_running_state() {
    storage::TtlCache cache;
    storage::JsonStore store(scratch_directory());
    server::Server server(server_config::ServerConfig(), cache, store);

    std::istringstream input("{\"jsonrpc\":\"2.0\",\"id\":1,\"method\":\"prompts/list\"}\n");
    std::ostringstream output;
    mcp_stdio::LoopResult result = server.start(input, output);

    bool success = expect(result.success && result.responses_written == 1, "start serves input until EOF");
    success &= expect(!server.is_running(), "server is not running after the loop returns");
    return success;
}

static bool test_second_start_is_rejected() {
    storage::TtlCache cache;
    storage::JsonStore store(scratch_directory());
    server::Server server(server_config::ServerConfig(), cache, store);

    BlockingStreamBuffer blocking_buffer;
    std::istream blocking_input(&blocking_buffer);
    std::ostringstream first_output;
    mcp_stdio::LoopResult first_result;
    std::thread first_run([&]() { first_result = server.start(blocking_input, first_output); });

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
    while (!server.is_running() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    bool success = expect(server.is_running(), "server reports running while the loop blocks");

    std::istringstream second_input("");
    std::ostringstream second_output;
    mcp_stdio::LoopResult second_result = server.start(second_input, second_output);
    success &= expect(!second_result.success && second_result.error_detail == "server is already running",
                      "second start fails while the first is running");

    server.stop();
    blocking_buffer.release();
    first_run.join();
    success &= expect(first_result.success && !server.is_running(), "first loop ends after stop");
    return success;
}

bool run_all_tests() {
    bool all_passed = true;
    all_passed &= test_registered_tools();
    all_passed &= test_single_requests();
    all_passed &= test_admin_operations();
    all_passed &= test_start_and_running_state();
    all_passed &= test_second_start_is_rejected();
    return all_passed;
}

} // namespace test_server
