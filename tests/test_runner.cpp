// Test runner: runs all unit test suites and reports results.

#include <iostream>
#include <vector>
#include <string>
#include <functional>
#include <chrono>

// Forward declarations of test functions from other test files.
namespace test_json_rpc { bool run_all_tests(); }
namespace test_ttl_cache { bool run_all_tests(); }
namespace test_tool_registry { bool run_all_tests(); }
namespace test_dispatch { bool run_all_tests(); }
namespace test_stdio_loop { bool run_all_tests(); }
namespace test_json_store { bool run_all_tests(); }
namespace test_proc_parsers { bool run_all_tests(); }
namespace test_reports { bool run_all_tests(); }
namespace test_tool_common { bool run_all_tests(); }
namespace test_server_config { bool run_all_tests(); }
namespace test_server { bool run_all_tests(); }
namespace test_shutdown_signals { bool run_all_tests(); }

struct TestSuite {
    std::string name;
    std::function<bool()> runner;
};

int main() {
    std::vector<TestSuite> suites = {
        {"test_json_rpc", test_json_rpc::run_all_tests},
        {"test_ttl_cache", test_ttl_cache::run_all_tests},
        {"test_tool_registry", test_tool_registry::run_all_tests},
        {"test_dispatch", test_dispatch::run_all_tests},
        {"test_stdio_loop", test_stdio_loop::run_all_tests},
        {"test_json_store", test_json_store::run_all_tests},
        {"test_proc_parsers", test_proc_parsers::run_all_tests},
        {"test_reports", test_reports::run_all_tests},
        {"test_tool_common", test_tool_common::run_all_tests},
        {"test_server_config", test_server_config::run_all_tests},
        {"test_server", test_server::run_all_tests},
        {"test_shutdown_signals", test_shutdown_signals::run_all_tests},
    };

    int passed_count = 0;
    int failed_count = 0;
    auto total_start_time = std::chrono::steady_clock::now();

    std::cout << "=== SYSMCPS Test Runner ===" << std::endl;
    std::cout << std::endl;

    for (const auto &suite : suites) {
        std::cout << "--- " << suite.name << " ---" << std::endl;
        auto suite_start_time = std::chrono::steady_clock::now();

        bool suite_passed = suite.runner();

        auto suite_elapsed = std::chrono::steady_clock::now() - suite_start_time;
        long suite_milliseconds = std::chrono::duration_cast<std::chrono::milliseconds>(suite_elapsed).count();

        if (suite_passed) {
            std::cout << "  PASSED (" << suite_milliseconds << " ms)" << std::endl;
            passed_count++;
        } else {
            std::cout << "  FAILED (" << suite_milliseconds << " ms)" << std::endl;
            failed_count++;
        }
        std::cout << std::endl;
    }

    auto total_elapsed = std::chrono::steady_clock::now() - total_start_time;
    long total_milliseconds = std::chrono::duration_cast<std::chrono::milliseconds>(total_elapsed).count();

    std::cout << "=== Results ===" << std::endl;
    std::cout << "  Passed: " << passed_count << std::endl;
    std::cout << "  Failed: " << failed_count << std::endl;
    std::cout << "  Total time: " << total_milliseconds << " ms" << std::endl;

    return (failed_count == 0) ? 0 : 1;
}
