// Tests for SIGINT/SIGTERM handling. raise() runs the handler on this thread
// before it returns.

#include "server/shutdown_signals.hpp"
#include "test_support.hpp"

#include <atomic>
#include <csignal>

using test_support::expect;

namespace test_shutdown_signals {

static bool test_signal_sets_installed_flag() {
    std::atomic<bool> stop_flag{false};
    shutdown_signals::InstallResult result = shutdown_signals::install(stop_flag);
    bool success = expect(result.success, "handlers install");

    std::raise(SIGTERM);
    success &= expect(stop_flag.load(), "SIGTERM sets the stop flag");

    stop_flag.store(false);
    std::raise(SIGINT);
    success &= expect(stop_flag.load(), "SIGINT sets the stop flag");

    shutdown_signals::clear();
    shutdown_signals::restore_defaults();
    return success;
}

static bool test_cleared_flag_is_not_touched() {
    std::atomic<bool> first_flag{false};
    shutdown_signals::install(first_flag);
    shutdown_signals::clear();

    std::raise(SIGTERM);
    bool success = expect(!first_flag.load(), "signal after clear() leaves the old flag alone");

    std::atomic<bool> second_flag{false};
    shutdown_signals::install(second_flag);
    std::raise(SIGINT);
    success &= expect(second_flag.load() && !first_flag.load(), "a new install() redirects the handler");

    shutdown_signals::clear();
    shutdown_signals::restore_defaults();
    return success;
}

bool run_all_tests() {
    bool all_passed = true;
    all_passed &= test_signal_sets_installed_flag();
    all_passed &= test_cleared_flag_is_not_touched();
    return all_passed;
}

} // namespace test_shutdown_signals
