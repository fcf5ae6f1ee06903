#include "server/shutdown_signals.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>

namespace shutdown_signals {

// Read from the handler, so both the pointer and the flag must be lock-free.
static std::atomic<std::atomic<bool> *> target_flag{nullptr};

static_assert(ATOMIC_POINTER_LOCK_FREE == 2, "signal handler needs a lock-free pointer");
static_assert(ATOMIC_BOOL_LOCK_FREE == 2, "signal handler needs a lock-free flag");

static void handle_signal(int signal_number) {
    (void)signal_number;
    std::atomic<bool> *flag = target_flag.load();
    if (flag != nullptr) {
        flag->store(true);
    }
}

static bool set_handler(int signal_number, void (*handler)(int)) {
    struct sigaction action {};
    action.sa_handler = handler;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;
    return sigaction(signal_number, &action, nullptr) == 0;
}

InstallResult install(std::atomic<bool> &stop_flag) {
    InstallResult result;
    target_flag.store(&stop_flag);
    if (!set_handler(SIGINT, handle_signal) || !set_handler(SIGTERM, handle_signal)) {
        result.error_detail = std::string("sigaction failed: ") + std::strerror(errno);
        target_flag.store(nullptr);
        return result;
    }
    result.success = true;
    return result;
}

void clear() {
    target_flag.store(nullptr);
}

void restore_defaults() {
    set_handler(SIGINT, SIG_DFL);
    set_handler(SIGTERM, SIG_DFL);
}

} // namespace shutdown_signals
