#ifndef SYSMCPS_SHUTDOWN_SIGNALS_HPP
#define SYSMCPS_SHUTDOWN_SIGNALS_HPP

// SIGINT/SIGTERM handling: a delivered signal sets the stop flag that was
// handed to install().

#include <atomic>
#include <string>

namespace shutdown_signals {

struct InstallResult {
    bool success = false;
    std::string error_detail;
};

// Point the handler at stop_flag and install it for SIGINT and SIGTERM.
// No SA_RESTART, so a blocked read on stdin returns when a signal arrives.
InstallResult install(std::atomic<bool> &stop_flag);

// Detach the flag. Signals delivered afterwards are ignored until the next
// install(); the flag may then be destroyed.
void clear();

// Put back the default dispositions for SIGINT and SIGTERM.
void restore_defaults();

} // namespace shutdown_signals

#endif // SYSMCPS_SHUTDOWN_SIGNALS_HPP
