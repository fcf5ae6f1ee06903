#ifndef SYSMCPS_PLATFORM_ABI_HPP
#define SYSMCPS_PLATFORM_ABI_HPP

// Platform abstraction interface.
// Each OS-specific implementation lives under platform/<os>/ and provides
// definitions for the functions declared here.

#include <cstdint>
#include <string>
#include <vector>

namespace platform {

// Read the entire contents of a text file into a string.
// Returns true on success, false on failure (file not found, permission, etc.).
bool read_file_contents(const std::string &file_path, std::string &output_contents);

// Capacity of the filesystem mounted at a path.
struct FilesystemUsage {
    bool success = false;
    uint64_t total_bytes = 0;
    uint64_t used_bytes = 0;
    uint64_t free_bytes = 0; // available to unprivileged users
    double used_percent = 0.0;
    std::string error_detail;
};

FilesystemUsage filesystem_usage(const std::string &mountpoint);

// Kernel and host identification.
struct HostIdentity {
    bool success = false;
    std::string hostname;
    std::string os;             // lower-case kernel name, e.g. "linux"
    std::string kernel_version;
    std::string architecture;
    std::string error_detail;
};

HostIdentity host_identity();

// Numeric entries of the process table.
std::vector<int> list_process_ids();

// Path of a file under the proc filesystem, e.g. proc_path("stat") or proc_path(42, "stat").
std::string proc_path(const std::string &relative_path);
std::string proc_path(int process_id, const std::string &relative_path);

long clock_ticks_per_second();
long page_size_bytes();
int logical_cpu_count();

// Sleep the calling thread.
void sleep_milliseconds(int64_t milliseconds);

// Seconds since the Unix epoch.
int64_t current_unix_time();

} // namespace platform

#endif // SYSMCPS_PLATFORM_ABI_HPP
