#ifndef SYSMCPS_PROC_PARSERS_HPP
#define SYSMCPS_PROC_PARSERS_HPP

// Parsers for Linux /proc text formats. They take file contents rather than
// paths so the collectors can be tested against fixed samples.

#include "monitor/monitor_types.hpp"

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace proc_parsers {

// Jiffies from one "cpu" line of /proc/stat.
struct CpuTimes {
    uint64_t user = 0;
    uint64_t nice = 0;
    uint64_t system = 0;
    uint64_t idle = 0;
    uint64_t iowait = 0;
    uint64_t irq = 0;
    uint64_t softirq = 0;
    uint64_t steal = 0;

    uint64_t idle_total() const { return idle + iowait; }
    uint64_t total() const { return user + nice + system + idle + iowait + irq + softirq + steal; }
};

struct CpuStatSnapshot {
    CpuTimes aggregate;
    std::vector<CpuTimes> per_core;
    int64_t boot_time = 0; // "btime", seconds since epoch
};

// Returns false when no aggregate "cpu" line is present.
bool parse_proc_stat(const std::string &text, CpuStatSnapshot &snapshot);

// Busy share of the interval between two samples, 0..100.
double cpu_usage_percent(const CpuTimes &before, const CpuTimes &after);

struct CpuModel {
    std::string model_name;
    int physical_cores = 0;
    double mhz = 0.0;
};

// Model name and MHz come from the first processor block; physical cores are
// counted over distinct (physical id, core id) pairs, falling back to "cpu cores".
CpuModel parse_cpuinfo(const std::string &text);

// /proc/meminfo as field -> bytes (kB values are scaled).
std::map<std::string, uint64_t> parse_meminfo(const std::string &text);

// Derive memory and swap usage from /proc/meminfo fields.
monitor::MemoryInfo memory_from_meminfo(const std::map<std::string, uint64_t> &fields);

// /proc/net/dev rows, in file order.
std::vector<monitor::NetworkInterface> parse_net_dev(const std::string &text);

// Rows of /proc/net/{tcp,tcp6,udp,udp6}. protocol is copied into each detail.
std::vector<monitor::ConnectionDetail> parse_net_connections(const std::string &text, const std::string &protocol);

// Name of a TCP state code as found in /proc/net/tcp ("01" -> "ESTABLISHED").
std::string tcp_state_name(const std::string &hex_state);

struct MountEntry {
    std::string device;
    std::string mountpoint;
    std::string fstype;
};

// /proc/mounts rows with octal escapes (\040 etc.) decoded.
std::vector<MountEntry> parse_mounts(const std::string &text);

struct ProcessStat {
    int pid = 0;
    std::string comm;
    char state = '?';
    uint64_t utime = 0;
    uint64_t stime = 0;
    uint64_t start_time = 0; // clock ticks after boot
};

// /proc/<pid>/stat. comm may contain spaces and parentheses.
bool parse_process_stat(const std::string &text, ProcessStat &stat);

// Second field of /proc/<pid>/statm (resident set size in pages).
bool parse_statm_resident_pages(const std::string &text, uint64_t &resident_pages);

// Long name of a process state letter ("R" -> "running").
std::string process_status_name(char state);

bool parse_loadavg(const std::string &text, monitor::LoadAverage &load);

bool parse_uptime(const std::string &text, double &uptime_seconds);

// "ID" of /etc/os-release with quotes removed, empty when missing.
std::string parse_os_release_id(const std::string &text);

} // namespace proc_parsers

#endif // SYSMCPS_PROC_PARSERS_HPP
