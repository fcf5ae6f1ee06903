#ifndef SYSMCPS_COLLECTORS_HPP
#define SYSMCPS_COLLECTORS_HPP

// Metric collectors. Each samples the operating system through the platform
// layer and returns a result struct; none of them throws on sampling failure.

#include "monitor/monitor_types.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace collectors {

template <typename Data>
struct Collected {
    bool success = false;
    Data data;
    std::string error_detail;
};

// Usage is measured over sample_milliseconds.
Collected<monitor::CpuInfo> collect_cpu(int64_t sample_milliseconds);

Collected<monitor::MemoryInfo> collect_memory();

enum class ProcessSortKey { Cpu, Memory };

Collected<monitor::ProcessList> collect_top_processes(ProcessSortKey sort_key, std::size_t limit);

// Loopback interfaces are skipped; a non-empty interface_filter keeps only that interface.
Collected<monitor::NetworkInfo> collect_network(bool show_connections, const std::string &interface_filter);

// Without show_all, pseudo filesystems and system mount points are left out.
Collected<monitor::DiskInfo> collect_disk(bool show_all);

Collected<monitor::SystemInfo> collect_system(bool include_load);

// Sort descending by the key and keep the first limit entries.
void select_top_processes(std::vector<monitor::ProcessInfo> &processes, ProcessSortKey sort_key, std::size_t limit);

// True for mount points and filesystem types hidden unless show_all is requested.
bool should_skip_partition(const std::string &mountpoint, const std::string &fstype);

// Connection details kept per report.
constexpr std::size_t MAX_CONNECTION_DETAILS = 20;

// Fold parsed connection rows into totals by state and protocol, keeping the first
// MAX_CONNECTION_DETAILS rows.
monitor::NetworkConnections summarize_connections(const std::vector<monitor::ConnectionDetail> &connections);

} // namespace collectors

#endif // SYSMCPS_COLLECTORS_HPP
