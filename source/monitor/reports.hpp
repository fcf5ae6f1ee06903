#ifndef SYSMCPS_REPORTS_HPP
#define SYSMCPS_REPORTS_HPP

// Plain-text renderings of metric records, returned as tool output.
// Every report ends with an "Updated: YYYY-MM-DD HH:MM:SS" line (local time).

#include "monitor/monitor_types.hpp"

#include <cstddef>
#include <cstdint>
#include <string>

namespace reports {

// 1536 -> "1.50 KB"; below 1024 -> "512 B".
std::string format_bytes(uint64_t bytes);

// Local time as "YYYY-MM-DD HH:MM:SS".
std::string format_timestamp(int64_t unix_seconds);

// 93784 -> "1 days 2 hours 3 minutes".
std::string format_uptime(uint64_t uptime_seconds);

std::string format_cpu_report(const monitor::CpuInfo &cpu, const std::string &duration_label);
std::string format_memory_report(const monitor::MemoryInfo &memory);
std::string format_process_report(const monitor::ProcessList &process_list, bool sorted_by_cpu, std::size_t limit);
std::string format_network_report(const monitor::NetworkInfo &network, bool show_connections);
std::string format_disk_report(const monitor::DiskInfo &disk);
std::string format_system_report(const monitor::SystemInfo &system, bool include_load);

} // namespace reports

#endif // SYSMCPS_REPORTS_HPP
