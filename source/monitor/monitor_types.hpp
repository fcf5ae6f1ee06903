#ifndef SYSMCPS_MONITOR_TYPES_HPP
#define SYSMCPS_MONITOR_TYPES_HPP

// Metric records produced by the collectors. Each converts to and from JSON so
// it can be kept in the TTL cache or written to the JSON store.
// Timestamps are seconds since the Unix epoch.

#include <nlohmann/json.hpp>

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace monitor {

struct CpuInfo {
    std::string model_name;
    int physical_cores = 0;
    int logical_cores = 0;
    double frequency_ghz = 0.0;
    double total_percent = 0.0;
    std::vector<double> per_core_percent;
    int64_t last_updated = 0;
};

struct SwapInfo {
    uint64_t total_bytes = 0;
    uint64_t used_bytes = 0;
    uint64_t free_bytes = 0;
    double used_percent = 0.0;
};

struct MemoryInfo {
    uint64_t total_bytes = 0;
    uint64_t used_bytes = 0;
    uint64_t available_bytes = 0;
    uint64_t free_bytes = 0;
    uint64_t buffers_bytes = 0;
    uint64_t cached_bytes = 0;
    double used_percent = 0.0;
    SwapInfo swap;
    int64_t last_updated = 0;
};

struct ProcessInfo {
    int pid = 0;
    std::string name;
    std::string status;
    double cpu_percent = 0.0;
    uint64_t memory_bytes = 0;
    double memory_mb = 0.0;
    int64_t create_time_ms = 0;
};

struct ProcessList {
    std::vector<ProcessInfo> processes;
    int total_count = 0;
    int64_t last_updated = 0;
};

struct NetworkInterface {
    std::string name;
    uint64_t bytes_sent = 0;
    uint64_t bytes_recv = 0;
    uint64_t packets_sent = 0;
    uint64_t packets_recv = 0;
    uint64_t errors_in = 0;
    uint64_t errors_out = 0;
    uint64_t drop_in = 0;
    uint64_t drop_out = 0;
};

struct ConnectionDetail {
    std::string protocol;
    std::string local_ip;
    uint32_t local_port = 0;
    std::string remote_ip;
    uint32_t remote_port = 0;
    std::string status;
};

struct NetworkConnections {
    int total = 0;
    std::map<std::string, int> by_status;
    std::map<std::string, int> by_protocol;
    std::vector<ConnectionDetail> details;
};

struct NetworkInfo {
    std::vector<NetworkInterface> interfaces;
    NetworkConnections connections;
    int64_t last_updated = 0;
};

struct DiskPartition {
    std::string device;
    std::string mountpoint;
    std::string fstype;
    uint64_t total_bytes = 0;
    uint64_t used_bytes = 0;
    uint64_t free_bytes = 0;
    double used_percent = 0.0;
};

struct DiskInfo {
    std::vector<DiskPartition> partitions;
    int64_t last_updated = 0;
};

struct LoadAverage {
    double one_minute = 0.0;
    double five_minutes = 0.0;
    double fifteen_minutes = 0.0;
};

struct SystemInfo {
    std::string hostname;
    std::string os;
    std::string platform;
    std::string kernel_version;
    std::string architecture;
    uint64_t uptime_seconds = 0;
    uint64_t process_count = 0;
    bool has_load = false;
    LoadAverage load;
    int64_t last_updated = 0;
};

NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(CpuInfo, model_name, physical_cores, logical_cores, frequency_ghz,
                                   total_percent, per_core_percent, last_updated)
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(SwapInfo, total_bytes, used_bytes, free_bytes, used_percent)
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(MemoryInfo, total_bytes, used_bytes, available_bytes, free_bytes,
                                   buffers_bytes, cached_bytes, used_percent, swap, last_updated)
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(ProcessInfo, pid, name, status, cpu_percent, memory_bytes, memory_mb,
                                   create_time_ms)
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(ProcessList, processes, total_count, last_updated)
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(NetworkInterface, name, bytes_sent, bytes_recv, packets_sent, packets_recv,
                                   errors_in, errors_out, drop_in, drop_out)
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(ConnectionDetail, protocol, local_ip, local_port, remote_ip, remote_port,
                                   status)
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(NetworkConnections, total, by_status, by_protocol, details)
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(NetworkInfo, interfaces, connections, last_updated)
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(DiskPartition, device, mountpoint, fstype, total_bytes, used_bytes,
                                   free_bytes, used_percent)
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(DiskInfo, partitions, last_updated)
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(LoadAverage, one_minute, five_minutes, fifteen_minutes)
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(SystemInfo, hostname, os, platform, kernel_version, architecture,
                                   uptime_seconds, process_count, has_load, load, last_updated)

} // namespace monitor

#endif // SYSMCPS_MONITOR_TYPES_HPP
