#include "monitor/collectors.hpp"
#include "monitor/proc_parsers.hpp"
#include "platform/platform_abi.hpp"
#include "utils/debug_log.hpp"

#include <algorithm>
#include <initializer_list>
#include <map>

namespace collectors {

namespace {

template <typename Data>
Collected<Data> collection_failure(const std::string &error_detail) {
    Collected<Data> result;
    result.success = false;
    result.error_detail = error_detail;
    return result;
}

bool read_proc_file(const std::string &relative_path, std::string &contents) {
    return platform::read_file_contents(platform::proc_path(relative_path), contents);
}

} // namespace

Collected<monitor::CpuInfo> collect_cpu(int64_t sample_milliseconds) {
    Collected<monitor::CpuInfo> result;

    std::string cpuinfo_text;
    if (!read_proc_file("cpuinfo", cpuinfo_text)) {
        return collection_failure<monitor::CpuInfo>("failed to read CPU description from /proc/cpuinfo");
    }
    proc_parsers::CpuModel model = proc_parsers::parse_cpuinfo(cpuinfo_text);

    std::string stat_text;
    proc_parsers::CpuStatSnapshot before;
    if (!read_proc_file("stat", stat_text) || !proc_parsers::parse_proc_stat(stat_text, before)) {
        return collection_failure<monitor::CpuInfo>("failed to read CPU times from /proc/stat");
    }

    platform::sleep_milliseconds(sample_milliseconds);

    proc_parsers::CpuStatSnapshot after;
    if (!read_proc_file("stat", stat_text) || !proc_parsers::parse_proc_stat(stat_text, after)) {
        return collection_failure<monitor::CpuInfo>("failed to read CPU times from /proc/stat");
    }

    monitor::CpuInfo &cpu = result.data;
    cpu.model_name = model.model_name;
    cpu.physical_cores = model.physical_cores;
    cpu.logical_cores = platform::logical_cpu_count();
    cpu.frequency_ghz = model.mhz / 1000.0;
    cpu.total_percent = proc_parsers::cpu_usage_percent(before.aggregate, after.aggregate);

    std::size_t core_count = std::min(before.per_core.size(), after.per_core.size());
    for (std::size_t index = 0; index < core_count; ++index) {
        cpu.per_core_percent.push_back(proc_parsers::cpu_usage_percent(before.per_core[index], after.per_core[index]));
    }

    cpu.last_updated = platform::current_unix_time();
    result.success = true;
    return result;
}

Collected<monitor::MemoryInfo> collect_memory() {
    Collected<monitor::MemoryInfo> result;

    std::string meminfo_text;
    if (!read_proc_file("meminfo", meminfo_text)) {
        return collection_failure<monitor::MemoryInfo>("failed to read /proc/meminfo");
    }

    std::map<std::string, uint64_t> fields = proc_parsers::parse_meminfo(meminfo_text);
    if (fields.count("MemTotal") == 0) {
        return collection_failure<monitor::MemoryInfo>("MemTotal missing from /proc/meminfo");
    }

    result.data = proc_parsers::memory_from_meminfo(fields);
    result.data.last_updated = platform::current_unix_time();
    result.success = true;
    return result;
}

Collected<monitor::ProcessList> collect_top_processes(ProcessSortKey sort_key, std::size_t limit) {
    Collected<monitor::ProcessList> result;

    std::vector<int> process_ids = platform::list_process_ids();
    if (process_ids.empty()) {
        return collection_failure<monitor::ProcessList>("failed to list processes under /proc");
    }

    std::string text;
    double uptime_seconds = 0.0;
    if (!read_proc_file("uptime", text) || !proc_parsers::parse_uptime(text, uptime_seconds)) {
        return collection_failure<monitor::ProcessList>("failed to read /proc/uptime");
    }
    proc_parsers::CpuStatSnapshot stat_snapshot;
    if (!read_proc_file("stat", text) || !proc_parsers::parse_proc_stat(text, stat_snapshot)) {
        return collection_failure<monitor::ProcessList>("failed to read boot time from /proc/stat");
    }

    const double ticks_per_second = static_cast<double>(platform::clock_ticks_per_second());
    const uint64_t page_size = static_cast<uint64_t>(platform::page_size_bytes());

    std::vector<monitor::ProcessInfo> processes;
    processes.reserve(process_ids.size());

    for (int process_id : process_ids) {
        // Processes can exit between listing and reading; skip them.
        proc_parsers::ProcessStat stat;
        if (!platform::read_file_contents(platform::proc_path(process_id, "stat"), text) ||
            !proc_parsers::parse_process_stat(text, stat) || stat.comm.empty()) {
            continue;
        }

        monitor::ProcessInfo process;
        process.pid = stat.pid;
        process.name = stat.comm;
        process.status = proc_parsers::process_status_name(stat.state);

        double start_seconds = static_cast<double>(stat.start_time) / ticks_per_second;
        double cpu_seconds = static_cast<double>(stat.utime + stat.stime) / ticks_per_second;
        double elapsed_seconds = uptime_seconds - start_seconds;
        if (elapsed_seconds > 0.0) {
            process.cpu_percent = cpu_seconds / elapsed_seconds * 100.0;
        }
        process.create_time_ms = static_cast<int64_t>(
            (static_cast<double>(stat_snapshot.boot_time) + start_seconds) * 1000.0);

        uint64_t resident_pages = 0;
        if (platform::read_file_contents(platform::proc_path(process_id, "statm"), text) &&
            proc_parsers::parse_statm_resident_pages(text, resident_pages)) {
            process.memory_bytes = resident_pages * page_size;
            process.memory_mb = static_cast<double>(process.memory_bytes) / (1024.0 * 1024.0);
        }

        processes.push_back(process);
    }

    select_top_processes(processes, sort_key, limit);

    result.data.processes = processes;
    result.data.total_count = static_cast<int>(process_ids.size());
    result.data.last_updated = platform::current_unix_time();
    result.success = true;
    return result;
}

void select_top_processes(std::vector<monitor::ProcessInfo> &processes, ProcessSortKey sort_key, std::size_t limit) {
    if (sort_key == ProcessSortKey::Cpu) {
        std::stable_sort(processes.begin(), processes.end(),
                         [](const monitor::ProcessInfo &left, const monitor::ProcessInfo &right) {
                             return left.cpu_percent > right.cpu_percent;
                         });
    } else {
        std::stable_sort(processes.begin(), processes.end(),
                         [](const monitor::ProcessInfo &left, const monitor::ProcessInfo &right) {
                             return left.memory_bytes > right.memory_bytes;
                         });
    }

    if (processes.size() > limit) {
        processes.resize(limit);
    }
}

monitor::NetworkConnections summarize_connections(const std::vector<monitor::ConnectionDetail> &connections) {
    monitor::NetworkConnections summary;
    summary.total = static_cast<int>(connections.size());

    for (const auto &connection : connections) {
        summary.by_status[connection.status]++;
        summary.by_protocol[connection.protocol]++;
        if (summary.details.size() < MAX_CONNECTION_DETAILS) {
            summary.details.push_back(connection);
        }
    }

    return summary;
}

Collected<monitor::NetworkInfo> collect_network(bool show_connections, const std::string &interface_filter) {
    Collected<monitor::NetworkInfo> result;

    std::string text;
    if (!read_proc_file("net/dev", text)) {
        return collection_failure<monitor::NetworkInfo>("failed to read interface counters from /proc/net/dev");
    }

    for (const auto &network_interface : proc_parsers::parse_net_dev(text)) {
        if (network_interface.name == "lo" || network_interface.name == "lo0") {
            continue;
        }
        if (!interface_filter.empty() && network_interface.name != interface_filter) {
            continue;
        }
        result.data.interfaces.push_back(network_interface);
    }

    if (show_connections) {
        std::vector<monitor::ConnectionDetail> connections;
        for (const char *protocol : {"tcp", "tcp6", "udp", "udp6"}) {
            if (!read_proc_file(std::string("net/") + protocol, text)) {
                debug_log::log(std::string("No connection table for ") + protocol);
                continue;
            }
            std::vector<monitor::ConnectionDetail> rows = proc_parsers::parse_net_connections(text, protocol);
            connections.insert(connections.end(), rows.begin(), rows.end());
        }
        result.data.connections = summarize_connections(connections);
    }

    result.data.last_updated = platform::current_unix_time();
    result.success = true;
    return result;
}

bool should_skip_partition(const std::string &mountpoint, const std::string &fstype) {
    static const std::vector<std::string> skip_mountpoints = {
        "/dev", "/proc", "/sys", "/run", "/boot/efi",
        "/snap", "/var/snap", "/tmp", "/dev/shm",
    };
    static const std::vector<std::string> skip_fstypes = {
        "tmpfs", "devtmpfs", "sysfs", "proc", "devfs",
        "squashfs", "overlay", "aufs", "fuse",
    };

    if (std::find(skip_mountpoints.begin(), skip_mountpoints.end(), mountpoint) != skip_mountpoints.end()) {
        return true;
    }
    return std::find(skip_fstypes.begin(), skip_fstypes.end(), fstype) != skip_fstypes.end();
}

Collected<monitor::DiskInfo> collect_disk(bool show_all) {
    Collected<monitor::DiskInfo> result;

    std::string text;
    if (!read_proc_file("mounts", text)) {
        return collection_failure<monitor::DiskInfo>("failed to read mount table from /proc/mounts");
    }

    for (const auto &mount : proc_parsers::parse_mounts(text)) {
        if (!show_all) {
            // Only block-device backed filesystems count as physical partitions.
            if (mount.device.empty() || mount.device[0] != '/' ||
                should_skip_partition(mount.mountpoint, mount.fstype)) {
                continue;
            }
        }

        platform::FilesystemUsage usage = platform::filesystem_usage(mount.mountpoint);
        if (!usage.success) {
            debug_log::log("Skipping partition: " + usage.error_detail);
            continue;
        }

        monitor::DiskPartition partition;
        partition.device = mount.device;
        partition.mountpoint = mount.mountpoint;
        partition.fstype = mount.fstype;
        partition.total_bytes = usage.total_bytes;
        partition.used_bytes = usage.used_bytes;
        partition.free_bytes = usage.free_bytes;
        partition.used_percent = usage.used_percent;
        result.data.partitions.push_back(partition);
    }

    result.data.last_updated = platform::current_unix_time();
    result.success = true;
    return result;
}

Collected<monitor::SystemInfo> collect_system(bool include_load) {
    Collected<monitor::SystemInfo> result;

    platform::HostIdentity identity = platform::host_identity();
    if (!identity.success) {
        return collection_failure<monitor::SystemInfo>(identity.error_detail);
    }

    monitor::SystemInfo &system = result.data;
    system.hostname = identity.hostname;
    system.os = identity.os;
    system.kernel_version = identity.kernel_version;
    system.architecture = identity.architecture;

    std::string text;
    if (platform::read_file_contents("/etc/os-release", text)) {
        system.platform = proc_parsers::parse_os_release_id(text);
    }

    double uptime_seconds = 0.0;
    if (!read_proc_file("uptime", text) || !proc_parsers::parse_uptime(text, uptime_seconds)) {
        return collection_failure<monitor::SystemInfo>("failed to read /proc/uptime");
    }
    system.uptime_seconds = static_cast<uint64_t>(uptime_seconds);
    system.process_count = platform::list_process_ids().size();

    if (include_load && read_proc_file("loadavg", text)) {
        system.has_load = proc_parsers::parse_loadavg(text, system.load);
    }

    system.last_updated = platform::current_unix_time();
    result.success = true;
    return result;
}

} // namespace collectors
