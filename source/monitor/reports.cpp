#include "monitor/reports.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace reports {

static const std::string RULE(68, '-');

static void append_footer(std::ostringstream &report_stream, int64_t last_updated) {
    report_stream << "\nUpdated: " << format_timestamp(last_updated) << "\n";
}

// Truncate to width characters, marking the cut with "...".
static std::string truncate(const std::string &text, std::size_t width) {
    if (text.size() <= width) {
        return text;
    }
    return text.substr(0, width - 3) + "...";
}

std::string format_bytes(uint64_t bytes) {
    const uint64_t unit = 1024;
    if (bytes < unit) {
        return std::to_string(bytes) + " B";
    }
    uint64_t divisor = unit;
    int exponent = 0;
    for (uint64_t remaining = bytes / unit; remaining >= unit && exponent < 5; remaining /= unit) {
        divisor *= unit;
        exponent++;
    }
    std::ostringstream value_stream;
    value_stream << std::fixed << std::setprecision(2)
                 << static_cast<double>(bytes) / static_cast<double>(divisor)
                 << " " << "KMGTPE"[exponent] << "B";
    return value_stream.str();
}

std::string format_timestamp(int64_t unix_seconds) {
    std::time_t time_value = static_cast<std::time_t>(unix_seconds);
    std::tm local_time{};
    if (localtime_r(&time_value, &local_time) == nullptr) {
        return std::to_string(unix_seconds);
    }
    std::ostringstream time_stream;
    time_stream << std::put_time(&local_time, "%Y-%m-%d %H:%M:%S");
    return time_stream.str();
}

std::string format_uptime(uint64_t uptime_seconds) {
    uint64_t days = uptime_seconds / 86400;
    uint64_t hours = (uptime_seconds % 86400) / 3600;
    uint64_t minutes = (uptime_seconds % 3600) / 60;
    return std::to_string(days) + " days " + std::to_string(hours) + " hours " +
           std::to_string(minutes) + " minutes";
}

std::string format_cpu_report(const monitor::CpuInfo &cpu, const std::string &duration_label) {
    std::ostringstream report_stream;
    report_stream << std::fixed << std::setprecision(2);

    report_stream << "CPU Information\n" << RULE << "\n";
    report_stream << "Model: " << cpu.model_name << "\n";
    report_stream << "Cores: " << cpu.physical_cores << " physical, " << cpu.logical_cores << " logical\n";
    report_stream << "Frequency: " << cpu.frequency_ghz << " GHz\n";

    report_stream << "\nCPU Usage (sampled over " << duration_label << ")\n" << RULE << "\n";
    report_stream << "Total: " << cpu.total_percent << "%\n\n";
    report_stream << "Per core:\n";
    for (std::size_t index = 0; index < cpu.per_core_percent.size(); ++index) {
        report_stream << "  Core " << (index + 1) << ": " << cpu.per_core_percent[index] << "%\n";
    }

    append_footer(report_stream, cpu.last_updated);
    return report_stream.str();
}

std::string format_memory_report(const monitor::MemoryInfo &memory) {
    std::ostringstream report_stream;
    report_stream << std::fixed << std::setprecision(2);

    report_stream << "Memory Information\n" << RULE << "\n";
    report_stream << "Total: " << format_bytes(memory.total_bytes) << "\n";
    report_stream << "Used: " << format_bytes(memory.used_bytes) << " (" << memory.used_percent << "%)\n";
    report_stream << "Available: " << format_bytes(memory.available_bytes) << "\n";
    report_stream << "Free: " << format_bytes(memory.free_bytes) << "\n";
    report_stream << "Buffers: " << format_bytes(memory.buffers_bytes) << "\n";
    report_stream << "Cached: " << format_bytes(memory.cached_bytes) << "\n";

    report_stream << "\nSwap\n" << RULE << "\n";
    report_stream << "Total: " << format_bytes(memory.swap.total_bytes) << "\n";
    report_stream << "Used: " << format_bytes(memory.swap.used_bytes) << " (" << memory.swap.used_percent << "%)\n";
    report_stream << "Free: " << format_bytes(memory.swap.free_bytes) << "\n";

    append_footer(report_stream, memory.last_updated);
    return report_stream.str();
}

std::string format_process_report(const monitor::ProcessList &process_list, bool sorted_by_cpu, std::size_t limit) {
    std::ostringstream report_stream;

    report_stream << "Top " << limit << " processes by " << (sorted_by_cpu ? "CPU" : "memory") << "\n";
    report_stream << RULE << "\n";
    report_stream << std::left << std::setw(8) << "PID" << " " << std::setw(25) << "NAME" << " "
                  << std::setw(10) << "CPU%" << " " << std::setw(12) << "MEM(MB)" << " " << "STATUS" << "\n";
    report_stream << RULE << "\n";

    report_stream << std::fixed << std::setprecision(2);
    for (const auto &process : process_list.processes) {
        report_stream << std::left << std::setw(8) << process.pid << " "
                      << std::setw(25) << truncate(process.name, 25) << " "
                      << std::setw(10) << process.cpu_percent << " "
                      << std::setw(12) << process.memory_mb << " "
                      << process.status << "\n";
    }

    report_stream << "\nTotal processes: " << process_list.total_count << "\n";
    append_footer(report_stream, process_list.last_updated);
    return report_stream.str();
}

std::string format_network_report(const monitor::NetworkInfo &network, bool show_connections) {
    std::ostringstream report_stream;
    report_stream << std::fixed << std::setprecision(2);

    report_stream << "Network Status\n" << RULE << "\n";

    if (network.interfaces.empty()) {
        report_stream << "No matching network interfaces\n";
    } else {
        report_stream << "Interface counters:\n";
        report_stream << std::left << std::setw(15) << "INTERFACE" << " " << std::setw(12) << "SENT(MB)" << " "
                      << std::setw(12) << "RECV(MB)" << " " << std::setw(12) << "PKTS_SENT" << " "
                      << std::setw(12) << "PKTS_RECV" << " " << std::setw(8) << "ERR_OUT" << " " << "ERR_IN" << "\n";
        report_stream << RULE << "\n";
        for (const auto &network_interface : network.interfaces) {
            report_stream << std::left << std::setw(15) << network_interface.name << " "
                          << std::setw(12) << static_cast<double>(network_interface.bytes_sent) / (1024.0 * 1024.0) << " "
                          << std::setw(12) << static_cast<double>(network_interface.bytes_recv) / (1024.0 * 1024.0) << " "
                          << std::setw(12) << network_interface.packets_sent << " "
                          << std::setw(12) << network_interface.packets_recv << " "
                          << std::setw(8) << network_interface.errors_out << " "
                          << network_interface.errors_in << "\n";
        }
    }

    const monitor::NetworkConnections &connections = network.connections;
    if (show_connections && connections.total > 0) {
        report_stream << "\nConnections\n" << RULE << "\n";
        report_stream << "Total: " << connections.total << "\n";

        report_stream << "\nBy state:\n";
        for (const auto &entry : connections.by_status) {
            report_stream << "  " << entry.first << ": " << entry.second << "\n";
        }
        report_stream << "\nBy protocol:\n";
        for (const auto &entry : connections.by_protocol) {
            report_stream << "  " << entry.first << ": " << entry.second << "\n";
        }

        if (!connections.details.empty()) {
            report_stream << "\nFirst " << connections.details.size() << " connections:\n";
            report_stream << std::left << std::setw(6) << "PROTO" << " " << std::setw(22) << "LOCAL" << " "
                          << std::setw(6) << "PORT" << " " << std::setw(22) << "REMOTE" << " "
                          << std::setw(6) << "PORT" << " " << "STATE" << "\n";
            report_stream << RULE << "\n";
            for (const auto &detail : connections.details) {
                report_stream << std::left << std::setw(6) << detail.protocol << " "
                              << std::setw(22) << detail.local_ip << " "
                              << std::setw(6) << detail.local_port << " "
                              << std::setw(22) << detail.remote_ip << " "
                              << std::setw(6) << detail.remote_port << " "
                              << detail.status << "\n";
            }
        }
    }

    append_footer(report_stream, network.last_updated);
    return report_stream.str();
}

std::string format_disk_report(const monitor::DiskInfo &disk) {
    std::ostringstream report_stream;

    report_stream << "Disk Information\n" << RULE << "\n";

    if (disk.partitions.empty()) {
        report_stream << "No usable disk partitions found\n";
        append_footer(report_stream, disk.last_updated);
        return report_stream.str();
    }

    auto write_row = [&report_stream](const std::string &mountpoint, const std::string &fstype, uint64_t total,
                                      uint64_t used, uint64_t free, double used_percent) {
        report_stream << std::left << std::setw(20) << truncate(mountpoint, 20) << " "
                      << std::setw(10) << fstype << " "
                      << std::setw(12) << format_bytes(total) << " "
                      << std::setw(12) << format_bytes(used) << " "
                      << std::setw(12) << format_bytes(free) << " "
                      << std::fixed << std::setprecision(1) << used_percent << "%\n";
    };

    report_stream << std::left << std::setw(20) << "MOUNT" << " " << std::setw(10) << "FSTYPE" << " "
                  << std::setw(12) << "SIZE" << " " << std::setw(12) << "USED" << " "
                  << std::setw(12) << "AVAIL" << " " << "USE%" << "\n";
    report_stream << RULE << "\n";

    uint64_t total_size = 0;
    uint64_t total_used = 0;
    uint64_t total_free = 0;
    for (const auto &partition : disk.partitions) {
        write_row(partition.mountpoint, partition.fstype, partition.total_bytes, partition.used_bytes,
                  partition.free_bytes, partition.used_percent);
        total_size += partition.total_bytes;
        total_used += partition.used_bytes;
        total_free += partition.free_bytes;
    }

    if (disk.partitions.size() > 1) {
        report_stream << RULE << "\n";
        double total_percent = total_size > 0
                                   ? static_cast<double>(total_used) / static_cast<double>(total_size) * 100.0
                                   : 0.0;
        write_row("Total", "-", total_size, total_used, total_free, total_percent);
    }

    append_footer(report_stream, disk.last_updated);
    return report_stream.str();
}

std::string format_system_report(const monitor::SystemInfo &system, bool include_load) {
    std::ostringstream report_stream;

    report_stream << "System Overview\n" << RULE << "\n";
    report_stream << "Hostname: " << system.hostname << "\n";
    report_stream << "OS: " << system.os << "\n";
    report_stream << "Platform: " << (system.platform.empty() ? "unknown" : system.platform) << "\n";
    report_stream << "Kernel: " << system.kernel_version << "\n";
    report_stream << "Architecture: " << system.architecture << "\n";
    report_stream << "Uptime: " << format_uptime(system.uptime_seconds) << "\n";
    report_stream << "Processes: " << system.process_count << "\n";

    if (include_load) {
        report_stream << "\nLoad Average\n" << RULE << "\n";
        if (system.has_load) {
            report_stream << std::fixed << std::setprecision(2)
                          << "1 min: " << system.load.one_minute
                          << "  5 min: " << system.load.five_minutes
                          << "  15 min: " << system.load.fifteen_minutes << "\n";
        } else {
            report_stream << "Load average is not available on this system\n";
        }
    }

    append_footer(report_stream, system.last_updated);
    return report_stream.str();
}

} // namespace reports
