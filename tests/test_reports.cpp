// Tests for the plain-text report renderers.

#include "monitor/reports.hpp"
#include "test_support.hpp"

#include <string>

using test_support::expect;

namespace test_reports {

static bool contains(const std::string &text, const std::string &fragment) {
    return text.find(fragment) != std::string::npos;
}

static bool ends_with_updated_line(const std::string &text) {
    std::size_t position = text.rfind("Updated: ");
    // "Updated: YYYY-MM-DD HH:MM:SS\n"
    return position != std::string::npos && text.size() - position == 9 + 19 + 1;
}

static bool test_format_helpers() {
    bool success = expect(reports::format_bytes(512) == "512 B", "small sizes are shown in bytes");
    success &= expect(reports::format_bytes(1536) == "1.50 KB", "kilobytes use two decimals");
    success &= expect(reports::format_bytes(3ull * 1024 * 1024 * 1024) == "3.00 GB", "gigabytes are scaled");
    success &= expect(reports::format_uptime(93784) == "1 days 2 hours 3 minutes", "uptime is split into units");
    success &= expect(reports::format_timestamp(0).size() == 19, "timestamp has fixed width");
    return success;
}

static bool test_memory_report() {
    monitor::MemoryInfo memory;
    memory.total_bytes = 2048;
    memory.used_bytes = 1024;
    memory.used_percent = 50.0;
    memory.last_updated = 1700000000;

    std::string report = reports::format_memory_report(memory);
    bool success = expect(contains(report, "Used: 1.00 KB (50.00%)"), "used memory and percent are shown");
    success &= expect(ends_with_updated_line(report), "memory report ends with the update time");
    return success;
}

static bool test_disk_report_totals() {
    monitor::DiskInfo disk;
    monitor::DiskPartition root;
    root.mountpoint = "/";
    root.fstype = "ext4";
    root.total_bytes = 1000;
    root.used_bytes = 250;
    monitor::DiskPartition home = root;
    home.mountpoint = "/home";
    home.used_bytes = 750;
    disk.partitions = {root, home};

    std::string report = reports::format_disk_report(disk);
    bool success = expect(contains(report, "Total"), "multiple partitions get a total row");
    success &= expect(contains(report, "50.0%"), "total usage is computed over all partitions");

    disk.partitions = {root};
    success &= expect(!contains(reports::format_disk_report(disk), "Total"), "single partition has no total row");

    disk.partitions.clear();
    std::string empty_report = reports::format_disk_report(disk);
    success &= expect(contains(empty_report, "No usable disk partitions") && ends_with_updated_line(empty_report),
                      "empty disk list is reported");
    return success;
}

static bool test_system_report_load_section() {
    monitor::SystemInfo system;
    system.hostname = "box";
    system.uptime_seconds = 3600;
    system.has_load = true;
    system.load.one_minute = 1.5;

    std::string with_load = reports::format_system_report(system, true);
    bool success = expect(contains(with_load, "1 min: 1.50"), "load averages are listed when requested");
    success &= expect(contains(with_load, "0 days 1 hours 0 minutes"), "uptime is formatted");
    success &= expect(!contains(reports::format_system_report(system, false), "Load Average"),
                      "load section is left out when not requested");

    system.has_load = false;
    success &= expect(contains(reports::format_system_report(system, true), "not available"),
                      "missing load averages are called out");
    return success;
}

static bool test_network_report_connections() {
    monitor::NetworkInfo network;
    monitor::NetworkInterface eth0;
    eth0.name = "eth0";
    network.interfaces.push_back(eth0);
    network.connections.total = 1;
    network.connections.by_status["LISTEN"] = 1;
    network.connections.by_protocol["tcp"] = 1;

    bool success = expect(contains(reports::format_network_report(network, true), "LISTEN: 1"),
                          "connection summary is shown when requested");
    success &= expect(!contains(reports::format_network_report(network, false), "Connections"),
                      "connection summary is hidden otherwise");
    return success;
}

bool run_all_tests() {
    bool all_passed = true;
    all_passed &= test_format_helpers();
    all_passed &= test_memory_report();
    all_passed &= test_disk_report_totals();
    all_passed &= test_system_report_load_section();
    all_passed &= test_network_report_connections();
    return all_passed;
}

} // namespace test_reports
