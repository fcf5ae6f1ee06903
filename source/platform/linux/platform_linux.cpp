#include "platform/platform_abi.hpp"

#include <sys/statvfs.h>
#include <sys/utsname.h>
#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <chrono>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>
#include <thread>

namespace platform {

static const std::string PROC_ROOT = "/proc";

bool read_file_contents(const std::string &file_path, std::string &output_contents) {
    std::ifstream file_stream(file_path);
    if (!file_stream.is_open()) {
        return false;
    }
    std::ostringstream string_stream;
    string_stream << file_stream.rdbuf();
    if (file_stream.bad()) {
        return false;
    }
    output_contents = string_stream.str();
    return true;
}

FilesystemUsage filesystem_usage(const std::string &mountpoint) {
    FilesystemUsage usage;
    struct statvfs filesystem_stats;
    if (statvfs(mountpoint.c_str(), &filesystem_stats) != 0) {
        usage.error_detail = "statvfs(" + mountpoint + ") failed: " + std::string(strerror(errno));
        return usage;
    }

    uint64_t fragment_size = filesystem_stats.f_frsize != 0 ? filesystem_stats.f_frsize : filesystem_stats.f_bsize;
    usage.total_bytes = static_cast<uint64_t>(filesystem_stats.f_blocks) * fragment_size;
    usage.free_bytes = static_cast<uint64_t>(filesystem_stats.f_bavail) * fragment_size;
    usage.used_bytes = (static_cast<uint64_t>(filesystem_stats.f_blocks) -
                        static_cast<uint64_t>(filesystem_stats.f_bfree)) * fragment_size;

    // Same basis as df(1): blocks reserved for root are excluded.
    uint64_t usable_bytes = usage.used_bytes + usage.free_bytes;
    if (usable_bytes > 0) {
        usage.used_percent = static_cast<double>(usage.used_bytes) / static_cast<double>(usable_bytes) * 100.0;
    }
    usage.success = true;
    return usage;
}

HostIdentity host_identity() {
    HostIdentity identity;

    struct utsname kernel_name;
    if (uname(&kernel_name) != 0) {
        identity.error_detail = "uname failed: " + std::string(strerror(errno));
        return identity;
    }

    char hostname_buffer[256] = {0};
    if (gethostname(hostname_buffer, sizeof(hostname_buffer) - 1) == 0) {
        identity.hostname = hostname_buffer;
    } else {
        identity.hostname = kernel_name.nodename;
    }

    identity.os = kernel_name.sysname;
    std::transform(identity.os.begin(), identity.os.end(), identity.os.begin(),
                   [](unsigned char character) { return static_cast<char>(std::tolower(character)); });
    identity.kernel_version = kernel_name.release;
    identity.architecture = kernel_name.machine;
    identity.success = true;
    return identity;
}

std::vector<int> list_process_ids() {
    std::vector<int> process_ids;
    std::error_code error;
    std::filesystem::directory_iterator iterator(PROC_ROOT, error);
    if (error) {
        return process_ids;
    }

    for (; iterator != std::filesystem::directory_iterator(); iterator.increment(error)) {
        std::string entry_name = iterator->path().filename().string();
        if (entry_name.empty() ||
            !std::all_of(entry_name.begin(), entry_name.end(),
                         [](unsigned char character) { return std::isdigit(character) != 0; })) {
            continue;
        }
        process_ids.push_back(static_cast<int>(std::strtol(entry_name.c_str(), nullptr, 10)));
    }
    return process_ids;
}

std::string proc_path(const std::string &relative_path) {
    return PROC_ROOT + "/" + relative_path;
}

std::string proc_path(int process_id, const std::string &relative_path) {
    return PROC_ROOT + "/" + std::to_string(process_id) + "/" + relative_path;
}

long clock_ticks_per_second() {
    long ticks = sysconf(_SC_CLK_TCK);
    return ticks > 0 ? ticks : 100;
}

long page_size_bytes() {
    long page_size = sysconf(_SC_PAGESIZE);
    return page_size > 0 ? page_size : 4096;
}

int logical_cpu_count() {
    long online = sysconf(_SC_NPROCESSORS_ONLN);
    if (online > 0) {
        return static_cast<int>(online);
    }
    unsigned int hardware_threads = std::thread::hardware_concurrency();
    return hardware_threads > 0 ? static_cast<int>(hardware_threads) : 1;
}

void sleep_milliseconds(int64_t milliseconds) {
    if (milliseconds > 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(milliseconds));
    }
}

int64_t current_unix_time() {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

} // namespace platform
