#include "monitor/proc_parsers.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>

#include <algorithm>
#include <cctype>
#include <cstring>
#include <set>
#include <sstream>
#include <utility>

namespace proc_parsers {

namespace {

std::vector<std::string> split_whitespace(const std::string &line) {
    std::vector<std::string> tokens;
    std::istringstream token_stream(line);
    std::string token;
    while (token_stream >> token) {
        tokens.push_back(token);
    }
    return tokens;
}

std::string trim(const std::string &text) {
    size_t begin = 0;
    size_t end = text.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(text[begin]))) {
        begin++;
    }
    while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) {
        end--;
    }
    return text.substr(begin, end - begin);
}

// Digits only; anything else yields false.
bool parse_unsigned(const std::string &token, uint64_t &value) {
    if (token.empty()) {
        return false;
    }
    uint64_t result = 0;
    for (char character : token) {
        if (character < '0' || character > '9') {
            return false;
        }
        result = result * 10 + static_cast<uint64_t>(character - '0');
    }
    value = result;
    return true;
}

bool parse_hex(const std::string &token, uint32_t &value) {
    if (token.empty() || token.size() > 8) {
        return false;
    }
    uint32_t result = 0;
    for (char character : token) {
        int digit = 0;
        if (character >= '0' && character <= '9') {
            digit = character - '0';
        } else if (character >= 'a' && character <= 'f') {
            digit = character - 'a' + 10;
        } else if (character >= 'A' && character <= 'F') {
            digit = character - 'A' + 10;
        } else {
            return false;
        }
        result = (result << 4) | static_cast<uint32_t>(digit);
    }
    value = result;
    return true;
}

bool parse_cpu_times(const std::vector<std::string> &tokens, CpuTimes &times) {
    // tokens[0] is the "cpu"/"cpuN" label.
    uint64_t *fields[] = {&times.user, &times.nice, &times.system, &times.idle,
                          &times.iowait, &times.irq, &times.softirq, &times.steal};
    const size_t field_count = sizeof(fields) / sizeof(fields[0]);
    if (tokens.size() < 5) {
        return false;
    }
    for (size_t index = 0; index < field_count && index + 1 < tokens.size(); ++index) {
        if (!parse_unsigned(tokens[index + 1], *fields[index])) {
            return false;
        }
    }
    return true;
}

// "0100007F:0277" (IPv4) or 32 hex digits + port (IPv6), as written by the kernel.
bool decode_socket_address(const std::string &token, std::string &address, uint32_t &port) {
    size_t colon = token.find(':');
    if (colon == std::string::npos) {
        return false;
    }
    std::string host_hex = token.substr(0, colon);
    if (!parse_hex(token.substr(colon + 1), port)) {
        return false;
    }

    // Each 32-bit group is in host (little-endian) byte order.
    char buffer[INET6_ADDRSTRLEN] = {0};
    if (host_hex.size() == 8) {
        uint32_t word = 0;
        if (!parse_hex(host_hex, word)) {
            return false;
        }
        unsigned char bytes[4] = {
            static_cast<unsigned char>(word & 0xFFu),
            static_cast<unsigned char>((word >> 8) & 0xFFu),
            static_cast<unsigned char>((word >> 16) & 0xFFu),
            static_cast<unsigned char>((word >> 24) & 0xFFu),
        };
        struct in_addr ipv4_address;
        std::memcpy(&ipv4_address, bytes, sizeof(bytes));
        if (inet_ntop(AF_INET, &ipv4_address, buffer, sizeof(buffer)) == nullptr) {
            return false;
        }
    } else if (host_hex.size() == 32) {
        unsigned char bytes[16];
        for (size_t group = 0; group < 4; ++group) {
            uint32_t word = 0;
            if (!parse_hex(host_hex.substr(group * 8, 8), word)) {
                return false;
            }
            bytes[group * 4 + 0] = static_cast<unsigned char>(word & 0xFFu);
            bytes[group * 4 + 1] = static_cast<unsigned char>((word >> 8) & 0xFFu);
            bytes[group * 4 + 2] = static_cast<unsigned char>((word >> 16) & 0xFFu);
            bytes[group * 4 + 3] = static_cast<unsigned char>((word >> 24) & 0xFFu);
        }
        struct in6_addr ipv6_address;
        std::memcpy(&ipv6_address, bytes, sizeof(bytes));
        if (inet_ntop(AF_INET6, &ipv6_address, buffer, sizeof(buffer)) == nullptr) {
            return false;
        }
    } else {
        return false;
    }

    address = buffer;
    return true;
}

std::string decode_mount_field(const std::string &field) {
    std::string decoded;
    decoded.reserve(field.size());
    for (size_t index = 0; index < field.size(); ++index) {
        if (field[index] == '\\' && index + 3 < field.size() &&
            field[index + 1] >= '0' && field[index + 1] <= '7' &&
            field[index + 2] >= '0' && field[index + 2] <= '7' &&
            field[index + 3] >= '0' && field[index + 3] <= '7') {
            int value = (field[index + 1] - '0') * 64 + (field[index + 2] - '0') * 8 + (field[index + 3] - '0');
            decoded += static_cast<char>(value);
            index += 3;
        } else {
            decoded += field[index];
        }
    }
    return decoded;
}

double percent_of(uint64_t part, uint64_t whole) {
    if (whole == 0) {
        return 0.0;
    }
    return static_cast<double>(part) / static_cast<double>(whole) * 100.0;
}

} // namespace

bool parse_proc_stat(const std::string &text, CpuStatSnapshot &snapshot) {
    std::istringstream line_stream(text);
    std::string line;
    bool found_aggregate = false;

    while (std::getline(line_stream, line)) {
        std::vector<std::string> tokens = split_whitespace(line);
        if (tokens.empty()) {
            continue;
        }
        const std::string &label = tokens[0];
        if (label == "cpu") {
            found_aggregate = parse_cpu_times(tokens, snapshot.aggregate);
        } else if (label.size() > 3 && label.compare(0, 3, "cpu") == 0) {
            CpuTimes core_times;
            if (parse_cpu_times(tokens, core_times)) {
                snapshot.per_core.push_back(core_times);
            }
        } else if (label == "btime" && tokens.size() > 1) {
            uint64_t boot_time = 0;
            if (parse_unsigned(tokens[1], boot_time)) {
                snapshot.boot_time = static_cast<int64_t>(boot_time);
            }
        }
    }

    return found_aggregate;
}

double cpu_usage_percent(const CpuTimes &before, const CpuTimes &after) {
    uint64_t total_before = before.total();
    uint64_t total_after = after.total();
    if (total_after <= total_before) {
        return 0.0;
    }
    uint64_t total_delta = total_after - total_before;
    uint64_t idle_delta = after.idle_total() >= before.idle_total() ? after.idle_total() - before.idle_total() : 0;
    if (idle_delta > total_delta) {
        idle_delta = total_delta;
    }
    return percent_of(total_delta - idle_delta, total_delta);
}

CpuModel parse_cpuinfo(const std::string &text) {
    CpuModel model;
    std::istringstream line_stream(text);
    std::string line;
    std::set<std::pair<std::string, std::string>> physical_cores;
    std::string physical_id;
    int cores_field = 0;

    while (std::getline(line_stream, line)) {
        size_t colon = line.find(':');
        if (colon == std::string::npos) {
            continue;
        }
        std::string key = trim(line.substr(0, colon));
        std::string value = trim(line.substr(colon + 1));

        if (key == "model name" && model.model_name.empty()) {
            model.model_name = value;
        } else if (key == "cpu MHz" && model.mhz == 0.0) {
            std::istringstream value_stream(value);
            double mhz = 0.0;
            if (value_stream >> mhz) {
                model.mhz = mhz;
            }
        } else if (key == "physical id") {
            physical_id = value;
        } else if (key == "core id") {
            physical_cores.insert({physical_id, value});
        } else if (key == "cpu cores" && cores_field == 0) {
            uint64_t cores = 0;
            if (parse_unsigned(value, cores)) {
                cores_field = static_cast<int>(cores);
            }
        }
    }

    model.physical_cores = !physical_cores.empty() ? static_cast<int>(physical_cores.size()) : cores_field;
    return model;
}

std::map<std::string, uint64_t> parse_meminfo(const std::string &text) {
    std::map<std::string, uint64_t> fields;
    std::istringstream line_stream(text);
    std::string line;

    while (std::getline(line_stream, line)) {
        size_t colon = line.find(':');
        if (colon == std::string::npos) {
            continue;
        }
        std::vector<std::string> tokens = split_whitespace(line.substr(colon + 1));
        uint64_t value = 0;
        if (tokens.empty() || !parse_unsigned(tokens[0], value)) {
            continue;
        }
        if (tokens.size() > 1 && tokens[1] == "kB") {
            value *= 1024;
        }
        fields[line.substr(0, colon)] = value;
    }

    return fields;
}

monitor::MemoryInfo memory_from_meminfo(const std::map<std::string, uint64_t> &fields) {
    auto field = [&fields](const char *name) -> uint64_t {
        auto iterator = fields.find(name);
        return iterator == fields.end() ? 0 : iterator->second;
    };

    monitor::MemoryInfo memory;
    memory.total_bytes = field("MemTotal");
    memory.free_bytes = field("MemFree");
    memory.buffers_bytes = field("Buffers");
    memory.cached_bytes = field("Cached") + field("SReclaimable");

    if (fields.count("MemAvailable") != 0) {
        memory.available_bytes = field("MemAvailable");
    } else {
        memory.available_bytes = memory.free_bytes + memory.buffers_bytes + memory.cached_bytes;
    }

    uint64_t not_used = memory.free_bytes + memory.buffers_bytes + memory.cached_bytes;
    memory.used_bytes = memory.total_bytes > not_used ? memory.total_bytes - not_used : 0;
    memory.used_percent = percent_of(memory.used_bytes, memory.total_bytes);

    memory.swap.total_bytes = field("SwapTotal");
    memory.swap.free_bytes = field("SwapFree");
    memory.swap.used_bytes = memory.swap.total_bytes > memory.swap.free_bytes
                                 ? memory.swap.total_bytes - memory.swap.free_bytes
                                 : 0;
    memory.swap.used_percent = percent_of(memory.swap.used_bytes, memory.swap.total_bytes);

    return memory;
}

std::vector<monitor::NetworkInterface> parse_net_dev(const std::string &text) {
    std::vector<monitor::NetworkInterface> interfaces;
    std::istringstream line_stream(text);
    std::string line;

    while (std::getline(line_stream, line)) {
        // Header lines contain '|' and no counters.
        size_t colon = line.find(':');
        if (colon == std::string::npos || line.find('|') != std::string::npos) {
            continue;
        }
        std::vector<std::string> tokens = split_whitespace(line.substr(colon + 1));
        if (tokens.size() < 16) {
            continue;
        }
        uint64_t counters[16] = {0};
        bool valid = true;
        for (size_t index = 0; index < 16; ++index) {
            if (!parse_unsigned(tokens[index], counters[index])) {
                valid = false;
                break;
            }
        }
        if (!valid) {
            continue;
        }

        monitor::NetworkInterface network_interface;
        network_interface.name = trim(line.substr(0, colon));
        network_interface.bytes_recv = counters[0];
        network_interface.packets_recv = counters[1];
        network_interface.errors_in = counters[2];
        network_interface.drop_in = counters[3];
        network_interface.bytes_sent = counters[8];
        network_interface.packets_sent = counters[9];
        network_interface.errors_out = counters[10];
        network_interface.drop_out = counters[11];
        interfaces.push_back(network_interface);
    }

    return interfaces;
}

std::string tcp_state_name(const std::string &hex_state) {
    static const std::map<std::string, std::string> state_names = {
        {"01", "ESTABLISHED"}, {"02", "SYN_SENT"},   {"03", "SYN_RECV"}, {"04", "FIN_WAIT1"},
        {"05", "FIN_WAIT2"},   {"06", "TIME_WAIT"},  {"07", "CLOSE"},    {"08", "CLOSE_WAIT"},
        {"09", "LAST_ACK"},    {"0A", "LISTEN"},     {"0B", "CLOSING"},  {"0C", "NEW_SYN_RECV"},
    };
    std::string normalized = hex_state;
    std::transform(normalized.begin(), normalized.end(), normalized.begin(),
                   [](unsigned char character) { return static_cast<char>(std::toupper(character)); });
    auto iterator = state_names.find(normalized);
    return iterator == state_names.end() ? "UNKNOWN" : iterator->second;
}

std::vector<monitor::ConnectionDetail> parse_net_connections(const std::string &text, const std::string &protocol) {
    std::vector<monitor::ConnectionDetail> connections;
    std::istringstream line_stream(text);
    std::string line;
    bool is_tcp = protocol.compare(0, 3, "tcp") == 0;

    while (std::getline(line_stream, line)) {
        std::vector<std::string> tokens = split_whitespace(line);
        // Skip the header row ("sl local_address ...").
        if (tokens.size() < 4 || tokens[0] == "sl") {
            continue;
        }

        monitor::ConnectionDetail detail;
        detail.protocol = protocol;
        if (!decode_socket_address(tokens[1], detail.local_ip, detail.local_port) ||
            !decode_socket_address(tokens[2], detail.remote_ip, detail.remote_port)) {
            continue;
        }
        detail.status = is_tcp ? tcp_state_name(tokens[3]) : "NONE";
        connections.push_back(detail);
    }

    return connections;
}

std::vector<MountEntry> parse_mounts(const std::string &text) {
    std::vector<MountEntry> mounts;
    std::istringstream line_stream(text);
    std::string line;

    while (std::getline(line_stream, line)) {
        std::vector<std::string> tokens = split_whitespace(line);
        if (tokens.size() < 3) {
            continue;
        }
        mounts.push_back({decode_mount_field(tokens[0]), decode_mount_field(tokens[1]), tokens[2]});
    }

    return mounts;
}

bool parse_process_stat(const std::string &text, ProcessStat &stat) {
    size_t open_paren = text.find('(');
    size_t close_paren = text.rfind(')');
    if (open_paren == std::string::npos || close_paren == std::string::npos || close_paren < open_paren) {
        return false;
    }

    uint64_t pid = 0;
    if (!parse_unsigned(trim(text.substr(0, open_paren)), pid)) {
        return false;
    }

    // Fields after the command start at field 3 (state).
    std::vector<std::string> tokens = split_whitespace(text.substr(close_paren + 1));
    const size_t state_index = 0;
    const size_t utime_index = 14 - 3;
    const size_t stime_index = 15 - 3;
    const size_t start_time_index = 22 - 3;
    if (tokens.size() <= start_time_index || tokens[state_index].size() != 1) {
        return false;
    }

    ProcessStat parsed;
    parsed.pid = static_cast<int>(pid);
    parsed.comm = text.substr(open_paren + 1, close_paren - open_paren - 1);
    parsed.state = tokens[state_index][0];
    if (!parse_unsigned(tokens[utime_index], parsed.utime) ||
        !parse_unsigned(tokens[stime_index], parsed.stime) ||
        !parse_unsigned(tokens[start_time_index], parsed.start_time)) {
        return false;
    }

    stat = std::move(parsed);
    return true;
}

bool parse_statm_resident_pages(const std::string &text, uint64_t &resident_pages) {
    std::vector<std::string> tokens = split_whitespace(text);
    if (tokens.size() < 2) {
        return false;
    }
    return parse_unsigned(tokens[1], resident_pages);
}

std::string process_status_name(char state) {
    switch (state) {
        case 'R': return "running";
        case 'S': return "sleep";
        case 'D': return "disk-sleep";
        case 'Z': return "zombie";
        case 'T': return "stop";
        case 't': return "tracing-stop";
        case 'X':
        case 'x': return "dead";
        case 'I': return "idle";
        case 'W': return "paging";
        case 'P': return "parked";
        default: return "unknown";
    }
}

bool parse_loadavg(const std::string &text, monitor::LoadAverage &load) {
    std::istringstream value_stream(text);
    monitor::LoadAverage parsed;
    if (!(value_stream >> parsed.one_minute >> parsed.five_minutes >> parsed.fifteen_minutes)) {
        return false;
    }
    load = parsed;
    return true;
}

bool parse_uptime(const std::string &text, double &uptime_seconds) {
    std::istringstream value_stream(text);
    double parsed = 0.0;
    if (!(value_stream >> parsed) || parsed < 0.0) {
        return false;
    }
    uptime_seconds = parsed;
    return true;
}

std::string parse_os_release_id(const std::string &text) {
    std::istringstream line_stream(text);
    std::string line;
    while (std::getline(line_stream, line)) {
        if (line.compare(0, 3, "ID=") != 0) {
            continue;
        }
        std::string value = trim(line.substr(3));
        if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') && value.back() == value.front()) {
            value = value.substr(1, value.size() - 2);
        }
        return value;
    }
    return "";
}

} // namespace proc_parsers
