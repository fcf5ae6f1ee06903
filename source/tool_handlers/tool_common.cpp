#include "tool_handlers/tool_common.hpp"

#include <cerrno>
#include <cstdlib>
#include <limits>

namespace tool_common {

std::string string_argument(const json &arguments, const std::string &name, const std::string &default_value) {
    if (!arguments.is_object()) {
        return default_value;
    }
    auto iterator = arguments.find(name);
    if (iterator == arguments.end() || !iterator->is_string()) {
        return default_value;
    }
    return iterator->get<std::string>();
}

bool is_true(const std::string &value) {
    return value == "true";
}

bool parse_duration_milliseconds(const std::string &text, int64_t &milliseconds) {
    // strtoll would also accept leading whitespace and a sign.
    if (text.empty() || text[0] < '0' || text[0] > '9') {
        return false;
    }

    errno = 0;
    char *end = nullptr;
    long long amount = std::strtoll(text.c_str(), &end, 10);
    if (errno != 0 || end == text.c_str() || amount <= 0) {
        return false;
    }

    int64_t unit_milliseconds = 0;
    std::string unit(end);
    if (unit == "ms") {
        unit_milliseconds = 1;
    } else if (unit == "s") {
        unit_milliseconds = 1000;
    } else if (unit == "m") {
        unit_milliseconds = 60 * 1000;
    } else {
        return false;
    }

    if (amount > std::numeric_limits<int64_t>::max() / unit_milliseconds) {
        return false;
    }
    milliseconds = static_cast<int64_t>(amount) * unit_milliseconds;
    return true;
}

} // namespace tool_common
