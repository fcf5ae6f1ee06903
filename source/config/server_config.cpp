#include "config/server_config.hpp"

#include <sstream>

namespace server_config {

namespace {

ConfigParseResult parse_failure(const std::string &error_detail) {
    ConfigParseResult result;
    result.success = false;
    result.error_detail = error_detail;
    return result;
}

// Accepted spellings of a boolean flag value.
bool parse_bool_value(const std::string &text, bool &value) {
    if (text == "true" || text == "1" || text == "t" || text == "TRUE" || text == "True") {
        value = true;
        return true;
    }
    if (text == "false" || text == "0" || text == "f" || text == "FALSE" || text == "False") {
        value = false;
        return true;
    }
    return false;
}

} // namespace

ConfigParseResult parse_arguments(const std::vector<std::string> &arguments) {
    ConfigParseResult result;
    result.success = true;

    for (std::size_t index = 0; index < arguments.size(); ++index) {
        const std::string &argument = arguments[index];

        if (argument.size() < 2 || argument[0] != '-') {
            return parse_failure("unexpected argument: " + argument);
        }

        std::string flag_name = argument.substr(argument[1] == '-' ? 2 : 1);
        std::string inline_value;
        bool has_inline_value = false;
        std::size_t equals_position = flag_name.find('=');
        if (equals_position != std::string::npos) {
            inline_value = flag_name.substr(equals_position + 1);
            flag_name = flag_name.substr(0, equals_position);
            has_inline_value = true;
        }

        if (flag_name == "help" || flag_name == "h") {
            result.action = StartupAction::ShowHelp;
            continue;
        }
        if (flag_name == "v") {
            if (result.action == StartupAction::Run) {
                result.action = StartupAction::ShowVersion;
            }
            continue;
        }

        if (flag_name == "cache") {
            // Bare --cache enables the cache; a value must be attached with '='
            // or be a recognizable boolean in the next argument.
            std::string value_text = inline_value;
            if (!has_inline_value) {
                if (index + 1 < arguments.size() && parse_bool_value(arguments[index + 1], result.config.cache_enabled)) {
                    ++index;
                } else {
                    result.config.cache_enabled = true;
                }
                continue;
            }
            if (!parse_bool_value(value_text, result.config.cache_enabled)) {
                return parse_failure("invalid boolean value \"" + value_text + "\" for flag --cache");
            }
            continue;
        }

        std::string *target = nullptr;
        if (flag_name == "name") {
            target = &result.config.server_name;
        } else if (flag_name == "version") {
            target = &result.config.server_version;
        } else if (flag_name == "data-dir") {
            target = &result.config.data_dir;
        } else {
            return parse_failure("flag provided but not defined: -" + flag_name);
        }

        if (has_inline_value) {
            *target = inline_value;
        } else if (index + 1 < arguments.size()) {
            *target = arguments[++index];
        } else {
            return parse_failure("flag needs an argument: -" + flag_name);
        }
    }

    return result;
}

std::string usage_text(const std::string &program_name, const ServerConfig &config) {
    std::ostringstream usage;
    usage << "System monitor MCP server v" << config.server_version << "\n\n";
    usage << "Runs with no arguments; speaks MCP JSON-RPC over stdin/stdout.\n\n";
    usage << "Usage:\n";
    usage << "  " << program_name << "                     # start with defaults\n";
    usage << "  " << program_name << " --name my-monitor   # custom server name\n\n";
    usage << "Options:\n";
    usage << "  --name <name>         server name reported to clients (default \"" << DEFAULT_SERVER_NAME << "\")\n";
    usage << "  --version <version>   server version reported to clients (default \"" << DEFAULT_SERVER_VERSION << "\")\n";
    usage << "  --data-dir <dir>      directory for saved monitor data (default \"" << DEFAULT_DATA_DIR << "\")\n";
    usage << "  --cache <true|false>  enable the result cache (default true)\n";
    usage << "  -v                    print name and version, then exit\n";
    usage << "  -h, --help            print this help, then exit\n\n";
    usage << "Monitoring tools:\n";
    usage << "  cpu_info         CPU usage and details\n";
    usage << "  memory_info      memory and swap usage\n";
    usage << "  top_processes    processes using the most CPU or memory\n";
    usage << "  network_stats    interface counters and connection summary\n";
    usage << "  disk_info        filesystem usage\n";
    usage << "  system_overview  host summary with load averages\n";
    usage << "\nSet SYSMCPS_DEBUG=1 for diagnostic output on stderr.\n";
    return usage.str();
}

std::string version_text(const ServerConfig &config) {
    return config.server_name + " v" + config.server_version;
}

} // namespace server_config
