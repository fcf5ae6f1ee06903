#ifndef SYSMCPS_SERVER_CONFIG_HPP
#define SYSMCPS_SERVER_CONFIG_HPP

// Server configuration: built-in defaults overridden by command-line flags.

#include <string>
#include <vector>

namespace server_config {

constexpr const char *DEFAULT_SERVER_NAME = "sysmcps";
constexpr const char *DEFAULT_SERVER_VERSION = "1.0.0";
constexpr const char *DEFAULT_DATA_DIR = "data";

struct ServerConfig {
    std::string server_name = DEFAULT_SERVER_NAME;
    std::string server_version = DEFAULT_SERVER_VERSION;
    std::string data_dir = DEFAULT_DATA_DIR;
    bool cache_enabled = true;
};

enum class StartupAction {
    Run,
    ShowHelp,
    ShowVersion,
};

struct ConfigParseResult {
    bool success = false;
    StartupAction action = StartupAction::Run;
    ServerConfig config;
    std::string error_detail;
};

// Parse flags (program name excluded). Accepts "--flag value" and "--flag=value";
// a single leading dash is accepted as well.
ConfigParseResult parse_arguments(const std::vector<std::string> &arguments);

// Usage text for --help, including the list of monitoring tools.
std::string usage_text(const std::string &program_name, const ServerConfig &config);

// "<name> v<version>"
std::string version_text(const ServerConfig &config);

} // namespace server_config

#endif // SYSMCPS_SERVER_CONFIG_HPP
