// sysmcps – System Monitor MCP Server
// Entry point: stdio MCP server loop.
//
// Reads JSON-RPC 2.0 messages from stdin, dispatches them, writes responses to stdout.
// Logs go to stderr; stdout carries only protocol lines.

#include "config/server_config.hpp"
#include "mcp/mcp_stdio.hpp"
#include "server/server.hpp"
#include "server/shutdown_signals.hpp"
#include "storage/json_store.hpp"
#include "storage/ttl_cache.hpp"
#include "utils/debug_log.hpp"

#include <iostream>
#include <string>
#include <vector>

int main(int argc, char *argv[]) {
    std::vector<std::string> arguments(argv + 1, argv + argc);
    std::string program_name = argc > 0 ? argv[0] : "sysmcps";

    server_config::ConfigParseResult parse_result = server_config::parse_arguments(arguments);
    if (!parse_result.success) {
        std::cerr << parse_result.error_detail << "\n"
                  << "Run '" << program_name << " --help' for usage." << std::endl;
        return 2;
    }

    const server_config::ServerConfig &config = parse_result.config;
    if (parse_result.action == server_config::StartupAction::ShowHelp) {
        std::cout << server_config::usage_text(program_name, config);
        return 0;
    }
    if (parse_result.action == server_config::StartupAction::ShowVersion) {
        std::cout << server_config::version_text(config) << std::endl;
        return 0;
    }

    std::cerr << "[sysmcps] " << config.server_name << " v" << config.server_version
              << " – System Monitor MCP Server, build " << __DATE__ << " " << __TIME__ << std::endl;

    storage::JsonStore store(config.data_dir);
    storage::StoreResult open_result = store.open();
    if (!open_result.success) {
        mcp_stdio::log_message("Failed to initialize data directory: " + open_result.error_detail);
        return 1;
    }
    debug_log::log("Data directory: " + store.data_directory());

    storage::TtlCache cache;
    debug_log::log(std::string("Result cache ") + (config.cache_enabled ? "enabled" : "disabled"));

    server::Server server(config, cache, store);
    shutdown_signals::InstallResult signal_result = shutdown_signals::install(server.stop_flag());
    if (!signal_result.success) {
        mcp_stdio::log_message("Failed to install signal handlers: " + signal_result.error_detail);
        cache.shutdown();
        return 1;
    }

    mcp_stdio::LoopResult loop_result = server.start(std::cin, std::cout);

    shutdown_signals::clear();
    debug_log::log("Lines read: " + std::to_string(loop_result.lines_read) +
                   ", responses written: " + std::to_string(loop_result.responses_written));
    debug_log::log("Cache at shutdown: " + server.cache_stats().dump());
    cache.shutdown();

    if (!loop_result.success) {
        mcp_stdio::log_message("Message loop failed: " + loop_result.error_detail);
        return 1;
    }

    mcp_stdio::log_message(loop_result.stopped_by_request ? "Shutdown requested. Server stopped."
                                                          : "EOF on stdin. Server stopped.");
    return 0;
}
