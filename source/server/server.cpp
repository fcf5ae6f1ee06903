#include "server/server.hpp"
#include "tool_handlers/tool_handlers.hpp"
#include "utils/debug_log.hpp"

namespace server {

Server::Server(const server_config::ServerConfig &config, storage::TtlCache &cache, storage::JsonStore &store)
    : cache_(cache),
      store_(store),
      tool_environment_{cache, config.cache_enabled},
      dispatcher_(mcp_dispatch::ServerInfo{config.server_name, config.server_version}, registry_) {}

void Server::ensure_tools_registered() {
    std::call_once(tools_registered_, [this]() {
        tool_handlers::register_all_tools(registry_, tool_environment_);
        debug_log::log("Registered " + std::to_string(registry_.size()) + " tools");
    });
}

mcp_stdio::LoopResult Server::start(std::istream &input, std::ostream &output) {
    bool expected = false;
    if (!running_.compare_exchange_strong(expected, true)) {
        mcp_stdio::LoopResult result;
        result.success = false;
        result.error_detail = "server is already running";
        return result;
    }

    ensure_tools_registered();
    stop_requested_.store(false);

    mcp_stdio::log_message("Server started. Waiting for MCP messages on stdin.");
    mcp_stdio::LoopResult result = mcp_stdio::run_message_loop(input, output, dispatcher_, stop_requested_);

    running_.store(false);
    return result;
}

void Server::stop() {
    stop_requested_.store(true);
}

std::string Server::process_single_request(const std::string &line) {
    ensure_tools_registered();

    std::string response_line;
    if (!mcp_stdio::process_line(line, dispatcher_, response_line)) {
        return std::string();
    }
    return response_line;
}

storage::StoreResult Server::save_monitor_data(const std::string &key, const json &data) {
    storage::StoreResult result = store_.save(key, data);
    if (!result.success) {
        debug_log::log("Saving monitor data failed: " + result.error_detail);
    }
    return result;
}

storage::StoreLoadResult Server::load_monitor_data(const std::string &key) {
    return store_.load(key);
}

json Server::cache_stats() const {
    json stats;
    stats["size"] = cache_.size();
    stats["keys"] = cache_.keys();
    return stats;
}

json Server::storage_stats() const {
    json stats;
    stats["data_dir"] = store_.data_directory();

    storage::StoreKeysResult keys_result = store_.list_keys();
    if (!keys_result.success) {
        debug_log::log("Listing stored keys failed: " + keys_result.error_detail);
    }
    stats["keys"] = keys_result.keys;
    stats["count"] = keys_result.keys.size();
    return stats;
}

} // namespace server
