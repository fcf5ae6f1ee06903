#ifndef SYSMCPS_SERVER_HPP
#define SYSMCPS_SERVER_HPP

// Server assembly: owns the tool registry and dispatcher, borrows the cache
// and the store, and runs the stdio message loop.

#include "config/server_config.hpp"
#include "mcp/mcp_dispatch.hpp"
#include "mcp/mcp_stdio.hpp"
#include "mcp/mcp_tools.hpp"
#include "storage/json_store.hpp"
#include "storage/ttl_cache.hpp"
#include "tool_handlers/tool_common.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <iosfwd>
#include <mutex>
#include <string>

namespace server {

using json = nlohmann::json;

class Server {
public:
    // cache and store must outlive the server.
    Server(const server_config::ServerConfig &config, storage::TtlCache &cache, storage::JsonStore &store);

    Server(const Server &) = delete;
    Server &operator=(const Server &) = delete;

    // Register the tools and serve input until end of input, stop() or a read
    // failure. Fails immediately with "server is already running" while another
    // start() is in progress.
    mcp_stdio::LoopResult start(std::istream &input, std::ostream &output);

    // Ask a running loop to return after the current message.
    void stop();

    bool is_running() const { return running_.load(); }

    // Set by stop(); exposed so a signal handler can request shutdown.
    std::atomic<bool> &stop_flag() { return stop_requested_; }

    // Answer one raw input line outside the loop. Empty when no response is due.
    std::string process_single_request(const std::string &line);

    storage::StoreResult save_monitor_data(const std::string &key, const json &data);
    storage::StoreLoadResult load_monitor_data(const std::string &key);

    // {"size": n, "keys": [...]}
    json cache_stats() const;

    // {"data_dir": "...", "keys": [...], "count": n}
    json storage_stats() const;

    const mcp_tools::ToolRegistry &registry() const { return registry_; }

private:
    void ensure_tools_registered();

    storage::TtlCache &cache_;
    storage::JsonStore &store_;
    tool_common::ToolEnvironment tool_environment_;
    mcp_tools::ToolRegistry registry_;
    mcp_dispatch::Dispatcher dispatcher_;

    std::once_flag tools_registered_;
    std::atomic<bool> running_{false};
    std::atomic<bool> stop_requested_{false};
};

} // namespace server

#endif // SYSMCPS_SERVER_HPP
