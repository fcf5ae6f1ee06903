#include "tool_handlers/tool_handlers.hpp"
#include "tool_handlers/tool_common.hpp"
#include "monitor/reports.hpp"

#include <memory>

using json = nlohmann::json;

// Tool handler for "network_stats".
// Interface counters from /proc/net/dev, optionally with a socket summary.

namespace {

class NetworkStatsTool : public mcp_tools::Tool {
public:
    explicit NetworkStatsTool(tool_common::ToolEnvironment &environment) : environment_(environment) {}

    std::string name() const override { return "network_stats"; }

    std::string description() const override {
        return "Report per-interface traffic counters and, optionally, a summary of open connections.";
    }

    json input_schema() const override {
        return mcp_tools::build_input_schema({
            {"show_connections", "Include a connection summary", {"true", "false"}, "false"},
            {"interface_filter", "Only report this interface (e.g. eth0)", {}, ""},
            {"use_cache", "Serve a recent cached result when available", {"true", "false"}, "false"},
        });
    }

    mcp_tools::ToolOutcome execute(const json &arguments) override {
        bool show_connections =
            tool_common::is_true(tool_common::string_argument(arguments, "show_connections", "false"));
        std::string interface_filter = tool_common::string_argument(arguments, "interface_filter", "");
        bool use_cache = tool_common::is_true(tool_common::string_argument(arguments, "use_cache", "false"));

        std::string key = std::string("network_stats_") + (show_connections ? "true" : "false") + "_" + interface_filter;

        auto collected = tool_common::cached_collect<monitor::NetworkInfo>(
            environment_, key, use_cache, std::chrono::seconds(10),
            [show_connections, &interface_filter]() {
                return collectors::collect_network(show_connections, interface_filter);
            });
        if (!collected.success) {
            return mcp_tools::tool_failure("failed to collect network statistics: " + collected.error_detail);
        }
        return mcp_tools::tool_success(reports::format_network_report(collected.data, show_connections));
    }

private:
    tool_common::ToolEnvironment &environment_;
};

} // namespace

namespace tool_network_stats {

void register_tool(mcp_tools::ToolRegistry &registry, tool_common::ToolEnvironment &environment) {
    registry.register_tool(std::make_unique<NetworkStatsTool>(environment));
}

} // namespace tool_network_stats
