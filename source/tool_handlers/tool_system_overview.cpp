#include "tool_handlers/tool_handlers.hpp"
#include "tool_handlers/tool_common.hpp"
#include "monitor/reports.hpp"

#include <memory>

using json = nlohmann::json;

// Tool handler for "system_overview".
// Host identity, uptime, process count and load averages.

namespace {

class SystemOverviewTool : public mcp_tools::Tool {
public:
    explicit SystemOverviewTool(tool_common::ToolEnvironment &environment) : environment_(environment) {}

    std::string name() const override { return "system_overview"; }

    std::string description() const override {
        return "Summarize the host: hostname, OS, kernel, uptime, process count and load averages.";
    }

    json input_schema() const override {
        return mcp_tools::build_input_schema({
            {"include_load", "Include 1/5/15 minute load averages", {"true", "false"}, "true"},
            {"use_cache", "Serve a recent cached result when available", {"true", "false"}, "false"},
        });
    }

    mcp_tools::ToolOutcome execute(const json &arguments) override {
        // Anything other than an explicit "false" keeps the load section.
        bool include_load = tool_common::string_argument(arguments, "include_load", "true") != "false";
        bool use_cache = tool_common::is_true(tool_common::string_argument(arguments, "use_cache", "false"));

        auto collected = tool_common::cached_collect<monitor::SystemInfo>(
            environment_, std::string("system_overview_") + (include_load ? "true" : "false"), use_cache,
            std::chrono::seconds(60), [include_load]() { return collectors::collect_system(include_load); });
        if (!collected.success) {
            return mcp_tools::tool_failure("failed to collect system information: " + collected.error_detail);
        }
        return mcp_tools::tool_success(reports::format_system_report(collected.data, include_load));
    }

private:
    tool_common::ToolEnvironment &environment_;
};

} // namespace

namespace tool_system_overview {

void register_tool(mcp_tools::ToolRegistry &registry, tool_common::ToolEnvironment &environment) {
    registry.register_tool(std::make_unique<SystemOverviewTool>(environment));
}

} // namespace tool_system_overview
