#include "tool_handlers/tool_handlers.hpp"
#include "tool_handlers/tool_common.hpp"
#include "monitor/reports.hpp"

#include <memory>

using json = nlohmann::json;

// Tool handler for "disk_info".

namespace {

class DiskInfoTool : public mcp_tools::Tool {
public:
    explicit DiskInfoTool(tool_common::ToolEnvironment &environment) : environment_(environment) {}

    std::string name() const override { return "disk_info"; }

    std::string description() const override {
        return "Report capacity and usage of mounted filesystems.";
    }

    json input_schema() const override {
        return mcp_tools::build_input_schema({
            {"show_all", "Include pseudo filesystems and system mount points", {"true", "false"}, "false"},
            {"use_cache", "Serve a recent cached result when available", {"true", "false"}, "false"},
        });
    }

    mcp_tools::ToolOutcome execute(const json &arguments) override {
        bool show_all = tool_common::is_true(tool_common::string_argument(arguments, "show_all", "false"));
        bool use_cache = tool_common::is_true(tool_common::string_argument(arguments, "use_cache", "false"));

        auto collected = tool_common::cached_collect<monitor::DiskInfo>(
            environment_, std::string("disk_info_") + (show_all ? "true" : "false"), use_cache,
            std::chrono::seconds(30), [show_all]() { return collectors::collect_disk(show_all); });
        if (!collected.success) {
            return mcp_tools::tool_failure("failed to collect disk information: " + collected.error_detail);
        }
        return mcp_tools::tool_success(reports::format_disk_report(collected.data));
    }

private:
    tool_common::ToolEnvironment &environment_;
};

} // namespace

namespace tool_disk_info {

void register_tool(mcp_tools::ToolRegistry &registry, tool_common::ToolEnvironment &environment) {
    registry.register_tool(std::make_unique<DiskInfoTool>(environment));
}

} // namespace tool_disk_info
