#include "tool_handlers/tool_handlers.hpp"
#include "tool_handlers/tool_common.hpp"
#include "monitor/reports.hpp"

#include <memory>

using json = nlohmann::json;

// Tool handler for "memory_info".

namespace {

class MemoryInfoTool : public mcp_tools::Tool {
public:
    explicit MemoryInfoTool(tool_common::ToolEnvironment &environment) : environment_(environment) {}

    std::string name() const override { return "memory_info"; }

    std::string description() const override {
        return "Report physical memory and swap usage.";
    }

    json input_schema() const override {
        return mcp_tools::build_input_schema({
            {"use_cache", "Serve a recent cached result when available", {"true", "false"}, "false"},
        });
    }

    mcp_tools::ToolOutcome execute(const json &arguments) override {
        bool use_cache = tool_common::is_true(tool_common::string_argument(arguments, "use_cache", "false"));

        auto collected = tool_common::cached_collect<monitor::MemoryInfo>(
            environment_, "memory_info", use_cache, std::chrono::seconds(15),
            []() { return collectors::collect_memory(); });
        if (!collected.success) {
            return mcp_tools::tool_failure("failed to collect memory information: " + collected.error_detail);
        }
        return mcp_tools::tool_success(reports::format_memory_report(collected.data));
    }

private:
    tool_common::ToolEnvironment &environment_;
};

} // namespace

namespace tool_memory_info {

void register_tool(mcp_tools::ToolRegistry &registry, tool_common::ToolEnvironment &environment) {
    registry.register_tool(std::make_unique<MemoryInfoTool>(environment));
}

} // namespace tool_memory_info
